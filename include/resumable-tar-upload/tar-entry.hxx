#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace resumable_tar_upload {
/**
 * @brief Inline payload held in memory.
 */
struct BufferSource {
  std::vector<char> bytes;
};

/**
 * @brief Payload read lazily from a file on disk.
 *
 * The size is declared up front so the archive layout can be computed without
 * touching the file.
 */
struct FileSource {
  std::string path;
  std::uint64_t size_bytes = 0;
};

/**
 * @brief One named payload placed into the archive.
 *
 * Entries are archived in the order they appear in the vector handed to
 * TarStream.
 */
struct TarEntry {
  std::string name;
  std::variant<BufferSource, FileSource> source;
  std::int64_t mtime_seconds = 0;
};

/**
 * @brief Size of the payload of an entry, as declared.
 */
std::uint64_t content_size(const TarEntry &entry) noexcept;

/**
 * @brief Check whether a name is safe for the simple ustar header form.
 *
 * Accepted names are basenames of at most 100 bytes drawn from
 * `[A-Za-z0-9._-]`.
 */
bool is_safe_entry_name(std::string_view name) noexcept;

/**
 * @brief Build an entry backed by an in-memory copy of @p text.
 */
TarEntry make_buffer_entry(std::string name, std::string_view text,
                           std::int64_t mtime_seconds);
} // namespace resumable_tar_upload
