#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace resumable_tar_upload {
/// Size of a tar block; headers are exactly one block.
inline constexpr std::size_t block_size = 512;

/// Encoded header block.
using HeaderBlock = std::array<char, block_size>;

/**
 * @brief Encode the ustar header of a regular file entry.
 *
 * Name is NUL-padded into the 100-byte field; mode is 0644 and owner/group
 * are zero; size and mtime are written as 11 octal digits plus NUL; the
 * checksum is 6 octal digits followed by NUL and a space. The output depends
 * only on the arguments.
 *
 * @param name Entry name, at most 100 bytes.
 * @param content_size Payload size in bytes.
 * @param mtime_seconds Unix modification time; negative values clamp to 0.
 * @return HeaderBlock The rendered 512-byte header.
 * @throws InvalidEntryError when the name is too long or a numeric field does
 * not fit its octal width.
 */
HeaderBlock encode_header(std::string_view name, std::uint64_t content_size,
                          std::int64_t mtime_seconds);

/**
 * @brief Recompute the checksum of a header block.
 *
 * Sums all bytes as unsigned values while treating the checksum field as
 * eight ASCII spaces, as the ustar format requires.
 */
std::uint32_t header_checksum(const HeaderBlock &block) noexcept;
} // namespace resumable_tar_upload
