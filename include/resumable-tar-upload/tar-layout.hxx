#pragma once

#include <resumable-tar-upload/header-codec.hxx>
#include <resumable-tar-upload/tar-entry.hxx>

#include <cstdint>
#include <vector>

namespace resumable_tar_upload {
/// Size of the zero-filled region that terminates every archive.
inline constexpr std::uint64_t end_marker_size = 2 * block_size;

/**
 * @brief Byte layout of one entry inside the archive.
 */
struct LayoutEntry {
  HeaderBlock header;
  std::uint64_t header_start = 0;
  std::uint64_t content_start = 0;
  std::uint64_t content_size = 0;
  std::uint64_t padding_size = 0;
  std::uint64_t total_size = 0;
};

/**
 * @brief Full archive layout: one LayoutEntry per input entry plus the end
 * marker, accounted for in total_size.
 */
struct TarLayout {
  std::vector<LayoutEntry> entries;
  std::uint64_t total_size = 0;
};

/**
 * @brief Number of zero bytes that pad @p size up to a block boundary.
 */
constexpr std::uint64_t padding_for(std::uint64_t size) noexcept {
  return (block_size - (size % block_size)) % block_size;
}

/**
 * @brief Compute header offsets, content offsets and padding of every entry.
 *
 * All entry names are validated before any offset is computed.
 *
 * @throws InvalidEntryError on the first invalid entry.
 */
TarLayout plan_layout(const std::vector<TarEntry> &entries);

/**
 * @brief Total archive size in bytes, including the end marker.
 *
 * Size-only walk over the declared entry sizes; agrees with
 * plan_layout(entries).total_size.
 */
std::uint64_t compute_total_size(const std::vector<TarEntry> &entries) noexcept;
} // namespace resumable_tar_upload
