#pragma once

#include <cstddef>

namespace resumable_tar_upload::detail {
/**
 * @struct TarHeader
 * @brief Representation of a POSIX/USTAR TAR header block (512 bytes).
 *
 * The struct layout matches the on-disk TAR header format. The encoder fills
 * an instance in place and then copies it out as raw bytes.
 *
 * Note: The struct is packed to guarantee the exact 512-byte layout.
 */
struct __attribute__((packed)) TarHeader {
  char name[100];     /**< @brief File name, NUL-padded. */
  char mode[8];       /**< @brief File mode (octal ASCII). */
  char uid[8];        /**< @brief Owner user ID (octal ASCII). */
  char gid[8];        /**< @brief Owner group ID (octal ASCII). */
  char size[12];      /**< @brief File size (octal ASCII). */
  char mtime[12];     /**< @brief Modification time (octal ASCII). */
  char chksum[8];     /**< @brief Header checksum field (octal ASCII). */
  char typeflag[1];   /**< @brief Type flag, always '0' (regular file). */
  char linkname[100]; /**< @brief Unused, left zeroed. */
  char magic[6];      /**< @brief UStar magic ("ustar\0"). */
  char version[2];    /**< @brief UStar version ("00"). */
  char uname[32];     /**< @brief Unused, left zeroed. */
  char gname[32];     /**< @brief Unused, left zeroed. */
  char devmajor[8];   /**< @brief Unused, left zeroed. */
  char devminor[8];   /**< @brief Unused, left zeroed. */
  char prefix[155];   /**< @brief Unused, long names are not supported. */
  char padding[12];   /**< @brief Padding to make the header 512 bytes. */
};

static_assert(sizeof(TarHeader) == 512, "TarHeader must be 512 bytes");

/// Byte offset and width of the checksum field inside the header block.
inline constexpr std::size_t checksum_offset = 148;
inline constexpr std::size_t checksum_width = 8;
} // namespace resumable_tar_upload::detail
