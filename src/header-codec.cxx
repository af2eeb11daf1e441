#include <resumable-tar-upload/detail/tar-header.hxx>
#include <resumable-tar-upload/errors.hxx>
#include <resumable-tar-upload/header-codec.hxx>

#include <algorithm>
#include <cstring>
#include <string>

namespace resumable_tar_upload {
namespace {

/**
 * @brief Write an unsigned value as zero-padded octal ASCII followed by NUL.
 *
 * The field holds @p width - 1 digits. Values that need more digits cannot be
 * represented in the plain ustar encoding.
 *
 * @param field Pointer to the first byte of the header field.
 * @param width Field width in bytes, including the trailing NUL.
 * @param value Value to encode.
 * @param what Field name used in the error message.
 */
void write_octal_impl(char *field, std::size_t width, std::uint64_t value,
                      const char *what) {
  const auto digits = width - 1;
  if (digits < 22 && (value >> (3 * digits)) != 0)
    throw InvalidEntryError(std::string(what) + " " + std::to_string(value) +
                            " does not fit in " + std::to_string(digits) +
                            " octal digits");

  std::fill(field, field + digits, '0');
  for (auto i = digits; i > 0 && value != 0; --i) {
    field[i - 1] = static_cast<char>('0' + (value & 7));
    value >>= 3;
  }
  field[digits] = '\0';
}

} // unnamed namespace

HeaderBlock encode_header(std::string_view name, std::uint64_t content_size,
                          std::int64_t mtime_seconds) {
  detail::TarHeader tar;
  std::memset(&tar, 0, sizeof(tar));

  if (name.empty() || name.size() > sizeof(tar.name))
    throw InvalidEntryError("name must be 1 to " +
                            std::to_string(sizeof(tar.name)) + " bytes");
  std::memcpy(tar.name, name.data(), name.size());

  write_octal_impl(tar.mode, sizeof(tar.mode), 0644, "mode");
  write_octal_impl(tar.uid, sizeof(tar.uid), 0, "uid");
  write_octal_impl(tar.gid, sizeof(tar.gid), 0, "gid");
  write_octal_impl(tar.size, sizeof(tar.size), content_size, "size");
  write_octal_impl(tar.mtime, sizeof(tar.mtime),
                   static_cast<std::uint64_t>(std::max<std::int64_t>(
                       0, mtime_seconds)),
                   "mtime");
  tar.typeflag[0] = '0';
  std::memcpy(tar.magic, "ustar", 6);
  std::memcpy(tar.version, "00", 2);

  HeaderBlock block;
  std::memcpy(block.data(), &tar, block.size());

  // 6 octal digits, NUL, space.
  auto sum = header_checksum(block);
  auto *chksum = block.data() + detail::checksum_offset;
  write_octal_impl(chksum, 7, sum, "checksum");
  chksum[7] = ' ';
  return block;
}

std::uint32_t header_checksum(const HeaderBlock &block) noexcept {
  std::uint32_t sum = 0;
  for (std::size_t i = 0; i < block.size(); ++i) {
    if (i >= detail::checksum_offset &&
        i < detail::checksum_offset + detail::checksum_width)
      sum += static_cast<unsigned char>(' ');
    else
      sum += static_cast<unsigned char>(block[i]);
  }
  return sum;
}
} // namespace resumable_tar_upload
