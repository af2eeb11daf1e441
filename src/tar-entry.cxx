#include <resumable-tar-upload/tar-entry.hxx>

#include <algorithm>
#include <utility>

namespace resumable_tar_upload {
namespace {

bool is_name_char_impl(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
         (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
}

} // unnamed namespace

std::uint64_t content_size(const TarEntry &entry) noexcept {
  if (const auto *buffer = std::get_if<BufferSource>(&entry.source))
    return buffer->bytes.size();
  return std::get<FileSource>(entry.source).size_bytes;
}

bool is_safe_entry_name(std::string_view name) noexcept {
  if (name.empty() || name.size() > 100)
    return false;
  // Basenames only: separators, whitespace and NUL fall outside the set.
  return std::all_of(name.begin(), name.end(), is_name_char_impl);
}

TarEntry make_buffer_entry(std::string name, std::string_view text,
                           std::int64_t mtime_seconds) {
  return TarEntry{std::move(name),
                  BufferSource{std::vector<char>(text.begin(), text.end())},
                  mtime_seconds};
}
} // namespace resumable_tar_upload
