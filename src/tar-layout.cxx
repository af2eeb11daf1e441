#include <resumable-tar-upload/errors.hxx>
#include <resumable-tar-upload/tar-layout.hxx>

namespace resumable_tar_upload {

TarLayout plan_layout(const std::vector<TarEntry> &entries) {
  for (const auto &entry : entries)
    if (!is_safe_entry_name(entry.name))
      throw InvalidEntryError("unsafe name '" + entry.name + "'");

  TarLayout layout;
  layout.entries.reserve(entries.size());
  std::uint64_t cursor = 0;

  for (const auto &entry : entries) {
    LayoutEntry out;
    out.content_size = content_size(entry);
    out.header = encode_header(entry.name, out.content_size,
                               entry.mtime_seconds);
    out.header_start = cursor;
    out.content_start = cursor + block_size;
    out.padding_size = padding_for(out.content_size);
    out.total_size = block_size + out.content_size + out.padding_size;
    cursor += out.total_size;
    layout.entries.push_back(out);
  }

  layout.total_size = cursor + end_marker_size;
  return layout;
}

std::uint64_t compute_total_size(const std::vector<TarEntry> &entries) noexcept {
  std::uint64_t total = 0;
  for (const auto &entry : entries) {
    const auto size = content_size(entry);
    total += block_size + size + padding_for(size);
  }
  return total + end_marker_size;
}
} // namespace resumable_tar_upload
