#include <resumable-tar-upload/tar-stream.hxx>

#include <algorithm>
#include <utility>

namespace resumable_tar_upload {

TarChunkReader::TarChunkReader(std::shared_ptr<const detail::TarPlan> plan,
                               std::uint64_t start_offset,
                               std::size_t chunk_size)
    : cursor_(std::make_unique<detail::TarCursor>(std::move(plan),
                                                  start_offset)),
      chunk_size_(std::max<std::size_t>(1, chunk_size)) {}

bool TarChunkReader::next(std::vector<char> &chunk) {
  chunk.resize(chunk_size_);
  std::size_t filled = 0;
  int empty_reads = 0;

  while (filled < chunk_size_ && !cursor_->done()) {
    const auto got = cursor_->read(chunk.data() + filled, chunk_size_ - filled);
    if (got == 0) {
      if (++empty_reads > max_empty_reads)
        break;
      continue;
    }
    empty_reads = 0;
    filled += got;
  }

  chunk.resize(filled);
  return filled > 0;
}

TarSource::TarSource(std::shared_ptr<const detail::TarPlan> plan,
                     std::uint64_t start_offset)
    : cursor_(std::make_shared<detail::TarCursor>(std::move(plan),
                                                  start_offset)) {}

std::streamsize TarSource::read(char_type *s, std::streamsize n) {
  std::streamsize total = 0;
  while (total < n && !cursor_->done()) {
    const auto got =
        cursor_->read(s + total, static_cast<std::size_t>(n - total));
    if (got == 0)
      break;
    total += static_cast<std::streamsize>(got);
  }
  return total == 0 && n > 0 ? -1 : total;
}

TarStream::TarStream(std::vector<TarEntry> entries) {
  auto plan = std::make_shared<detail::TarPlan>();
  plan->layout = plan_layout(entries);
  plan->entries = std::move(entries);
  plan_ = std::move(plan);
}

std::uint64_t TarStream::size_bytes() const noexcept {
  return plan_->layout.total_size;
}

const TarLayout &TarStream::layout() const noexcept { return plan_->layout; }

TarChunkReader TarStream::chunks(std::uint64_t start_offset,
                                 std::size_t chunk_size) const {
  return TarChunkReader(plan_, start_offset, chunk_size);
}

TarSource TarStream::source(std::uint64_t start_offset) const {
  return TarSource(plan_, start_offset);
}
} // namespace resumable_tar_upload
