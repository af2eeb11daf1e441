#include <resumable-tar-upload/detail/tar-cursor.hxx>
#include <resumable-tar-upload/errors.hxx>

#include <boost/iostreams/positioning.hpp>

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>

namespace resumable_tar_upload::detail {

/**
 * @brief Seek directly into the phase that owns @p start_offset.
 *
 * A single linear scan over the cumulative entry sizes finds the owning
 * entry; the remainder selects header, content or padding and the offset
 * inside it.
 */
TarCursor::TarCursor(std::shared_ptr<const TarPlan> plan,
                     std::uint64_t start_offset)
    : plan_(std::move(plan)), position_(start_offset) {
  const auto &layout = plan_->layout;
  if (start_offset >= layout.total_size) {
    state_ = State::Done;
    position_ = layout.total_size;
    return;
  }

  std::uint64_t cursor = 0;
  for (std::size_t i = 0; i < layout.entries.size(); ++i) {
    const auto &entry = layout.entries[i];
    const auto next = cursor + entry.total_size;
    if (start_offset < next) {
      entry_index_ = i;
      auto rel = start_offset - cursor;
      if (rel < block_size) {
        state_ = State::Header;
        phase_offset_ = rel;
        return;
      }
      rel -= block_size;
      if (rel < entry.content_size) {
        state_ = State::Content;
        phase_offset_ = rel;
        return;
      }
      state_ = State::Padding;
      phase_offset_ = rel - entry.content_size;
      return;
    }
    cursor = next;
  }

  entry_index_ = layout.entries.size();
  state_ = State::End;
  phase_offset_ = start_offset - cursor;
}

std::size_t TarCursor::read(char *dest, std::size_t max_bytes) {
  if (max_bytes == 0)
    return 0;

  std::size_t produced = 0;
  switch (state_) {
  case State::Header: {
    const auto &header = plan_->layout.entries[entry_index_].header;
    produced = static_cast<std::size_t>(
        std::min<std::uint64_t>(max_bytes, block_size - phase_offset_));
    std::memcpy(dest, header.data() + phase_offset_, produced);
    phase_offset_ += produced;
    if (phase_offset_ == block_size)
      enter_content();
    break;
  }

  case State::Content:
    produced = read_content(dest, max_bytes);
    break;

  case State::Padding: {
    const auto padding = plan_->layout.entries[entry_index_].padding_size;
    produced = static_cast<std::size_t>(
        std::min<std::uint64_t>(max_bytes, padding - phase_offset_));
    std::memset(dest, 0, produced);
    phase_offset_ += produced;
    if (phase_offset_ == padding)
      next_entry();
    break;
  }

  case State::End:
    produced = static_cast<std::size_t>(
        std::min<std::uint64_t>(max_bytes, end_marker_size - phase_offset_));
    std::memset(dest, 0, produced);
    phase_offset_ += produced;
    if (phase_offset_ == end_marker_size)
      state_ = State::Done;
    break;

  case State::Done:
    return 0;
  }

  position_ += produced;
  return produced;
}

std::size_t TarCursor::read_content(char *dest, std::size_t max_bytes) {
  const auto &entry = plan_->entries[entry_index_];
  const auto size = plan_->layout.entries[entry_index_].content_size;
  const auto take = static_cast<std::size_t>(
      std::min<std::uint64_t>(max_bytes, size - phase_offset_));

  std::size_t produced = 0;
  if (const auto *buffer = std::get_if<BufferSource>(&entry.source)) {
    std::memcpy(dest, buffer->bytes.data() + phase_offset_, take);
    produced = take;
  } else {
    produced = read_file(std::get<FileSource>(entry.source), dest, take);
  }

  phase_offset_ += produced;
  if (phase_offset_ == size) {
    file_.reset();
    enter_padding();
  }
  return produced;
}

/**
 * @brief Read the next slice of a file-backed entry, opening it on first use.
 *
 * The on-disk size is compared with the declared size once, when the handle
 * is opened. A read that ends early means the file shrank while streaming.
 */
std::size_t TarCursor::read_file(const FileSource &file, char *dest,
                                 std::size_t take) {
  if (!file_) {
    std::error_code ec;
    const auto actual = std::filesystem::file_size(file.path, ec);
    if (ec)
      throw SourceIoError("Cannot stat " + file.path + ": " + ec.message());
    if (actual != file.size_bytes)
      throw SourceChangedError("File " + file.path + " changed size: declared " +
                               std::to_string(file.size_bytes) + " bytes, found " +
                               std::to_string(actual));

    file_.emplace(file.path, std::ios_base::in | std::ios_base::binary);
    if (!file_->is_open()) {
      file_.reset();
      throw SourceIoError("Cannot open " + file.path);
    }
    if (phase_offset_ != 0 &&
        file_->seek(static_cast<boost::iostreams::stream_offset>(phase_offset_),
                    std::ios_base::beg) == std::streampos(-1)) {
      file_.reset();
      throw SourceIoError("Cannot seek " + file.path);
    }
  }

  const auto got = file_->read(dest, static_cast<std::streamsize>(take));
  if (got <= 0) {
    file_.reset();
    throw SourceChangedError("File " + file.path + " ended after " +
                             std::to_string(phase_offset_) + " of " +
                             std::to_string(file.size_bytes) + " bytes");
  }
  return static_cast<std::size_t>(got);
}

void TarCursor::enter_content() {
  state_ = State::Content;
  phase_offset_ = 0;
  if (plan_->layout.entries[entry_index_].content_size == 0)
    enter_padding();
}

void TarCursor::enter_padding() {
  state_ = State::Padding;
  phase_offset_ = 0;
  if (plan_->layout.entries[entry_index_].padding_size == 0)
    next_entry();
}

void TarCursor::next_entry() {
  ++entry_index_;
  phase_offset_ = 0;
  state_ = entry_index_ < plan_->layout.entries.size() ? State::Header
                                                        : State::End;
}
} // namespace resumable_tar_upload::detail
