#pragma once

#include <resumable-tar-upload/tar-entry.hxx>
#include <resumable-tar-upload/tar-layout.hxx>

#include <boost/iostreams/device/file.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace resumable_tar_upload::detail {
/**
 * @brief Entries together with the layout derived from them.
 *
 * Shared read-only between a TarStream and every cursor created from it, so
 * cursors stay valid when the stream object goes away.
 */
struct TarPlan {
  std::vector<TarEntry> entries;
  TarLayout layout;
};

/**
 * @class TarCursor
 * @brief Single-pass read position inside a planned archive.
 *
 * This class implements a small state machine that emits, in order, each
 * entry's header, its content and its padding, followed by the end marker.
 * It can be placed at any byte offset of the archive without producing the
 * bytes before it. File-backed content is opened on first use and released
 * as soon as its bytes are exhausted or the cursor is destroyed.
 */
class TarCursor {
public:
  /** @enum State Emission phases of the state machine. */
  enum class State { Header, Content, Padding, End, Done };

  /**
   * @brief Place a cursor at @p start_offset of the archive described by
   * @p plan.
   *
   * Offsets at or beyond the total size leave the cursor in State::Done.
   */
  TarCursor(std::shared_ptr<const TarPlan> plan, std::uint64_t start_offset);

  TarCursor(const TarCursor &) = delete;
  TarCursor &operator=(const TarCursor &) = delete;

  /**
   * @brief Copy up to @p max_bytes archive bytes into @p dest.
   *
   * Each call serves at most one phase. The return value is 0 only when the
   * archive is exhausted or @p max_bytes is 0.
   *
   * @return std::size_t Number of bytes written to @p dest.
   * @throws SourceIoError if a file-backed entry cannot be opened or read.
   * @throws SourceChangedError if a file no longer has its declared size.
   */
  std::size_t read(char *dest, std::size_t max_bytes);

  /// Absolute archive offset of the next byte to be produced.
  std::uint64_t position() const noexcept { return position_; }
  /// Current phase.
  State state() const noexcept { return state_; }
  /// Whether a file handle is currently held.
  bool has_open_file() const noexcept { return file_.has_value(); }
  /// Whether every archive byte has been produced.
  bool done() const noexcept { return state_ == State::Done; }

private:
  std::size_t read_content(char *dest, std::size_t max_bytes);
  std::size_t read_file(const FileSource &file, char *dest, std::size_t take);
  void enter_content();
  void enter_padding();
  void next_entry();

  std::shared_ptr<const TarPlan> plan_;
  State state_ = State::Done;
  std::size_t entry_index_ = 0;
  std::uint64_t phase_offset_ = 0;
  std::uint64_t position_ = 0;
  std::optional<boost::iostreams::file_source> file_;
};
} // namespace resumable_tar_upload::detail
