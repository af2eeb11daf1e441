/**
 * @file tar-stream.hxx
 * @brief Lazily generated, resumable ustar archive over in-memory and on-disk
 * payloads.
 */

#pragma once

#include <resumable-tar-upload/detail/tar-cursor.hxx>

#include <boost/iostreams/categories.hpp>

#include <cstddef>
#include <cstdint>
#include <ios>
#include <memory>
#include <vector>

namespace resumable_tar_upload {
/**
 * @brief Pulls fixed-size chunks from a cursor until the archive ends.
 *
 * Obtained from TarStream::chunks(). The reader is single-pass: resuming from
 * another offset needs a new reader. Dropping the reader early releases any
 * file handle it holds.
 */
class TarChunkReader {
public:
  /// Consecutive empty cursor reads tolerated before the reader gives up.
  static constexpr int max_empty_reads = 50;

  TarChunkReader(std::shared_ptr<const detail::TarPlan> plan,
                 std::uint64_t start_offset, std::size_t chunk_size);

  /**
   * @brief Fill @p chunk with the next archive bytes.
   *
   * The chunk holds chunk_size bytes, or fewer when the archive ends first.
   *
   * @return true when @p chunk holds at least one byte.
   * @return false when no further bytes can be produced.
   */
  bool next(std::vector<char> &chunk);

  /// Archive offset of the next byte next() will produce.
  std::uint64_t position() const noexcept { return cursor_->position(); }
  /// Whether the reader currently holds an open file handle.
  bool has_open_file() const noexcept { return cursor_->has_open_file(); }

private:
  std::unique_ptr<detail::TarCursor> cursor_;
  std::size_t chunk_size_;
};

/**
 * @brief Boost.Iostreams Source device producing archive bytes.
 *
 * The device can be pushed onto a filtering_istream and read like any other
 * source. Copies share the same read position.
 *
 * @code{.cpp}
 * namespace io = boost::iostreams;
 *
 * resumable_tar_upload::TarStream tar(std::move(entries));
 * io::filtering_istream in;
 * in.push(tar.source());
 * std::string archive((std::istreambuf_iterator<char>(in)),
 *                     std::istreambuf_iterator<char>());
 * @endcode
 */
class TarSource {
public:
  using char_type = char;
  using category = boost::iostreams::source_tag;

  TarSource(std::shared_ptr<const detail::TarPlan> plan,
            std::uint64_t start_offset);

  /**
   * @brief Read up to @p n archive bytes.
   *
   * @return std::streamsize Number of bytes read, or -1 at end of archive.
   */
  std::streamsize read(char_type *s, std::streamsize n);

private:
  std::shared_ptr<detail::TarCursor> cursor_;
};

/**
 * @brief Uncompressed ustar archive described up front and produced on demand.
 *
 * Construction validates every entry and computes the complete byte layout;
 * file contents are only touched while bytes are being read. Any byte range
 * can be produced without generating the bytes before it, and producing from
 * offset o yields exactly the suffix of the full archive starting at o.
 */
class TarStream {
public:
  /**
   * @brief Plan the archive for @p entries, in order.
   *
   * @throws InvalidEntryError if any entry name is unsafe or any size cannot
   * be encoded.
   */
  explicit TarStream(std::vector<TarEntry> entries);

  /// Total archive size in bytes, end marker included.
  std::uint64_t size_bytes() const noexcept;

  /// The precomputed layout.
  const TarLayout &layout() const noexcept;

  /**
   * @brief Start a chunk reader at @p start_offset.
   *
   * A chunk size of 0 is treated as 1. Offsets at or past size_bytes() give
   * a reader that produces nothing.
   */
  TarChunkReader chunks(std::uint64_t start_offset,
                        std::size_t chunk_size) const;

  /**
   * @brief Start a Boost.Iostreams source at @p start_offset.
   */
  TarSource source(std::uint64_t start_offset = 0) const;

private:
  std::shared_ptr<const detail::TarPlan> plan_;
};
} // namespace resumable_tar_upload
