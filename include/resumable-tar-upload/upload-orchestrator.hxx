/**
 * @file upload-orchestrator.hxx
 * @brief Drives a complete resumable upload of one file or of an image set
 * packed into a tar archive.
 */

#pragma once

#include <resumable-tar-upload/chunk-retry.hxx>
#include <resumable-tar-upload/tar-entry.hxx>
#include <resumable-tar-upload/upload-client.hxx>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace resumable_tar_upload {
/// Content type of a manifest-first image archive.
inline constexpr const char *media_set_content_type =
    "application/vnd.enrivision.media-set+tar";
/// Name of the first entry of an image archive.
inline constexpr const char *media_set_manifest_name = "manifest.json";
/// Filename declared for the session of an image archive.
inline constexpr const char *media_set_filename = "enrivision-image-set.tar";

/// Receives the committed offset and the total size after each chunk.
using ProgressCallback =
    std::function<void(std::uint64_t offset, std::uint64_t total)>;

struct OrchestratorOptions {
  RetryPolicy retry;
  Sleeper sleeper = default_sleeper();
  /// Logs "upload N% (offset/total bytes)" when empty.
  ProgressCallback progress;
  /// Modification time stamped on archive entries; wall clock when empty.
  std::function<std::int64_t()> now_seconds;
};

/**
 * @brief One image placed into an image archive.
 */
struct ImageSetItem {
  int index = 0; ///< 1-based position in the set.
  std::string path;
  std::string filename;
  std::string content_type;
  std::uint64_t size_bytes = 0;
  std::string entry_name;
};

/**
 * @brief Archive name of the @p index-th image: six-digit index followed by
 * the lower-cased extension of @p filename, or ".img" when that extension
 * contains anything but `[a-z0-9.]`.
 */
std::string image_set_entry_name(int index, const std::string &filename);

/**
 * @brief Render the JSON manifest describing @p items.
 */
std::string build_image_set_manifest(const std::vector<ImageSetItem> &items);

/**
 * @brief Check that @p path is an existing, readable regular file.
 *
 * @return std::uint64_t The file size.
 * @throws SourceIoError otherwise.
 */
std::uint64_t assert_readable_file(const std::string &path);

/**
 * @brief Uploads local media through an UploadClient.
 *
 * Every upload starts from the offset the server reports for the new
 * session and follows the offsets the server returns after each chunk.
 */
class UploadOrchestrator {
public:
  UploadOrchestrator(UploadClient &client, OrchestratorOptions options = {});

  /**
   * @brief Upload @p paths: one path as a plain file, several as an image
   * archive.
   *
   * @return std::string The upload id of the completed session.
   * @throws InvalidInputError if @p paths is empty.
   */
  std::string upload(const std::vector<std::string> &paths,
                     const std::optional<std::string> &trace_id);

  /**
   * @brief Upload a single file as is.
   *
   * @throws SourceIoError if the file cannot be read.
   * @throws StalledUploadError if an append leaves the offset unchanged.
   * @throws IncompleteUploadError if the loop ends short of the file size.
   */
  std::string upload_file(const std::string &path,
                          const std::optional<std::string> &trace_id);

  /**
   * @brief Upload two or more images as one manifest-first tar archive.
   *
   * @throws InvalidInputError if fewer than two paths are given or any path
   * is not an image.
   * @throws StalledUploadError if a pass over the archive makes no progress.
   * @throws IncompleteUploadError if the loop ends short of the archive size.
   */
  std::string upload_image_set(const std::vector<std::string> &paths,
                               const std::optional<std::string> &trace_id);

private:
  std::uint64_t start_offset(const std::string &upload_id,
                             std::uint64_t total);
  std::uint64_t append(const std::string &upload_id, std::uint64_t offset,
                       const std::vector<char> &chunk, std::uint64_t total);
  void report(std::uint64_t offset, std::uint64_t total) const;
  std::int64_t now_seconds() const;

  UploadClient &client_;
  OrchestratorOptions options_;
};
} // namespace resumable_tar_upload
