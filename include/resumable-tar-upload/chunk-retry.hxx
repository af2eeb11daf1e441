/**
 * @file chunk-retry.hxx
 * @brief Bounded retry with exponential backoff around a single chunk append.
 */

#pragma once

#include <resumable-tar-upload/upload-client.hxx>

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace resumable_tar_upload {
/**
 * @brief Attempt ceiling and backoff curve.
 */
struct RetryPolicy {
  int max_attempts = 5;
  std::chrono::milliseconds base_delay{1000};
  std::chrono::milliseconds max_delay{10000};

  /**
   * @brief Delay after failed attempt @p attempt (1-based).
   *
   * @return min(base_delay * 2^(attempt - 1), max_delay)
   */
  std::chrono::milliseconds delay_for(int attempt) const noexcept;
};

/// Waits for the given duration between attempts.
using Sleeper = std::function<void(std::chrono::milliseconds)>;

/// Sleeper that blocks the calling thread.
Sleeper default_sleeper();

/**
 * @brief Append @p chunk at @p offset, retrying transient failures.
 *
 * An offset conflict (409) is answered by querying the authoritative offset,
 * which is returned as is; it does not count as a failed attempt. Statuses
 * 400, 401, 403, 404, 410 and 413 are rethrown at once. Other status errors,
 * transport errors and successful responses without a usable Upload-Offset
 * are retried up to RetryPolicy::max_attempts times, the last one propagating.
 *
 * @return std::uint64_t The offset the server now holds.
 */
std::uint64_t append_chunk_with_retry(UploadClient &client,
                                      const std::string &upload_id,
                                      std::uint64_t offset,
                                      const std::vector<char> &chunk,
                                      const RetryPolicy &policy,
                                      const Sleeper &sleeper);
} // namespace resumable_tar_upload
