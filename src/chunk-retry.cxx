#include <resumable-tar-upload/chunk-retry.hxx>
#include <resumable-tar-upload/errors.hxx>

#include <boost/log/trivial.hpp>

#include <algorithm>
#include <thread>

namespace resumable_tar_upload {
namespace {

template <typename Error>
void log_retry_impl(const Error &e, int attempt, int max_attempts,
                    std::chrono::milliseconds delay) {
  BOOST_LOG_TRIVIAL(warning) << "Chunk upload attempt " << attempt << "/"
                             << max_attempts << " failed: " << e.what()
                             << "; retrying in " << delay.count() << " ms";
}

} // unnamed namespace

std::chrono::milliseconds RetryPolicy::delay_for(int attempt) const noexcept {
  auto delay = base_delay;
  for (int i = 1; i < attempt && delay < max_delay; ++i)
    delay *= 2;
  return std::min(delay, max_delay);
}

Sleeper default_sleeper() {
  return [](std::chrono::milliseconds delay) {
    std::this_thread::sleep_for(delay);
  };
}

std::uint64_t append_chunk_with_retry(UploadClient &client,
                                      const std::string &upload_id,
                                      std::uint64_t offset,
                                      const std::vector<char> &chunk,
                                      const RetryPolicy &policy,
                                      const Sleeper &sleeper) {
  const int max_attempts = std::max(1, policy.max_attempts);
  for (int attempt = 1;; ++attempt) {
    try {
      return client.append_chunk(upload_id, offset, chunk);
    } catch (const HttpStatusError &e) {
      if (e.is_conflict()) {
        const auto status = client.query_offset(upload_id);
        BOOST_LOG_TRIVIAL(info) << "Offset conflict at " << offset
                                << ", server holds " << status.offset;
        return status.offset;
      }
      if (!e.is_retryable() || attempt >= max_attempts)
        throw;
      const auto delay = policy.delay_for(attempt);
      log_retry_impl(e, attempt, max_attempts, delay);
      sleeper(delay);
    } catch (const TransportError &e) {
      if (attempt >= max_attempts)
        throw;
      const auto delay = policy.delay_for(attempt);
      log_retry_impl(e, attempt, max_attempts, delay);
      sleeper(delay);
    } catch (const ProtocolError &e) {
      // A repeated PATCH of a committed chunk is answered with a conflict.
      if (attempt >= max_attempts)
        throw;
      const auto delay = policy.delay_for(attempt);
      log_retry_impl(e, attempt, max_attempts, delay);
      sleeper(delay);
    }
  }
}
} // namespace resumable_tar_upload
