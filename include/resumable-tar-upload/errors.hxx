/**
 * @file errors.hxx
 * @brief Exception hierarchy used across the archive stream and the upload
 * client.
 */

#pragma once

#include <map>
#include <stdexcept>
#include <string>
#include <utility>

namespace resumable_tar_upload {
/**
 * @brief Root of every error raised by this library.
 */
class UploadError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief An archive entry cannot be encoded (bad name, size out of range).
 *
 * Raised while a TarStream is constructed, before any byte is produced.
 */
class InvalidEntryError : public UploadError {
public:
  explicit InvalidEntryError(const std::string &what)
      : UploadError("Invalid tar entry: " + what) {}
};

/**
 * @brief Caller supplied inputs that cannot be uploaded (no paths, relative
 * paths, non-image files in an image set, bad option values).
 */
class InvalidInputError : public UploadError {
public:
  using UploadError::UploadError;
};

/**
 * @brief A local file is missing, not a regular file, or unreadable.
 */
class SourceIoError : public UploadError {
public:
  using UploadError::UploadError;
};

/**
 * @brief A file-backed entry no longer has the size it was declared with.
 */
class SourceChangedError : public SourceIoError {
public:
  using SourceIoError::SourceIoError;
};

/**
 * @brief The request never produced an HTTP response (connect, TLS, I/O
 * failure or timeout).
 */
class TransportError : public UploadError {
public:
  using UploadError::UploadError;
};

/**
 * @brief The server answered with a non-2xx status.
 */
class HttpStatusError : public UploadError {
public:
  HttpStatusError(const std::string &what, int status,
                  std::map<std::string, std::string> headers, std::string body)
      : UploadError(what), status_(status), headers_(std::move(headers)),
        body_(std::move(body)) {}

  /// HTTP status code returned by the server.
  int status() const noexcept { return status_; }
  /// Response headers, keys lower-cased.
  const std::map<std::string, std::string> &headers() const noexcept {
    return headers_;
  }
  /// Response body, best effort.
  const std::string &body() const noexcept { return body_; }

  /// Offset mismatch: the caller should re-query the authoritative offset.
  bool is_conflict() const noexcept { return status_ == 409; }

  /**
   * @brief Whether repeating the same request may succeed.
   *
   * Malformed requests (400), authentication (401, 403), unknown sessions
   * (404), expired sessions (410) and oversized chunks (413) never do.
   * Conflicts are not retryable either; they are resynchronized instead.
   */
  bool is_retryable() const noexcept {
    switch (status_) {
    case 400:
    case 401:
    case 403:
    case 404:
    case 409:
    case 410:
    case 413:
      return false;
    default:
      return true;
    }
  }

private:
  int status_;
  std::map<std::string, std::string> headers_;
  std::string body_;
};

/**
 * @brief The server answered 2xx but the response does not follow the
 * protocol (missing header, unparsable JSON, offset out of range).
 */
class ProtocolError : public UploadError {
public:
  using UploadError::UploadError;
};

/**
 * @brief An upload pass made no offset progress.
 */
class StalledUploadError : public UploadError {
public:
  using UploadError::UploadError;
};

/**
 * @brief The upload loop ended with an offset different from the declared
 * total size.
 */
class IncompleteUploadError : public UploadError {
public:
  using UploadError::UploadError;
};
} // namespace resumable_tar_upload
