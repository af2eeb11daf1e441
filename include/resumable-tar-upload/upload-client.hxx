/**
 * @file upload-client.hxx
 * @brief Client for the session-based resumable upload protocol and the
 * analysis endpoint.
 *
 * Endpoints:
 *  - POST  /v1/uploads           create a session
 *  - HEAD  /v1/uploads/{id}      query the committed offset
 *  - PATCH /v1/uploads/{id}      append a chunk at an offset
 *  - POST  /v1/vision/analyze    analyze a completed upload
 */

#pragma once

#include <resumable-tar-upload/http-transport.hxx>

#include <rapidjson/document.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace resumable_tar_upload {
/**
 * @brief Credentials and request timeout shared by every call.
 */
struct ClientConfig {
  std::string api_key; ///< Sent as a bearer token, never logged.
  std::chrono::milliseconds timeout{30 * 60 * 1000};
};

/**
 * @brief Parameters of a new upload session.
 */
struct CreateSessionRequest {
  std::string filename;
  std::uint64_t size_bytes = 0;
  std::string content_type;
  std::optional<std::string> client_trace_id;
};

/**
 * @brief Server-side upload session, as returned on creation.
 */
struct UploadSession {
  std::string upload_id;
  std::uint64_t chunk_size_bytes = 0; ///< Server-suggested chunk size.
  std::int64_t expires_at = 0;        ///< Milliseconds since the epoch.
};

/**
 * @brief Committed state of a session, as reported by an offset query.
 */
struct UploadStatus {
  std::uint64_t offset = 0;
  std::optional<std::uint64_t> length;
  std::optional<std::int64_t> expires_at;
};

/**
 * @brief Optional tuning forwarded with an analysis request.
 */
struct VideoOptions {
  std::optional<double> clip_start_seconds;
  std::optional<double> clip_duration_seconds;
  std::optional<double> segment_seconds;
  std::optional<int> max_segments;
  std::optional<int> max_frames_per_segment;
};

struct DocumentOptions {
  std::optional<int> max_pages_total;
  std::optional<int> pages_per_batch;
  std::optional<int> max_images_per_batch;
  std::optional<int> scanned_text_threshold_chars;
};

struct AudioOptions {
  std::optional<bool> timestamps;
  std::optional<double> segment_seconds;
  std::optional<int> max_segments;
};

struct ImageSetOptions {
  std::optional<int> max_images_total;
  std::optional<int> images_per_batch;
  std::optional<int> max_dimension;
};

/**
 * @brief Analysis of a completed upload.
 *
 * Unset and blank fields are omitted from the request body.
 */
struct AnalyzeRequest {
  std::string upload_id;
  std::string context;
  std::string question;
  std::string language;
  std::optional<int> max_frames;
  std::optional<bool> transcribe;
  std::string transcription_language;
  std::string analysis_mode; ///< "auto", "single" or "multipass".
  VideoOptions video;
  DocumentOptions document;
  AudioOptions audio;
  ImageSetOptions images;
};

/**
 * @brief Text analysis and extraction metadata returned by the server.
 */
struct AnalyzeResult {
  std::string analysis;
  std::string media_type;
  rapidjson::Document extraction; ///< Always an object.
};

/**
 * @brief Thin protocol client over an HttpTransport.
 *
 * Each call performs exactly one request; retries and offset resynchronization
 * live in append_chunk_with_retry().
 */
class UploadClient {
public:
  UploadClient(HttpTransport &transport, ClientConfig config);

  /**
   * @brief Create an upload session sized to the whole payload.
   *
   * @throws HttpStatusError if the server rejects the metadata.
   * @throws ProtocolError if the response lacks the session fields.
   */
  UploadSession create_session(const CreateSessionRequest &request);

  /**
   * @brief Query the authoritative committed offset of a session.
   *
   * @throws HttpStatusError if the session is unknown or expired.
   * @throws ProtocolError if the Upload-Offset header is missing or invalid.
   */
  UploadStatus query_offset(const std::string &upload_id);

  /**
   * @brief Append @p chunk at @p offset.
   *
   * @return std::uint64_t The new committed offset reported by the server.
   * @throws HttpStatusError on offset mismatch (409), expiry (410), oversized
   * chunks (413) and every other non-2xx status.
   */
  std::uint64_t append_chunk(const std::string &upload_id, std::uint64_t offset,
                             const std::vector<char> &chunk);

  /**
   * @brief Request analysis of a completed upload.
   */
  AnalyzeResult analyze(const AnalyzeRequest &request);

private:
  HttpResponse send(HttpRequest request);

  HttpTransport &transport_;
  ClientConfig config_;
};

/**
 * @brief Percent-encode a path segment (RFC 3986 unreserved set kept).
 */
std::string encode_path_segment(const std::string &segment);
} // namespace resumable_tar_upload
