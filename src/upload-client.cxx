#include <resumable-tar-upload/errors.hxx>
#include <resumable-tar-upload/upload-client.hxx>

#include <boost/log/trivial.hpp>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <utility>

namespace http = boost::beast::http;

namespace resumable_tar_upload {
namespace {

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

void write_string_impl(JsonWriter &writer, const char *key,
                       const std::string &value) {
  writer.Key(key);
  writer.String(value.c_str(), static_cast<rapidjson::SizeType>(value.size()));
}

/// Writes @p key only when @p value is not blank.
void write_text_impl(JsonWriter &writer, const char *key,
                     const std::string &value) {
  if (value.find_first_not_of(" \t\r\n") != std::string::npos)
    write_string_impl(writer, key, value);
}

void write_optional_impl(JsonWriter &writer, const char *key,
                         const std::optional<int> &value) {
  if (value) {
    writer.Key(key);
    writer.Int(*value);
  }
}

void write_optional_impl(JsonWriter &writer, const char *key,
                         const std::optional<double> &value) {
  if (value && std::isfinite(*value)) {
    writer.Key(key);
    writer.Double(*value);
  }
}

void write_optional_impl(JsonWriter &writer, const char *key,
                         const std::optional<bool> &value) {
  if (value) {
    writer.Key(key);
    writer.Bool(*value);
  }
}

/**
 * @brief Write a nested option group, skipped entirely when no member is set.
 */
template <typename Group, typename WriteMembers>
void write_group_impl(JsonWriter &writer, const char *key, const Group &group,
                      WriteMembers &&write_members) {
  rapidjson::StringBuffer probe;
  JsonWriter probe_writer(probe);
  probe_writer.StartObject();
  write_members(probe_writer, group);
  probe_writer.EndObject();
  if (probe.GetSize() <= 2)
    return;

  writer.Key(key);
  writer.RawValue(probe.GetString(), probe.GetSize(), rapidjson::kObjectType);
}

std::string to_string_impl(const rapidjson::StringBuffer &buffer) {
  return std::string(buffer.GetString(), buffer.GetSize());
}

bool parse_unsigned_impl(const std::string &text, std::uint64_t &value) {
  const auto first = text.find_first_not_of(" \t");
  const auto last = text.find_last_not_of(" \t");
  if (first == std::string::npos)
    return false;
  const char *begin = text.data() + first;
  const char *end = text.data() + last + 1;
  auto [ptr, ec] = std::from_chars(begin, end, value);
  return ec == std::errc() && ptr == end;
}

void throw_on_status_impl(const HttpResponse &response, const char *what) {
  if (response.status >= 200 && response.status < 300)
    return;
  throw HttpStatusError(std::string(what) + " (HTTP " +
                            std::to_string(response.status) + ").",
                        response.status, response.headers,
                        response.body);
}

std::uint64_t offset_header_impl(const HttpResponse &response) {
  const auto raw = response.header("upload-offset");
  if (raw.empty())
    throw ProtocolError("Missing Upload-Offset header in server response.");
  std::uint64_t offset = 0;
  if (!parse_unsigned_impl(raw, offset))
    throw ProtocolError("Invalid Upload-Offset header: " + raw);
  return offset;
}

rapidjson::Document parse_object_impl(const std::string &body,
                                      const char *what) {
  rapidjson::Document doc;
  doc.Parse(body.data(), body.size());
  if (doc.HasParseError() || !doc.IsObject())
    throw ProtocolError(std::string(what) + ": response is not a JSON object.");
  return doc;
}

} // unnamed namespace

UploadClient::UploadClient(HttpTransport &transport, ClientConfig config)
    : transport_(transport), config_(std::move(config)) {}

HttpResponse UploadClient::send(HttpRequest request) {
  request.headers["Authorization"] = "Bearer " + config_.api_key;
  request.timeout = config_.timeout;
  return transport_.send(request);
}

UploadSession UploadClient::create_session(const CreateSessionRequest &request) {
  rapidjson::StringBuffer buffer;
  JsonWriter writer(buffer);
  writer.StartObject();
  write_string_impl(writer, "filename", request.filename);
  writer.Key("size_bytes");
  writer.Uint64(request.size_bytes);
  write_string_impl(writer, "content_type", request.content_type);
  if (request.client_trace_id)
    write_string_impl(writer, "client_trace_id", *request.client_trace_id);
  writer.EndObject();

  HttpRequest http_request;
  http_request.method = http::verb::post;
  http_request.target = "/v1/uploads";
  http_request.headers["Content-Type"] = "application/json";
  http_request.body = to_string_impl(buffer);

  const auto response = send(std::move(http_request));
  throw_on_status_impl(response, "Failed to create upload session");

  const auto doc = parse_object_impl(response.body, "Create upload session");
  UploadSession session;

  const auto id = doc.FindMember("upload_id");
  if (id == doc.MemberEnd() || !id->value.IsString() ||
      id->value.GetStringLength() == 0)
    throw ProtocolError("Create upload session: missing upload_id.");
  session.upload_id.assign(id->value.GetString(), id->value.GetStringLength());

  const auto chunk = doc.FindMember("chunk_size_bytes");
  if (chunk == doc.MemberEnd() || !chunk->value.IsNumber())
    throw ProtocolError("Create upload session: missing chunk_size_bytes.");
  if (chunk->value.IsUint64())
    session.chunk_size_bytes = chunk->value.GetUint64();
  else if (chunk->value.GetDouble() > 1)
    session.chunk_size_bytes =
        static_cast<std::uint64_t>(std::floor(chunk->value.GetDouble()));
  if (session.chunk_size_bytes == 0)
    session.chunk_size_bytes = 1;

  const auto expires = doc.FindMember("expires_at");
  if (expires != doc.MemberEnd() && expires->value.IsNumber())
    session.expires_at =
        expires->value.IsInt64()
            ? expires->value.GetInt64()
            : static_cast<std::int64_t>(expires->value.GetDouble());

  BOOST_LOG_TRIVIAL(debug) << "Created upload session " << session.upload_id
                           << " (" << request.size_bytes << " bytes, chunk "
                           << session.chunk_size_bytes << ")";
  return session;
}

UploadStatus UploadClient::query_offset(const std::string &upload_id) {
  HttpRequest http_request;
  http_request.method = http::verb::head;
  http_request.target = "/v1/uploads/" + encode_path_segment(upload_id);

  const auto response = send(std::move(http_request));
  throw_on_status_impl(response, "Failed to query upload offset");

  UploadStatus status;
  status.offset = offset_header_impl(response);

  std::uint64_t value = 0;
  if (parse_unsigned_impl(response.header("upload-length"), value))
    status.length = value;
  if (parse_unsigned_impl(response.header("upload-expires"), value))
    status.expires_at = static_cast<std::int64_t>(value);
  return status;
}

std::uint64_t UploadClient::append_chunk(const std::string &upload_id,
                                         std::uint64_t offset,
                                         const std::vector<char> &chunk) {
  HttpRequest http_request;
  http_request.method = http::verb::patch;
  http_request.target = "/v1/uploads/" + encode_path_segment(upload_id);
  http_request.headers["Content-Type"] = "application/offset+octet-stream";
  http_request.headers["Upload-Offset"] = std::to_string(offset);
  http_request.headers["Content-Length"] = std::to_string(chunk.size());
  http_request.body.assign(chunk.begin(), chunk.end());

  const auto response = send(std::move(http_request));
  throw_on_status_impl(response, "Failed to upload chunk");
  return offset_header_impl(response);
}

AnalyzeResult UploadClient::analyze(const AnalyzeRequest &request) {
  rapidjson::StringBuffer buffer;
  JsonWriter writer(buffer);
  writer.StartObject();
  write_string_impl(writer, "upload_id", request.upload_id);
  write_text_impl(writer, "context", request.context);
  write_text_impl(writer, "question", request.question);
  write_text_impl(writer, "language", request.language);
  write_optional_impl(writer, "max_frames", request.max_frames);
  write_optional_impl(writer, "transcribe", request.transcribe);
  write_text_impl(writer, "transcription_language",
                  request.transcription_language);
  write_text_impl(writer, "analysis_mode", request.analysis_mode);

  write_group_impl(writer, "video", request.video,
                   [](JsonWriter &w, const VideoOptions &v) {
                     if (v.clip_start_seconds)
                       write_optional_impl(
                           w, "clip_start_seconds",
                           std::optional<double>(
                               std::max(0.0, *v.clip_start_seconds)));
                     if (v.clip_duration_seconds &&
                         *v.clip_duration_seconds > 0)
                       write_optional_impl(w, "clip_duration_seconds",
                                           v.clip_duration_seconds);
                     write_optional_impl(w, "segment_seconds",
                                         v.segment_seconds);
                     write_optional_impl(w, "max_segments", v.max_segments);
                     write_optional_impl(w, "max_frames_per_segment",
                                         v.max_frames_per_segment);
                   });
  write_group_impl(writer, "document", request.document,
                   [](JsonWriter &w, const DocumentOptions &d) {
                     write_optional_impl(w, "max_pages_total",
                                         d.max_pages_total);
                     write_optional_impl(w, "pages_per_batch",
                                         d.pages_per_batch);
                     write_optional_impl(w, "max_images_per_batch",
                                         d.max_images_per_batch);
                     write_optional_impl(w, "scanned_text_threshold_chars",
                                         d.scanned_text_threshold_chars);
                   });
  write_group_impl(writer, "audio", request.audio,
                   [](JsonWriter &w, const AudioOptions &a) {
                     write_optional_impl(w, "timestamps", a.timestamps);
                     write_optional_impl(w, "segment_seconds",
                                         a.segment_seconds);
                     write_optional_impl(w, "max_segments", a.max_segments);
                   });
  write_group_impl(writer, "images", request.images,
                   [](JsonWriter &w, const ImageSetOptions &i) {
                     write_optional_impl(w, "max_images_total",
                                         i.max_images_total);
                     write_optional_impl(w, "images_per_batch",
                                         i.images_per_batch);
                     write_optional_impl(w, "max_dimension", i.max_dimension);
                   });
  writer.EndObject();

  HttpRequest http_request;
  http_request.method = http::verb::post;
  http_request.target = "/v1/vision/analyze";
  http_request.headers["Content-Type"] = "application/json";
  http_request.body = to_string_impl(buffer);

  const auto response = send(std::move(http_request));
  throw_on_status_impl(response, "Vision analysis failed");

  auto doc = parse_object_impl(response.body, "Vision analysis");
  AnalyzeResult result;
  const auto analysis = doc.FindMember("analysis");
  if (analysis != doc.MemberEnd() && analysis->value.IsString())
    result.analysis.assign(analysis->value.GetString(),
                           analysis->value.GetStringLength());
  const auto media_type = doc.FindMember("media_type");
  if (media_type != doc.MemberEnd() && media_type->value.IsString())
    result.media_type.assign(media_type->value.GetString(),
                             media_type->value.GetStringLength());

  const auto extraction = doc.FindMember("extraction");
  if (extraction != doc.MemberEnd() && extraction->value.IsObject())
    result.extraction.CopyFrom(extraction->value,
                               result.extraction.GetAllocator());
  else
    result.extraction.SetObject();
  return result;
}

std::string encode_path_segment(const std::string &segment) {
  static const char hex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(segment.size());
  for (const unsigned char c : segment) {
    if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
        (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' ||
        c == '~') {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(hex[c >> 4]);
      out.push_back(hex[c & 0x0F]);
    }
  }
  return out;
}
} // namespace resumable_tar_upload
