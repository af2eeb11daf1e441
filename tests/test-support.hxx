#pragma once

#include <resumable-tar-upload/errors.hxx>
#include <resumable-tar-upload/http-transport.hxx>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <deque>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <picosha2.h>
#include <string>
#include <vector>

namespace test_support {
namespace fs = std::filesystem;
namespace rtu = resumable_tar_upload;

/**
 * @brief Hex SHA-256 digest of a byte range.
 */
inline std::string sha256sum(const std::vector<char> &bytes) {
  std::vector<std::uint8_t> hash(picosha2::k_digest_size);
  picosha2::hash256(bytes.begin(), bytes.end(), hash.begin(), hash.end());
  return picosha2::bytes_to_hex_string(hash.begin(), hash.end());
}

/// Bytes 0, 1, 2, ... wrapping at 251 so patterns never align with blocks.
inline std::vector<char> pattern_bytes(std::size_t size, unsigned seed = 0) {
  std::vector<char> out(size);
  for (std::size_t i = 0; i < size; ++i)
    out[i] = static_cast<char>((i + seed) % 251);
  return out;
}

/**
 * @brief Scratch directory removed with everything in it on destruction.
 */
class TempDir {
public:
  TempDir()
      : path_(fs::temp_directory_path() /
              ("rtu-test-" +
               boost::uuids::to_string(boost::uuids::random_generator()()))) {
    fs::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  const fs::path &path() const { return path_; }

  /// Write @p bytes to a file named @p name and return its absolute path.
  std::string write(const std::string &name,
                    const std::vector<char> &bytes) const {
    const auto file = path_ / name;
    std::ofstream out(file, std::ios::binary | std::ios::trunc);
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    return file.string();
  }

private:
  fs::path path_;
};

/**
 * @brief Entry recovered from raw archive bytes.
 */
struct DecodedEntry {
  std::string name;
  std::vector<char> content;
};

/**
 * @brief Walk ustar headers in @p archive until the zero end marker.
 */
inline std::vector<DecodedEntry> decode_entries(const std::vector<char> &archive) {
  std::vector<DecodedEntry> out;
  std::size_t pos = 0;
  while (pos + 512 <= archive.size() && archive[pos] != '\0') {
    const char *header = archive.data() + pos;
    DecodedEntry entry;
    entry.name.assign(header, strnlen(header, 100));
    const auto size = std::stoull(std::string(header + 124, 11), nullptr, 8);
    const auto begin = archive.begin() + static_cast<std::ptrdiff_t>(pos + 512);
    entry.content.assign(begin, begin + static_cast<std::ptrdiff_t>(size));
    out.push_back(std::move(entry));
    pos += 512 + ((size + 511) / 512) * 512;
  }
  return out;
}

/**
 * @brief In-memory implementation of the resumable upload endpoints.
 *
 * Sessions hold the committed bytes. Faults are injected per PATCH: queued
 * statuses are answered before any bytes are accepted (status 0 raises a
 * TransportError), and a truncation makes the next PATCH commit only a prefix
 * of its body. A PATCH can also be answered without its Upload-Offset header,
 * or followed by the session dropping back to fewer committed bytes.
 */
class FakeUploadServer : public rtu::HttpTransport {
public:
  struct Session {
    std::string filename;
    std::string content_type;
    std::string trace_id;
    std::uint64_t length = 0;
    std::vector<char> data;
  };

  std::uint64_t chunk_size = 1000;
  std::map<std::string, Session> sessions;
  std::vector<rtu::HttpRequest> requests;
  std::deque<int> patch_failures;
  std::optional<std::size_t> truncate_next_patch;
  bool always_conflict = false;
  bool drop_offset_next_patch = false;
  /// PATCH number (1-based) mapped to the byte count kept after it commits.
  std::map<int, std::size_t> rewind_after_patch;

  /// Pre-existing session, e.g. one left half-finished by an earlier run.
  void seed(const std::string &id, Session session) {
    sessions[id] = std::move(session);
    seeded_id_ = id;
  }

  int patch_count() const {
    int count = 0;
    for (const auto &r : requests)
      if (r.method == boost::beast::http::verb::patch)
        ++count;
    return count;
  }

  rtu::HttpResponse send(const rtu::HttpRequest &request) override {
    requests.push_back(request);
    const std::string prefix = "/v1/uploads";

    if (request.method == boost::beast::http::verb::post &&
        request.target == prefix)
      return create(request);

    if (request.target.rfind(prefix + "/", 0) != 0)
      return status(404);
    const auto id = request.target.substr(prefix.size() + 1);
    const auto it = sessions.find(id);
    if (it == sessions.end())
      return status(404);
    auto &session = it->second;

    if (request.method == boost::beast::http::verb::head)
      return offset_response(200, session);
    if (request.method == boost::beast::http::verb::patch)
      return patch(request, session);
    return status(405);
  }

private:
  static rtu::HttpResponse status(int code) {
    rtu::HttpResponse response;
    response.status = code;
    return response;
  }

  static rtu::HttpResponse offset_response(int code, const Session &session) {
    auto response = status(code);
    response.headers["upload-offset"] = std::to_string(session.data.size());
    response.headers["upload-length"] = std::to_string(session.length);
    response.headers["upload-expires"] = "1700000000000";
    return response;
  }

  rtu::HttpResponse create(const rtu::HttpRequest &request) {
    rapidjson::Document doc;
    doc.Parse(request.body.c_str());
    if (doc.HasParseError() || !doc.IsObject())
      return status(400);

    Session session;
    session.filename = doc["filename"].GetString();
    session.content_type = doc["content_type"].GetString();
    session.length = doc["size_bytes"].GetUint64();
    if (doc.HasMember("client_trace_id"))
      session.trace_id = doc["client_trace_id"].GetString();

    // A seeded session is handed out again to model resuming an upload.
    std::string id = seeded_id_;
    if (id.empty())
      id = "up-" + std::to_string(sessions.size() + 1);
    else
      seeded_id_.clear();
    if (!sessions.count(id))
      sessions[id] = std::move(session);

    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.StartObject();
    writer.Key("upload_id");
    writer.String(id.c_str());
    writer.Key("chunk_size_bytes");
    writer.Uint64(chunk_size);
    writer.Key("expires_at");
    writer.Int64(1700000000000);
    writer.EndObject();

    auto response = status(201);
    response.body = buffer.GetString();
    return response;
  }

  rtu::HttpResponse patch(const rtu::HttpRequest &request, Session &session) {
    if (!patch_failures.empty()) {
      const auto code = patch_failures.front();
      patch_failures.pop_front();
      if (code == 0)
        throw rtu::TransportError("connection reset");
      return status(code);
    }

    const auto offset = std::stoull(request.headers.at("Upload-Offset"));
    if (always_conflict || offset != session.data.size())
      return offset_response(409, session);
    if (offset + request.body.size() > session.length)
      return status(413);

    auto take = request.body.size();
    if (truncate_next_patch) {
      take = std::min(take, *truncate_next_patch);
      truncate_next_patch.reset();
    }
    session.data.insert(session.data.end(), request.body.begin(),
                        request.body.begin() + static_cast<std::ptrdiff_t>(take));

    const auto rewind = rewind_after_patch.find(patch_count());
    if (rewind != rewind_after_patch.end())
      session.data.resize(std::min(session.data.size(), rewind->second));
    if (drop_offset_next_patch) {
      drop_offset_next_patch = false;
      return status(204);
    }
    return offset_response(204, session);
  }

  std::string seeded_id_;
};
} // namespace test_support
