#include <resumable-tar-upload/content-type.hxx>
#include <resumable-tar-upload/errors.hxx>
#include <resumable-tar-upload/tar-layout.hxx>
#include <resumable-tar-upload/tar-stream.hxx>
#include <resumable-tar-upload/upload-orchestrator.hxx>

#include <boost/iostreams/device/file.hpp>
#include <boost/log/trivial.hpp>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <utility>

namespace fs = std::filesystem;
namespace io = boost::iostreams;

namespace resumable_tar_upload {
namespace {

std::string filename_of_impl(const std::string &path) {
  return fs::path(path).filename().string();
}

/**
 * @brief Fill @p chunk from @p file starting at @p offset.
 *
 * @throws SourceChangedError if the file ends before the chunk is full.
 */
void read_chunk_impl(io::file_source &file, const std::string &path,
                     std::uint64_t offset, std::vector<char> &chunk) {
  if (file.seek(static_cast<io::stream_offset>(offset), std::ios_base::beg) ==
      std::streampos(-1))
    throw SourceIoError("Cannot seek to offset " + std::to_string(offset) +
                        " in " + path);
  std::size_t filled = 0;
  while (filled < chunk.size()) {
    const auto got =
        file.read(chunk.data() + filled,
                  static_cast<std::streamsize>(chunk.size() - filled));
    if (got <= 0)
      throw SourceChangedError("File became shorter while uploading: " +
                               path);
    filled += static_cast<std::size_t>(got);
  }
}

std::size_t chunk_size_for_impl(const UploadSession &session,
                                std::uint64_t total) {
  const auto hint = std::max<std::uint64_t>(session.chunk_size_bytes, 1);
  return static_cast<std::size_t>(
      std::min<std::uint64_t>(hint, std::max<std::uint64_t>(total, 1)));
}

} // unnamed namespace

std::string image_set_entry_name(int index, const std::string &filename) {
  auto extension = fs::path(filename).extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) {
                   return static_cast<char>(std::tolower(c));
                 });
  const bool usable =
      !extension.empty() &&
      std::all_of(extension.begin(), extension.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '.';
      });

  std::ostringstream name;
  name << std::setw(6) << std::setfill('0') << index
       << (usable ? extension : std::string(".img"));
  return name.str();
}

std::string build_image_set_manifest(const std::vector<ImageSetItem> &items) {
  rapidjson::StringBuffer buffer;
  rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
  const auto string = [&writer](const char *key, const std::string &value) {
    writer.Key(key);
    writer.String(value.c_str(),
                  static_cast<rapidjson::SizeType>(value.size()));
  };

  writer.StartObject();
  string("type", "enrivision_media_set");
  writer.Key("version");
  writer.Int(1);
  string("media_type", "image_set");
  writer.Key("items");
  writer.StartArray();
  for (const auto &item : items) {
    writer.StartObject();
    writer.Key("index");
    writer.Int(item.index);
    string("name", item.entry_name);
    string("filename", item.filename);
    string("content_type", item.content_type);
    writer.Key("size_bytes");
    writer.Uint64(item.size_bytes);
    writer.EndObject();
  }
  writer.EndArray();
  writer.EndObject();
  return std::string(buffer.GetString(), buffer.GetSize());
}

std::uint64_t assert_readable_file(const std::string &path) {
  std::error_code ec;
  const auto status = fs::status(path, ec);
  if (ec || !fs::exists(status))
    throw SourceIoError("File not found: " + path);
  if (!fs::is_regular_file(status))
    throw SourceIoError("Not a file: " + path);

  io::file_source probe(path, std::ios_base::in | std::ios_base::binary);
  if (!probe.is_open())
    throw SourceIoError("Cannot open file: " + path);
  probe.close();

  const auto size = fs::file_size(path, ec);
  if (ec)
    throw SourceIoError("Cannot read size of " + path + ": " + ec.message());
  return size;
}

UploadOrchestrator::UploadOrchestrator(UploadClient &client,
                                       OrchestratorOptions options)
    : client_(client), options_(std::move(options)) {
  if (!options_.sleeper)
    options_.sleeper = default_sleeper();
}

std::string
UploadOrchestrator::upload(const std::vector<std::string> &paths,
                           const std::optional<std::string> &trace_id) {
  if (paths.empty())
    throw InvalidInputError("At least one path is required.");
  if (paths.size() == 1)
    return upload_file(paths.front(), trace_id);
  return upload_image_set(paths, trace_id);
}

std::string
UploadOrchestrator::upload_file(const std::string &path,
                                const std::optional<std::string> &trace_id) {
  const auto size = assert_readable_file(path);

  CreateSessionRequest request;
  request.filename = filename_of_impl(path);
  request.size_bytes = size;
  request.content_type = detect_content_type(path);
  request.client_trace_id = trace_id;
  const auto session = client_.create_session(request);

  const auto chunk_size = chunk_size_for_impl(session, size);
  auto offset = start_offset(session.upload_id, size);

  io::file_source file(path, std::ios_base::in | std::ios_base::binary);
  if (!file.is_open())
    throw SourceIoError("Cannot open file: " + path);

  std::vector<char> chunk;
  while (offset < size) {
    chunk.resize(static_cast<std::size_t>(
        std::min<std::uint64_t>(chunk_size, size - offset)));
    read_chunk_impl(file, path, offset, chunk);

    const auto next = append(session.upload_id, offset, chunk, size);
    if (next == offset)
      throw StalledUploadError("Upload made no progress at offset " +
                               std::to_string(offset) + ".");
    offset = next;
  }

  if (offset != size)
    throw IncompleteUploadError("Upload incomplete: sent " +
                                std::to_string(offset) + " of " +
                                std::to_string(size) + " bytes.");
  return session.upload_id;
}

std::string UploadOrchestrator::upload_image_set(
    const std::vector<std::string> &paths,
    const std::optional<std::string> &trace_id) {
  if (paths.size() < 2)
    throw InvalidInputError("An image set needs at least 2 paths.");

  std::vector<ImageSetItem> items;
  items.reserve(paths.size());
  for (const auto &path : paths) {
    ImageSetItem item;
    item.index = static_cast<int>(items.size()) + 1;
    item.path = path;
    item.size_bytes = assert_readable_file(path);
    item.filename = filename_of_impl(path);
    item.content_type = detect_content_type(path);
    if (!is_image_content_type(item.content_type))
      throw InvalidInputError("Image sets may only contain images. Not an "
                              "image: " +
                              path + " (" + item.content_type + ")");
    item.entry_name = image_set_entry_name(item.index, item.filename);
    items.push_back(std::move(item));
  }

  const auto mtime = now_seconds();
  std::vector<TarEntry> entries;
  entries.reserve(items.size() + 1);
  entries.push_back(make_buffer_entry(media_set_manifest_name,
                                      build_image_set_manifest(items), mtime));
  for (const auto &item : items)
    entries.push_back(TarEntry{item.entry_name,
                               FileSource{item.path, item.size_bytes}, mtime});

  const auto total = compute_total_size(entries);
  const TarStream tar(std::move(entries));
  if (tar.size_bytes() != total)
    throw UploadError("Internal error: tar size mismatch (" +
                      std::to_string(tar.size_bytes()) + " planned, " +
                      std::to_string(total) + " declared).");

  CreateSessionRequest request;
  request.filename = media_set_filename;
  request.size_bytes = total;
  request.content_type = media_set_content_type;
  request.client_trace_id = trace_id;
  const auto session = client_.create_session(request);

  const auto chunk_size = chunk_size_for_impl(session, total);
  auto offset = start_offset(session.upload_id, total);

  while (offset < total) {
    const auto pass_start = offset;
    auto reader = tar.chunks(offset, chunk_size);
    std::vector<char> chunk;
    while (reader.next(chunk)) {
      const auto expected = offset;
      offset = append(session.upload_id, expected, chunk, total);
      // Resume generation from whatever offset the server now holds.
      if (offset != expected + chunk.size())
        break;
    }
    if (offset == pass_start)
      throw StalledUploadError("Archive upload made no progress at offset " +
                               std::to_string(offset) + ".");
  }

  if (offset != total)
    throw IncompleteUploadError("Upload incomplete: sent " +
                                std::to_string(offset) + " of " +
                                std::to_string(total) + " bytes.");
  return session.upload_id;
}

std::uint64_t UploadOrchestrator::start_offset(const std::string &upload_id,
                                               std::uint64_t total) {
  const auto status = client_.query_offset(upload_id);
  if (status.offset > total)
    throw ProtocolError("Server offset " + std::to_string(status.offset) +
                        " exceeds upload size " + std::to_string(total) + ".");
  if (status.offset > 0)
    BOOST_LOG_TRIVIAL(info) << "Resuming upload " << upload_id << " at offset "
                            << status.offset;
  return status.offset;
}

std::uint64_t UploadOrchestrator::append(const std::string &upload_id,
                                         std::uint64_t offset,
                                         const std::vector<char> &chunk,
                                         std::uint64_t total) {
  const auto next = append_chunk_with_retry(client_, upload_id, offset, chunk,
                                            options_.retry, options_.sleeper);
  if (next > total)
    throw ProtocolError("Server offset " + std::to_string(next) +
                        " exceeds upload size " + std::to_string(total) + ".");
  if (next < offset)
    throw ProtocolError("Server offset moved back from " +
                        std::to_string(offset) + " to " +
                        std::to_string(next) + ".");
  report(next, total);
  return next;
}

void UploadOrchestrator::report(std::uint64_t offset,
                                std::uint64_t total) const {
  if (options_.progress) {
    options_.progress(offset, total);
    return;
  }
  const auto percent =
      total == 0 ? 100
                 : static_cast<int>(std::floor(100.0 * static_cast<double>(offset) /
                                               static_cast<double>(total)));
  BOOST_LOG_TRIVIAL(info) << "upload " << percent << "% (" << offset << "/"
                          << total << " bytes)";
}

std::int64_t UploadOrchestrator::now_seconds() const {
  if (options_.now_seconds)
    return options_.now_seconds();
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}
} // namespace resumable_tar_upload
