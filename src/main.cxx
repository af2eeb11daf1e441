#include <resumable-tar-upload/errors.hxx>
#include <resumable-tar-upload/extraction.hxx>
#include <resumable-tar-upload/http-transport.hxx>
#include <resumable-tar-upload/logging.hxx>
#include <resumable-tar-upload/upload-client.hxx>
#include <resumable-tar-upload/upload-orchestrator.hxx>
#include <resumable-tar-upload/version.hxx>

#include <boost/log/trivial.hpp>
#include <boost/program_options.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

#include <chrono>
#include <filesystem>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace po = boost::program_options;
namespace rtu = resumable_tar_upload;

namespace {

/// Environment variables accepted in place of command line options.
const std::map<std::string, std::string> environment_options = {
    {"MEDIA_UPLOAD_URL", "server-url"},
    {"MEDIA_UPLOAD_API_KEY", "api-key"},
    {"MEDIA_UPLOAD_TIMEOUT_MS", "timeout-ms"},
    {"MEDIA_UPLOAD_DEFAULT_LANGUAGE", "language"},
};

po::options_description make_options_impl() {
  po::options_description general("General options");
  general.add_options()("help,h", "print usage and exit")(
      "version", "print the version and exit")(
      "server-url", po::value<std::string>()->default_value(
                        "http://127.0.0.1:8787"),
      "upload server base URL (MEDIA_UPLOAD_URL)")(
      "api-key", po::value<std::string>(),
      "bearer token (MEDIA_UPLOAD_API_KEY)")(
      "timeout-ms", po::value<long long>()->default_value(1'800'000),
      "per-request timeout in milliseconds (MEDIA_UPLOAD_TIMEOUT_MS)")(
      "upload-only", "upload and print the upload id, skip the analysis")(
      "log-level", po::value<std::string>()->default_value("info"),
      "trace, debug, info, warning or error");

  po::options_description analysis("Analysis options");
  analysis.add_options()("context", po::value<std::string>(),
                         "what the media is about")(
      "question", po::value<std::string>(), "question to answer")(
      "language", po::value<std::string>(),
      "answer language (MEDIA_UPLOAD_DEFAULT_LANGUAGE)")(
      "max-frames", po::value<int>(), "frames sampled from a video")(
      "transcribe", po::value<bool>(), "transcribe audio tracks")(
      "transcription-language", po::value<std::string>(),
      "transcription language hint")(
      "analysis-mode", po::value<std::string>(), "auto, single or multipass");

  po::options_description media("Media options");
  media.add_options()("clip-start-seconds", po::value<double>(),
                      "video clip start")(
      "clip-duration-seconds", po::value<double>(), "video clip duration")(
      "segment-seconds", po::value<double>(), "video segment length")(
      "max-segments", po::value<int>(), "video segment count limit")(
      "max-frames-per-segment", po::value<int>(), "frames per video segment")(
      "max-pages-total", po::value<int>(), "document page limit")(
      "pages-per-batch", po::value<int>(), "document pages per batch")(
      "max-images-per-batch", po::value<int>(),
      "document images per batch")("scanned-text-threshold-chars",
                                   po::value<int>(),
                                   "text below which a page counts as scanned")(
      "audio-timestamps", po::value<bool>(), "timestamped transcription")(
      "audio-segment-seconds", po::value<double>(), "audio segment length")(
      "audio-max-segments", po::value<int>(), "audio segment count limit")(
      "max-images-total", po::value<int>(), "image set limit")(
      "images-per-batch", po::value<int>(), "images per batch")(
      "max-dimension", po::value<int>(), "image downscale bound in pixels");

  po::options_description all;
  all.add(general).add(analysis).add(media);
  return all;
}

template <typename T>
void assign_impl(const po::variables_map &vm, const char *name,
                 std::optional<T> &target) {
  if (vm.count(name))
    target = vm[name].as<T>();
}

void assign_impl(const po::variables_map &vm, const char *name,
                 std::string &target) {
  if (vm.count(name))
    target = vm[name].as<std::string>();
}

rtu::AnalyzeRequest make_analyze_request_impl(const po::variables_map &vm) {
  rtu::AnalyzeRequest request;
  assign_impl(vm, "context", request.context);
  assign_impl(vm, "question", request.question);
  assign_impl(vm, "language", request.language);
  assign_impl(vm, "max-frames", request.max_frames);
  assign_impl(vm, "transcribe", request.transcribe);
  assign_impl(vm, "transcription-language", request.transcription_language);
  assign_impl(vm, "analysis-mode", request.analysis_mode);
  if (!request.analysis_mode.empty() && request.analysis_mode != "auto" &&
      request.analysis_mode != "single" && request.analysis_mode != "multipass")
    throw rtu::InvalidInputError("Unknown analysis mode: " +
                                 request.analysis_mode);

  assign_impl(vm, "clip-start-seconds", request.video.clip_start_seconds);
  assign_impl(vm, "clip-duration-seconds",
              request.video.clip_duration_seconds);
  assign_impl(vm, "segment-seconds", request.video.segment_seconds);
  assign_impl(vm, "max-segments", request.video.max_segments);
  assign_impl(vm, "max-frames-per-segment",
              request.video.max_frames_per_segment);
  assign_impl(vm, "max-pages-total", request.document.max_pages_total);
  assign_impl(vm, "pages-per-batch", request.document.pages_per_batch);
  assign_impl(vm, "max-images-per-batch",
              request.document.max_images_per_batch);
  assign_impl(vm, "scanned-text-threshold-chars",
              request.document.scanned_text_threshold_chars);
  assign_impl(vm, "audio-timestamps", request.audio.timestamps);
  assign_impl(vm, "audio-segment-seconds", request.audio.segment_seconds);
  assign_impl(vm, "audio-max-segments", request.audio.max_segments);
  assign_impl(vm, "max-images-total", request.images.max_images_total);
  assign_impl(vm, "images-per-batch", request.images.images_per_batch);
  assign_impl(vm, "max-dimension", request.images.max_dimension);
  return request;
}

void print_result_impl(rtu::AnalyzeResult &result) {
  rtu::strip_internal_fields(result.extraction);

  rapidjson::StringBuffer buffer;
  rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
  writer.StartObject();
  writer.Key("analysis");
  writer.String(result.analysis.c_str(),
                static_cast<rapidjson::SizeType>(result.analysis.size()));
  writer.Key("media_type");
  writer.String(result.media_type.c_str(),
                static_cast<rapidjson::SizeType>(result.media_type.size()));
  writer.Key("extraction");
  result.extraction.Accept(writer);
  writer.EndObject();
  std::cout << buffer.GetString() << std::endl;
}

int run_impl(int argc, char **argv) {
  const auto options = make_options_impl();
  po::options_description hidden;
  hidden.add_options()("path", po::value<std::vector<std::string>>());
  po::options_description cmdline;
  cmdline.add(options).add(hidden);
  po::positional_options_description positional;
  positional.add("path", -1);

  po::variables_map vm;
  po::store(po::command_line_parser(argc, argv)
                .options(cmdline)
                .positional(positional)
                .run(),
            vm);
  // Command line values win over the environment.
  po::store(po::parse_environment(options,
                                  [](const std::string &variable) {
                                    const auto it =
                                        environment_options.find(variable);
                                    return it == environment_options.end()
                                               ? std::string()
                                               : it->second;
                                  }),
            vm);
  po::notify(vm);

  if (vm.count("help")) {
    std::cout << "Usage: resumable-tar-upload [options] <path>...\n"
              << options << std::endl;
    return 0;
  }
  if (vm.count("version")) {
    std::cout << rtu::version << std::endl;
    return 0;
  }

  rtu::init_logging(rtu::parse_severity(vm["log-level"].as<std::string>()));

  const auto paths = vm.count("path")
                         ? vm["path"].as<std::vector<std::string>>()
                         : std::vector<std::string>();
  if (paths.empty())
    throw rtu::InvalidInputError("At least one path is required.");
  for (const auto &path : paths)
    if (!std::filesystem::path(path).is_absolute())
      throw rtu::InvalidInputError("Paths must be absolute: " + path);

  rtu::ClientConfig config;
  if (vm.count("api-key"))
    config.api_key = vm["api-key"].as<std::string>();
  if (config.api_key.empty())
    throw rtu::InvalidInputError(
        "An API key is required (--api-key or MEDIA_UPLOAD_API_KEY).");
  const auto timeout_ms = vm["timeout-ms"].as<long long>();
  if (timeout_ms <= 0)
    throw rtu::InvalidInputError("--timeout-ms must be positive.");
  config.timeout = std::chrono::milliseconds(timeout_ms);

  auto analyze_request = make_analyze_request_impl(vm);

  rtu::BeastHttpTransport transport(
      rtu::parse_base_url(vm["server-url"].as<std::string>()));
  rtu::UploadClient client(transport, config);
  rtu::UploadOrchestrator orchestrator(client);

  const auto trace_id =
      "enrivision_" +
      boost::uuids::to_string(boost::uuids::random_generator()());
  BOOST_LOG_TRIVIAL(debug) << "Client trace id " << trace_id;

  const auto upload_id = orchestrator.upload(paths, trace_id);
  BOOST_LOG_TRIVIAL(info) << "Upload complete: " << upload_id;
  if (vm.count("upload-only")) {
    std::cout << upload_id << std::endl;
    return 0;
  }

  analyze_request.upload_id = upload_id;
  auto result = client.analyze(analyze_request);
  print_result_impl(result);
  return 0;
}

} // unnamed namespace

int main(int argc, char **argv) {
  try {
    return run_impl(argc, argv);
  } catch (const po::error &e) {
    std::cerr << "resumable-tar-upload: " << e.what() << std::endl;
    return 1;
  } catch (const std::exception &e) {
    BOOST_LOG_TRIVIAL(error) << e.what();
    return 1;
  }
}
