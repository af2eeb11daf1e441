#include <resumable-tar-upload/errors.hxx>
#include <resumable-tar-upload/http-transport.hxx>
#include <resumable-tar-upload/upload-client.hxx>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <rapidjson/document.h>

#include <chrono>
#include <gtest/gtest.h>
#include <optional>
#include <string>
#include <thread>
#include <utility>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace rtu = resumable_tar_upload;
using tcp = net::ip::tcp;
using namespace std::chrono_literals;

namespace {

/**
 * @brief One-shot HTTP server on 127.0.0.1 answering a single request.
 *
 * With no response configured the connection is held open without an answer
 * until the client goes away.
 */
class LoopbackServer {
public:
  explicit LoopbackServer(
      std::optional<http::response<http::string_body>> response)
      : acceptor_(ioc_, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0)),
        response_(std::move(response)) {
    thread_ = std::thread([this] { serve(); });
  }

  ~LoopbackServer() {
    if (thread_.joinable())
      thread_.join();
  }

  std::string url() const {
    return "http://127.0.0.1:" +
           std::to_string(acceptor_.local_endpoint().port()) + "/api/";
  }

  /// Wait for the exchange to finish; returns the request received.
  const http::request<http::string_body> &received() {
    thread_.join();
    EXPECT_TRUE(error_.empty()) << error_;
    return request_;
  }

private:
  void serve() {
    try {
      tcp::socket socket(ioc_);
      acceptor_.accept(socket);
      beast::flat_buffer buffer;
      http::read(socket, buffer, request_);
      if (response_) {
        response_->prepare_payload();
        http::write(socket, *response_);
        beast::error_code ec;
        socket.shutdown(tcp::socket::shutdown_send, ec);
      } else {
        char byte;
        beast::error_code ec;
        socket.read_some(net::buffer(&byte, 1), ec);
      }
    } catch (const std::exception &e) {
      error_ = e.what();
    }
  }

  net::io_context ioc_;
  tcp::acceptor acceptor_;
  std::optional<http::response<http::string_body>> response_;
  http::request<http::string_body> request_;
  std::string error_;
  std::thread thread_;
};

http::response<http::string_body> json_response(http::status status,
                                                std::string body) {
  http::response<http::string_body> res{status, 11};
  res.set(http::field::content_type, "application/json");
  res.body() = std::move(body);
  return res;
}

} // unnamed namespace

TEST(BaseUrl, ParsesSchemesPortsAndPaths) {
  auto url = rtu::parse_base_url("http://127.0.0.1:8787");
  EXPECT_FALSE(url.tls);
  EXPECT_EQ(url.host, "127.0.0.1");
  EXPECT_EQ(url.port, "8787");
  EXPECT_EQ(url.path, "");

  url = rtu::parse_base_url("https://proxy.example.com/api//");
  EXPECT_TRUE(url.tls);
  EXPECT_EQ(url.host, "proxy.example.com");
  EXPECT_EQ(url.port, "443");
  EXPECT_EQ(url.path, "/api");

  url = rtu::parse_base_url("http://[::1]:9000/");
  EXPECT_EQ(url.host, "::1");
  EXPECT_EQ(url.port, "9000");
  EXPECT_EQ(url.path, "");

  url = rtu::parse_base_url("http://localhost");
  EXPECT_EQ(url.port, "80");
}

TEST(BaseUrl, RejectsUnsupportedUrls) {
  EXPECT_THROW(rtu::parse_base_url("ftp://host/"), rtu::InvalidInputError);
  EXPECT_THROW(rtu::parse_base_url("127.0.0.1:8787"), rtu::InvalidInputError);
  EXPECT_THROW(rtu::parse_base_url("http:///path"), rtu::InvalidInputError);
  EXPECT_THROW(rtu::parse_base_url("http://host:/"), rtu::InvalidInputError);
}

TEST(BeastHttpTransport, CreateSessionRequestOnTheWire) {
  LoopbackServer server(json_response(
      http::status::created,
      R"({"upload_id":"up-42","chunk_size_bytes":8388608,)"
      R"("expires_at":1700000000000})"));
  rtu::BeastHttpTransport transport(rtu::parse_base_url(server.url()));
  rtu::UploadClient client(transport, rtu::ClientConfig{"s3cret", 5s});

  rtu::CreateSessionRequest request;
  request.filename = "clip.mp4";
  request.size_bytes = 123456789;
  request.content_type = "video/mp4";
  request.client_trace_id = "trace-7";
  const auto session = client.create_session(request);

  EXPECT_EQ(session.upload_id, "up-42");
  EXPECT_EQ(session.chunk_size_bytes, 8388608u);
  EXPECT_EQ(session.expires_at, 1700000000000);

  const auto &req = server.received();
  EXPECT_EQ(req.method(), http::verb::post);
  EXPECT_EQ(req.target(), "/api/v1/uploads");
  EXPECT_EQ(req[http::field::authorization], "Bearer s3cret");
  EXPECT_EQ(req[http::field::content_type], "application/json");

  rapidjson::Document body;
  body.Parse(req.body().c_str());
  ASSERT_FALSE(body.HasParseError());
  EXPECT_STREQ(body["filename"].GetString(), "clip.mp4");
  EXPECT_EQ(body["size_bytes"].GetUint64(), 123456789u);
  EXPECT_STREQ(body["content_type"].GetString(), "video/mp4");
  EXPECT_STREQ(body["client_trace_id"].GetString(), "trace-7");
}

TEST(BeastHttpTransport, HeadReadsOffsetWithoutBody) {
  http::response<http::string_body> res{http::status::ok, 11};
  res.set("Upload-Offset", "4096");
  res.set("Upload-Length", "10000");
  LoopbackServer server(std::move(res));
  rtu::BeastHttpTransport transport(rtu::parse_base_url(server.url()));
  rtu::UploadClient client(transport, rtu::ClientConfig{"k", 5s});

  const auto status = client.query_offset("up-42");
  EXPECT_EQ(status.offset, 4096u);
  ASSERT_TRUE(status.length.has_value());
  EXPECT_EQ(*status.length, 10000u);

  const auto &req = server.received();
  EXPECT_EQ(req.method(), http::verb::head);
  EXPECT_EQ(req.target(), "/api/v1/uploads/up-42");
}

TEST(BeastHttpTransport, ErrorStatusCarriesBody) {
  LoopbackServer server(json_response(http::status::payload_too_large,
                                      R"({"error":"too large"})"));
  rtu::BeastHttpTransport transport(rtu::parse_base_url(server.url()));
  rtu::UploadClient client(transport, rtu::ClientConfig{"k", 5s});

  try {
    client.create_session({"huge.mp4", 1ull << 40, "video/mp4", std::nullopt});
    FAIL() << "expected HttpStatusError";
  } catch (const rtu::HttpStatusError &e) {
    EXPECT_EQ(e.status(), 413);
    EXPECT_EQ(e.body(), R"({"error":"too large"})");
    EXPECT_EQ(std::string(e.what()),
              "Failed to create upload session (HTTP 413).");
  }
  server.received();
}

TEST(BeastHttpTransport, TimesOutWithoutResponse) {
  LoopbackServer server(std::nullopt);
  rtu::BeastHttpTransport transport(rtu::parse_base_url(server.url()));
  rtu::UploadClient client(transport, rtu::ClientConfig{"k", 200ms});

  EXPECT_THROW(client.query_offset("up-1"), rtu::TransportError);
  server.received();
}

TEST(BeastHttpTransport, ConnectionRefusedIsTransportError) {
  std::string url;
  {
    net::io_context ioc;
    tcp::acceptor probe(ioc,
                        tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
    url = "http://127.0.0.1:" + std::to_string(probe.local_endpoint().port());
  }
  rtu::BeastHttpTransport transport(rtu::parse_base_url(url));
  rtu::HttpRequest request;
  request.target = "/v1/uploads/x";
  request.timeout = 2s;
  EXPECT_THROW(transport.send(request), rtu::TransportError);
}

TEST(BeastHttpTransport, AnalyzeOmitsUnsetFields) {
  LoopbackServer server(json_response(
      http::status::ok,
      R"({"analysis":"two cats","media_type":"image_set",)"
      R"("extraction":{"images":2,"upload_id":"up-42"}})"));
  rtu::BeastHttpTransport transport(rtu::parse_base_url(server.url()));
  rtu::UploadClient client(transport, rtu::ClientConfig{"k", 5s});

  rtu::AnalyzeRequest request;
  request.upload_id = "up-42";
  request.question = "What is shown?";
  request.context = "   ";
  request.max_frames = 8;
  request.transcribe = false;
  request.images.max_images_total = 20;
  request.video.clip_start_seconds = -3.0;
  const auto result = client.analyze(request);

  EXPECT_EQ(result.analysis, "two cats");
  EXPECT_EQ(result.media_type, "image_set");
  ASSERT_TRUE(result.extraction.IsObject());
  EXPECT_EQ(result.extraction["images"].GetInt(), 2);

  const auto &req = server.received();
  EXPECT_EQ(req.target(), "/api/v1/vision/analyze");
  rapidjson::Document body;
  body.Parse(req.body().c_str());
  ASSERT_FALSE(body.HasParseError());
  EXPECT_STREQ(body["upload_id"].GetString(), "up-42");
  EXPECT_STREQ(body["question"].GetString(), "What is shown?");
  EXPECT_FALSE(body.HasMember("context"));
  EXPECT_FALSE(body.HasMember("language"));
  EXPECT_EQ(body["max_frames"].GetInt(), 8);
  EXPECT_FALSE(body["transcribe"].GetBool());
  EXPECT_EQ(body["images"]["max_images_total"].GetInt(), 20);
  EXPECT_EQ(body["video"]["clip_start_seconds"].GetDouble(), 0.0);
  EXPECT_FALSE(body.HasMember("document"));
  EXPECT_FALSE(body.HasMember("audio"));
}

TEST(BeastHttpTransport, AnalyzeWithoutExtractionGivesEmptyObject) {
  LoopbackServer server(
      json_response(http::status::ok, R"({"analysis":"ok","extraction":[]})"));
  rtu::BeastHttpTransport transport(rtu::parse_base_url(server.url()));
  rtu::UploadClient client(transport, rtu::ClientConfig{"k", 5s});

  rtu::AnalyzeRequest request;
  request.upload_id = "up-1";
  const auto result = client.analyze(request);
  EXPECT_EQ(result.analysis, "ok");
  EXPECT_TRUE(result.media_type.empty());
  ASSERT_TRUE(result.extraction.IsObject());
  EXPECT_EQ(result.extraction.MemberCount(), 0u);
  server.received();
}
