#include <resumable-tar-upload/errors.hxx>
#include <resumable-tar-upload/http-transport.hxx>
#include <resumable-tar-upload/version.hxx>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/log/trivial.hpp>

#include <algorithm>
#include <cctype>
#include <utility>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace resumable_tar_upload {
namespace {

std::string to_lower_impl(const char *data, std::size_t size) {
  std::string out(data, size);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

/**
 * @brief Run one asynchronous step to completion on @p ioc.
 *
 * Beast stream timeouts only apply to asynchronous operations, so every step
 * is started asynchronously and the io_context is drained until the handler
 * has run.
 *
 * @param ioc Private io_context of the request.
 * @param what Step name used in the error message.
 * @param initiate Callable that starts the operation with the given handler.
 * @throws TransportError if the step completes with an error.
 */
template <typename Initiate>
void run_step_impl(net::io_context &ioc, const char *what,
                   Initiate &&initiate) {
  boost::system::error_code result;
  initiate([&result](boost::system::error_code ec, auto &&...) {
    result = ec;
  });
  ioc.restart();
  ioc.run();
  if (result)
    throw TransportError(std::string(what) + " failed: " + result.message());
}

/**
 * @brief Write @p req on an established stream and read the full response.
 */
template <typename Stream>
HttpResponse exchange_impl(net::io_context &ioc, Stream &stream,
                           http::request<http::string_body> &req,
                           std::chrono::milliseconds timeout) {
  beast::get_lowest_layer(stream).expires_after(timeout);
  run_step_impl(ioc, "write request", [&](auto handler) {
    http::async_write(stream, req, std::move(handler));
  });

  beast::flat_buffer buffer;
  http::response_parser<http::string_body> parser;
  parser.body_limit(BeastHttpTransport::max_response_bytes);
  if (req.method() == http::verb::head)
    parser.skip(true);

  beast::get_lowest_layer(stream).expires_after(timeout);
  run_step_impl(ioc, "read response", [&](auto handler) {
    http::async_read(stream, buffer, parser, std::move(handler));
  });

  auto res = parser.release();
  HttpResponse out;
  out.status = static_cast<int>(res.result_int());
  for (const auto &field : res) {
    const auto name = field.name_string();
    const auto value = field.value();
    out.headers[to_lower_impl(name.data(), name.size())] =
        std::string(value.data(), value.size());
  }
  out.body = std::move(res.body());
  return out;
}

std::string host_header_impl(const BaseUrl &url) {
  const bool default_port = (url.tls && url.port == "443") ||
                            (!url.tls && url.port == "80");
  return default_port ? url.host : url.host + ":" + url.port;
}

} // unnamed namespace

std::string HttpResponse::header(std::string_view lower_name) const {
  const auto it = headers.find(std::string(lower_name));
  return it == headers.end() ? std::string() : it->second;
}

BaseUrl parse_base_url(std::string_view url) {
  BaseUrl out;
  std::string_view rest;
  if (url.substr(0, 7) == "http://") {
    rest = url.substr(7);
    out.port = "80";
  } else if (url.substr(0, 8) == "https://") {
    rest = url.substr(8);
    out.tls = true;
    out.port = "443";
  } else {
    throw InvalidInputError("Server URL must start with http:// or https://");
  }

  const auto slash = rest.find('/');
  auto authority = rest.substr(0, slash);
  if (slash != std::string_view::npos) {
    auto path = rest.substr(slash);
    while (!path.empty() && path.back() == '/')
      path.remove_suffix(1);
    out.path = std::string(path);
  }

  // Bracketed IPv6 literals keep their colons.
  const auto bracket = authority.rfind(']');
  const auto colon = authority.rfind(':');
  if (colon != std::string_view::npos &&
      (bracket == std::string_view::npos || colon > bracket)) {
    out.port = std::string(authority.substr(colon + 1));
    authority = authority.substr(0, colon);
  }
  if (authority.size() >= 2 && authority.front() == '[' &&
      authority.back() == ']')
    authority = authority.substr(1, authority.size() - 2);

  if (authority.empty() || out.port.empty())
    throw InvalidInputError("Server URL is missing a host: " +
                            std::string(url));
  out.host = std::string(authority);
  return out;
}

BeastHttpTransport::BeastHttpTransport(BaseUrl base_url)
    : base_url_(std::move(base_url)) {}

HttpResponse BeastHttpTransport::send(const HttpRequest &request) {
  http::request<http::string_body> req{request.method,
                                       base_url_.path + request.target, 11};
  req.set(http::field::host, host_header_impl(base_url_));
  req.set(http::field::user_agent,
          std::string("resumable-tar-upload/") + version);
  for (const auto &[name, value] : request.headers)
    req.set(name, value);
  req.body() = request.body;
  req.prepare_payload();

  try {
    net::io_context ioc;
    tcp::resolver resolver(ioc);
    const auto endpoints = resolver.resolve(base_url_.host, base_url_.port);

    HttpResponse response;
    if (base_url_.tls) {
      ssl::context ctx(ssl::context::tls_client);
      ctx.set_default_verify_paths();
      ctx.set_verify_mode(ssl::verify_peer);

      beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
      if (!SSL_set_tlsext_host_name(stream.native_handle(),
                                    base_url_.host.c_str()))
        throw TransportError("Cannot set TLS server name for " +
                             base_url_.host);
      stream.set_verify_callback(ssl::host_name_verification(base_url_.host));

      beast::get_lowest_layer(stream).expires_after(request.timeout);
      run_step_impl(ioc, "connect", [&](auto handler) {
        beast::get_lowest_layer(stream).async_connect(endpoints,
                                                      std::move(handler));
      });
      beast::get_lowest_layer(stream).expires_after(request.timeout);
      run_step_impl(ioc, "TLS handshake", [&](auto handler) {
        stream.async_handshake(ssl::stream_base::client, std::move(handler));
      });

      response = exchange_impl(ioc, stream, req, request.timeout);

      // The response is complete; a peer that skips close_notify is fine.
      beast::get_lowest_layer(stream).expires_after(std::chrono::seconds(5));
      boost::system::error_code shutdown_ec;
      stream.async_shutdown(
          [&shutdown_ec](boost::system::error_code ec) { shutdown_ec = ec; });
      ioc.restart();
      ioc.run();
      if (shutdown_ec && shutdown_ec != net::error::eof &&
          shutdown_ec != ssl::error::stream_truncated)
        BOOST_LOG_TRIVIAL(debug) << "TLS shutdown: " << shutdown_ec.message();
    } else {
      beast::tcp_stream stream(ioc);
      stream.expires_after(request.timeout);
      run_step_impl(ioc, "connect", [&](auto handler) {
        stream.async_connect(endpoints, std::move(handler));
      });

      response = exchange_impl(ioc, stream, req, request.timeout);

      boost::system::error_code shutdown_ec;
      stream.socket().shutdown(tcp::socket::shutdown_both, shutdown_ec);
      if (shutdown_ec && shutdown_ec != beast::errc::not_connected)
        BOOST_LOG_TRIVIAL(debug) << "Socket shutdown: "
                                 << shutdown_ec.message();
    }

    BOOST_LOG_TRIVIAL(trace) << request.method << " " << request.target
                             << " -> " << response.status;
    return response;
  } catch (const boost::system::system_error &e) {
    const auto method = http::to_string(request.method);
    throw TransportError(std::string(method.data(), method.size()) + " " +
                         request.target + " failed: " + e.what());
  }
}
} // namespace resumable_tar_upload
