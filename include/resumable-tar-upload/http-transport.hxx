/**
 * @file http-transport.hxx
 * @brief Minimal request/response HTTP abstraction and its Boost.Beast
 * implementation.
 */

#pragma once

#include <boost/beast/http/verb.hpp>

#include <chrono>
#include <cstddef>
#include <map>
#include <string>
#include <string_view>

namespace resumable_tar_upload {
/**
 * @brief One HTTP request relative to the transport's base URL.
 */
struct HttpRequest {
  boost::beast::http::verb method = boost::beast::http::verb::get;
  std::string target;                         ///< Path, e.g. "/v1/uploads".
  std::map<std::string, std::string> headers; ///< Extra request headers.
  std::string body;
  std::chrono::milliseconds timeout{30'000};
};

/**
 * @brief A complete HTTP response.
 */
struct HttpResponse {
  int status = 0;
  std::map<std::string, std::string> headers; ///< Keys lower-cased.
  std::string body;

  /// Header value by lower-case name, empty when absent.
  std::string header(std::string_view lower_name) const;
};

/**
 * @brief Sends one request and waits for its response.
 *
 * Implementations throw TransportError when no response could be obtained.
 * Non-2xx statuses are returned, not thrown.
 */
class HttpTransport {
public:
  virtual ~HttpTransport() = default;
  virtual HttpResponse send(const HttpRequest &request) = 0;
};

/**
 * @brief Decomposed http:// or https:// base URL.
 */
struct BaseUrl {
  bool tls = false;
  std::string host;
  std::string port;
  std::string path; ///< Base path without trailing slash, may be empty.
};

/**
 * @brief Parse a base URL such as "https://proxy.example.com:8443/api/".
 *
 * Trailing slashes are dropped. The default port follows the scheme.
 *
 * @throws InvalidInputError if the scheme is not http or https or the host is
 * missing.
 */
BaseUrl parse_base_url(std::string_view url);

/**
 * @brief HTTP/1.1 transport over Boost.Beast, one connection per request.
 *
 * Every step (resolve excepted) runs under the request timeout. https URLs
 * use TLS with SNI and peer verification against the system trust store.
 */
class BeastHttpTransport : public HttpTransport {
public:
  /// Upper bound on a response body accepted from the server.
  static constexpr std::size_t max_response_bytes = 50 * 1024 * 1024;

  explicit BeastHttpTransport(BaseUrl base_url);

  HttpResponse send(const HttpRequest &request) override;

private:
  BaseUrl base_url_;
};
} // namespace resumable_tar_upload
