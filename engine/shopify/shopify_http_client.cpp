#include "shopify_http_client.hpp"
#include "shopify_api_error.hpp"
#include "engine/throttle/bucket_state.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <openssl/err.h>
#include <spdlog/spdlog.h>

namespace callgate {

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

using engine::common::CancellationToken;

namespace {

// Drive the private io_context until the pending operation has completed.
// A cancelled token stops the io_context, leaving the operation abandoned.
// restart() clears a stop() issued since the previous phase, so the token is
// checked again after it.
void RunPending(net::io_context& ioc, const CancellationToken& token) {
  ioc.restart();
  token.ThrowIfCancelled();
  ioc.run();
  token.ThrowIfCancelled();
}

void ThrowOnError(const beast::error_code& ec, const char* what) {
  if (ec) {
    throw beast::system_error(ec, what);
  }
}

tcp::resolver::results_type Resolve(net::io_context& ioc,
                                    const engine::common::ParsedUrl& endpoint,
                                    const CancellationToken& token) {
  tcp::resolver resolver(ioc);
  beast::error_code ec;
  tcp::resolver::results_type results;
  resolver.async_resolve(endpoint.host, endpoint.port,
      [&ec, &results](beast::error_code e, tcp::resolver::results_type r) {
        ec = e;
        results = std::move(r);
      });
  RunPending(ioc, token);
  ThrowOnError(ec, "resolve");
  return results;
}

template <typename Stream>
HttpResponse WriteAndRead(net::io_context& ioc, Stream& stream, HttpRequest& request,
                          std::chrono::milliseconds timeout, const CancellationToken& token) {
  beast::error_code ec;

  beast::get_lowest_layer(stream).expires_after(timeout);
  http::async_write(stream, request, [&ec](beast::error_code e, std::size_t) { ec = e; });
  RunPending(ioc, token);
  ThrowOnError(ec, "write");

  beast::flat_buffer buffer;
  HttpResponse response;
  beast::get_lowest_layer(stream).expires_after(timeout);
  http::async_read(stream, buffer, response, [&ec](beast::error_code e, std::size_t) { ec = e; });
  RunPending(ioc, token);
  ThrowOnError(ec, "read");

  return response;
}

std::string ToString(beast::string_view value) {
  return std::string(value.data(), value.size());
}

std::string HeaderValue(const HttpResponse& response, const char* name) {
  auto it = response.find(name);
  if (it == response.end()) {
    return "";
  }
  return std::string(it->value().data(), it->value().size());
}

}  // namespace

ShopifyHttpClient::ShopifyHttpClient(const std::string& base_url, std::chrono::milliseconds timeout)
    : endpoint_(engine::common::ParseHttpUrl(base_url)),
      timeout_(timeout),
      ssl_ctx_(ssl::context::tlsv12_client) {
  ssl_ctx_.set_default_verify_paths();
  ssl_ctx_.set_verify_mode(ssl::verify_peer);
  SPDLOG_DEBUG("ShopifyHttpClient: {}://{}:{}{} timeout={}ms",
               endpoint_.tls ? "https" : "http", endpoint_.host, endpoint_.port, endpoint_.path,
               timeout_.count());
}

HttpRequest ShopifyHttpClient::BuildRequest(http::verb method,
                                            const std::string& path,
                                            const std::string& access_token,
                                            const std::string& body) const {
  std::string target = endpoint_.path;
  if (path.empty() || path.front() != '/') {
    target += '/';
  }
  target += path;

  HttpRequest request{method, target, 11};
  bool default_port = endpoint_.port == (endpoint_.tls ? "443" : "80");
  request.set(http::field::host, default_port ? endpoint_.host : endpoint_.host + ":" + endpoint_.port);
  request.set(http::field::user_agent, std::string("callgate ") + BOOST_BEAST_VERSION_STRING);
  request.set(http::field::accept, "application/json");
  if (!access_token.empty()) {
    request.set(ACCESS_TOKEN_HEADER, access_token);
  }
  if (!body.empty()) {
    request.set(http::field::content_type, "application/json");
    request.body() = body;
  }
  request.prepare_payload();
  return request;
}

HttpResponse ShopifyHttpClient::Execute(HttpRequest& request, const CancellationToken& token) {
  token.ThrowIfCancelled();
  return endpoint_.tls ? ExecuteTls(request, token) : ExecutePlain(request, token);
}

HttpResponse ShopifyHttpClient::ExecutePlain(HttpRequest& request, const CancellationToken& token) {
  net::io_context ioc;
  auto stop_on_cancel = token.Register([&ioc] { ioc.stop(); });

  auto results = Resolve(ioc, endpoint_, token);

  beast::tcp_stream stream(ioc);
  beast::error_code ec;
  stream.expires_after(timeout_);
  stream.async_connect(results, [&ec](beast::error_code e, tcp::endpoint) { ec = e; });
  RunPending(ioc, token);
  ThrowOnError(ec, "connect");

  HttpResponse response = WriteAndRead(ioc, stream, request, timeout_, token);

  stream.socket().shutdown(tcp::socket::shutdown_both, ec);
  if (ec && ec != beast::errc::not_connected) {
    SPDLOG_DEBUG("ShopifyHttpClient: shutdown warning: {}", ec.message());
  }
  return response;
}

HttpResponse ShopifyHttpClient::ExecuteTls(HttpRequest& request, const CancellationToken& token) {
  net::io_context ioc;
  auto stop_on_cancel = token.Register([&ioc] { ioc.stop(); });

  auto results = Resolve(ioc, endpoint_, token);

  ssl::stream<beast::tcp_stream> stream(ioc, ssl_ctx_);
  if (!SSL_set_tlsext_host_name(stream.native_handle(), endpoint_.host.c_str())) {
    beast::error_code sni_ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
    throw beast::system_error(sni_ec, "SNI");
  }
  stream.set_verify_callback(ssl::host_name_verification(endpoint_.host));

  beast::error_code ec;
  beast::get_lowest_layer(stream).expires_after(timeout_);
  beast::get_lowest_layer(stream).async_connect(results, [&ec](beast::error_code e, tcp::endpoint) { ec = e; });
  RunPending(ioc, token);
  ThrowOnError(ec, "connect");

  beast::get_lowest_layer(stream).expires_after(timeout_);
  stream.async_handshake(ssl::stream_base::client, [&ec](beast::error_code e) { ec = e; });
  RunPending(ioc, token);
  ThrowOnError(ec, "handshake");

  HttpResponse response = WriteAndRead(ioc, stream, request, timeout_, token);

  // Shops routinely close without close_notify; the response is already complete
  beast::get_lowest_layer(stream).expires_after(std::chrono::seconds(1));
  stream.async_shutdown([&ec](beast::error_code e) { ec = e; });
  ioc.restart();
  ioc.run();
  if (ec && ec != net::ssl::error::stream_truncated && ec != beast::errc::not_connected) {
    SPDLOG_DEBUG("ShopifyHttpClient: TLS shutdown warning: {}", ec.message());
  }
  return response;
}

AttemptResult<nlohmann::json> ShopifyHttpClient::ExecuteJson(HttpRequest& request,
                                                             const CancellationToken& token) {
  using Result = AttemptResult<nlohmann::json>;

  HttpResponse response;
  try {
    response = Execute(request, token);
  } catch (const std::exception& e) {
    SPDLOG_DEBUG("ShopifyHttpClient: {} {} failed: {}",
                 ToString(request.method_string()), ToString(request.target()), e.what());
    return Result::Failed(std::current_exception());
  }

  int status = static_cast<int>(response.result_int());
  if (status == static_cast<int>(http::status::too_many_requests)) {
    SPDLOG_DEBUG("ShopifyHttpClient: 429 for {} (Retry-After: {})",
                 ToString(request.target()), HeaderValue(response, "Retry-After"));
    return Result::RateLimited(std::move(response));
  }
  if (status < 200 || status >= 300) {
    return Result::Failed(std::make_exception_ptr(ShopifyApiError(
        status, ToString(response.reason()), response.body(), HeaderValue(response, "X-Request-Id"))));
  }

  nlohmann::json body = nlohmann::json::object();
  if (!response.body().empty()) {
    try {
      body = nlohmann::json::parse(response.body());
    } catch (const nlohmann::json::exception& e) {
      SPDLOG_ERROR("ShopifyHttpClient: JSON parse error for {}: {}", ToString(request.target()), e.what());
      return Result::Failed(std::current_exception());
    }
  }
  return Result::Success(std::move(body), std::move(response));
}

}  // namespace callgate
