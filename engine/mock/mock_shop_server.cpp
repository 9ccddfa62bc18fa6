#include "mock_shop_server.hpp"
#include "engine/throttle/bucket_state.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

namespace callgate {

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

MockShopServer::MockShopServer(const MockShopOptions& options)
    : options_(options), buckets_(options.capacity, options.drain_interval) {}

MockShopServer::~MockShopServer() {
  Stop();
}

bool MockShopServer::Start(const std::string& address, uint16_t port) {
  if (running_.exchange(true)) {
    return false;  // Already running
  }

  try {
    ioc_ = std::make_unique<net::io_context>(1);
    auto endpoint = tcp::endpoint(net::ip::make_address(address), port);
    acceptor_ = std::make_unique<tcp::acceptor>(*ioc_, endpoint);
    address_ = address;
    port_ = acceptor_->local_endpoint().port();
  } catch (const std::exception& e) {
    SPDLOG_ERROR("MockShopServer: failed to bind {}:{}: {}", address, port, e.what());
    acceptor_.reset();
    ioc_.reset();
    running_ = false;
    return false;
  }

  StartAccept();
  server_thread_ = std::thread(&MockShopServer::RunServer, this);
  SPDLOG_INFO("MockShopServer listening on {} (capacity {}, drain {}ms)",
              GetBaseUrl(), options_.capacity, options_.drain_interval.count());
  return true;
}

void MockShopServer::Stop() {
  if (!running_.exchange(false)) {
    return;  // Not running
  }

  if (ioc_) {
    ioc_->stop();
  }
  if (server_thread_.joinable()) {
    server_thread_.join();
  }

  // io thread is gone, safe to touch the acceptor here
  if (acceptor_ && acceptor_->is_open()) {
    boost::system::error_code ec;
    acceptor_->close(ec);
  }
  acceptor_.reset();
  ioc_.reset();
  SPDLOG_INFO("MockShopServer stopped ({} requests, {} rate limited)",
              request_count_.load(), rate_limited_count_.load());
}

std::string MockShopServer::GetBaseUrl() const {
  return "http://" + address_ + ":" + std::to_string(port_);
}

void MockShopServer::RunServer() {
  try {
    ioc_->run();
  } catch (const std::exception& e) {
    SPDLOG_ERROR("MockShopServer error: {}", e.what());
    running_ = false;
  }
}

void MockShopServer::StartAccept() {
  auto socket = std::make_shared<tcp::socket>(*ioc_);
  acceptor_->async_accept(*socket, [this, socket](boost::system::error_code ec) {
    if (ec) {
      if (ec != net::error::operation_aborted) {
        SPDLOG_ERROR("MockShopServer accept error: {}", ec.message());
      }
      return;
    }
    HandleConnection(*socket);
    if (running_.load()) {
      StartAccept();
    }
  });
}

void MockShopServer::HandleConnection(tcp::socket& socket) {
  try {
    beast::flat_buffer buffer;
    HttpRequest req;
    http::read(socket, buffer, req);

    HttpResponse resp;
    resp.version(req.version());
    resp.keep_alive(false);
    resp.set(http::field::server, BOOST_BEAST_VERSION_STRING);
    HandleRequest(req, resp);

    http::write(socket, resp);
    boost::system::error_code ec;
    socket.shutdown(tcp::socket::shutdown_send, ec);
  } catch (const std::exception& e) {
    SPDLOG_WARN("MockShopServer request error: {}", e.what());
  }
}

bool MockShopServer::ConsumeForcedRateLimit() {
  int pending = forced_rate_limits_.load();
  while (pending > 0) {
    if (forced_rate_limits_.compare_exchange_weak(pending, pending - 1)) {
      return true;
    }
  }
  return false;
}

void MockShopServer::HandleRequest(const HttpRequest& req, HttpResponse& resp) {
  request_count_++;
  std::string target(req.target().data(), req.target().size());

  auto token_it = req.find(ACCESS_TOKEN_HEADER);
  if (token_it == req.end() || token_it->value().empty()) {
    nlohmann::json error_json;
    error_json["errors"] = "[API] Invalid API key or access token (unrecognized login or wrong password)";
    RespondJson(resp, http::status::unauthorized, error_json.dump());
    return;
  }
  std::string access_token(token_it->value().data(), token_it->value().size());

  LeakyBucket& bucket = buckets_.GetOrCreate(access_token);
  if (ConsumeForcedRateLimit() || !bucket.TryGrant()) {
    rate_limited_count_++;
    resp.set("Retry-After", "2.0");
    nlohmann::json error_json;
    error_json["errors"] = "Exceeded 2 calls per second for api client. Reduce request rates to resume uninterrupted service.";
    RespondJson(resp, http::status::too_many_requests, error_json.dump());
    return;
  }

  BucketState state;
  state.capacity = bucket.GetCapacity();
  state.current_fill_level = std::min(
      state.capacity, static_cast<int>(std::ceil(bucket.GetEstimatedFillLevel())));
  resp.set(CALL_LIMIT_HEADER, FormatCallLimit(state));

  if (req.method() == http::verb::get && target == "/admin/shop.json") {
    nlohmann::json shop_json;
    shop_json["shop"] = {{"id", 1}, {"name", options_.shop_name}};
    RespondJson(resp, http::status::ok, shop_json.dump());
  } else if (req.method() == http::verb::get && target == "/admin/products/count.json") {
    nlohmann::json count_json;
    count_json["count"] = options_.product_count;
    RespondJson(resp, http::status::ok, count_json.dump());
  } else {
    HandleNotFound(req, resp);
  }
}

void MockShopServer::HandleNotFound(const HttpRequest& req, HttpResponse& resp) {
  SPDLOG_DEBUG("MockShopServer: no route for {} {}",
               std::string(req.method_string().data(), req.method_string().size()),
               std::string(req.target().data(), req.target().size()));
  nlohmann::json error_json;
  error_json["errors"] = "Not Found";
  RespondJson(resp, http::status::not_found, error_json.dump());
}

void MockShopServer::RespondJson(HttpResponse& resp, http::status status, const std::string& body) {
  resp.result(status);
  resp.set(http::field::content_type, "application/json; charset=utf-8");
  resp.body() = body;
  resp.prepare_payload();
}

}  // namespace callgate
