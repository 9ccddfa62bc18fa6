#pragma once

#include <boost/beast/http.hpp>
#include <exception>
#include <optional>
#include <stdexcept>
#include <utility>

namespace callgate {

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

enum class AttemptStatus {
  SUCCESS,
  RATE_LIMITED,  // Remote service rejected the call for quota; retryable
  FAILED         // Anything else; propagated unchanged
};

/**
 * @brief Outcome of one transport attempt
 *
 * Success carries the typed value plus the raw response (for call-limit
 * header extraction). Failed carries the original error as an exception_ptr
 * so it can be rethrown to the caller untouched.
 */
template <typename T>
class AttemptResult {
 public:
  static AttemptResult Success(T value, HttpResponse response) {
    AttemptResult result(AttemptStatus::SUCCESS);
    result.value_.emplace(std::move(value));
    result.response_ = std::move(response);
    return result;
  }

  static AttemptResult RateLimited(HttpResponse response = HttpResponse()) {
    AttemptResult result(AttemptStatus::RATE_LIMITED);
    result.response_ = std::move(response);
    return result;
  }

  static AttemptResult Failed(std::exception_ptr error) {
    AttemptResult result(AttemptStatus::FAILED);
    result.error_ = error ? error
                          : std::make_exception_ptr(std::runtime_error("Attempt failed without an error"));
    return result;
  }

  AttemptStatus GetStatus() const { return status_; }
  bool IsSuccess() const { return status_ == AttemptStatus::SUCCESS; }

  const HttpResponse& GetResponse() const { return response_; }
  std::exception_ptr GetError() const { return error_; }

  // Only valid on SUCCESS
  const T& GetValue() const { return *value_; }
  T TakeValue() { return std::move(*value_); }

 private:
  explicit AttemptResult(AttemptStatus status) : status_(status) {}

  AttemptStatus status_;
  std::optional<T> value_;
  HttpResponse response_;
  std::exception_ptr error_;
};

}  // namespace callgate
