#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace callgate {

// Response header carrying "<current_fill_level>/<capacity>"
constexpr const char* CALL_LIMIT_HEADER = "X-Shopify-Shop-Api-Call-Limit";

// Request header whose value scopes the quota (registry key)
constexpr const char* ACCESS_TOKEN_HEADER = "X-Shopify-Access-Token";

// Authoritative bucket snapshot observed on one response
struct BucketState {
  int capacity = 0;
  int current_fill_level = 0;

  bool operator==(const BucketState& other) const {
    return capacity == other.capacity && current_fill_level == other.current_fill_level;
  }
};

/**
 * @brief Parse a call-limit header value such as "32/40"
 *
 * Surrounding whitespace on either number is tolerated. Returns nullopt when
 * the value is not two integers separated by a single '/', when capacity is
 * not positive, or when the fill level is outside [0, capacity].
 */
std::optional<BucketState> ParseCallLimit(std::string_view header_value);

// "32/40" formatting, used by the mock server and log lines
std::string FormatCallLimit(const BucketState& state);

}  // namespace callgate
