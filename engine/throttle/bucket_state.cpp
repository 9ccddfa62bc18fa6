#include "bucket_state.hpp"
#include <charconv>

namespace callgate {

namespace {

std::string_view Trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
    s.remove_prefix(1);
  }
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
    s.remove_suffix(1);
  }
  return s;
}

std::optional<int> ParseInt(std::string_view s) {
  s = Trim(s);
  if (s.empty()) {
    return std::nullopt;
  }
  int value = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (ec != std::errc() || ptr != s.data() + s.size()) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

std::optional<BucketState> ParseCallLimit(std::string_view header_value) {
  size_t slash = header_value.find('/');
  if (slash == std::string_view::npos || header_value.find('/', slash + 1) != std::string_view::npos) {
    return std::nullopt;
  }

  auto fill = ParseInt(header_value.substr(0, slash));
  auto capacity = ParseInt(header_value.substr(slash + 1));
  if (!fill || !capacity) {
    return std::nullopt;
  }
  if (*capacity <= 0 || *fill < 0 || *fill > *capacity) {
    return std::nullopt;
  }

  BucketState state;
  state.capacity = *capacity;
  state.current_fill_level = *fill;
  return state;
}

std::string FormatCallLimit(const BucketState& state) {
  return std::to_string(state.current_fill_level) + "/" + std::to_string(state.capacity);
}

}  // namespace callgate
