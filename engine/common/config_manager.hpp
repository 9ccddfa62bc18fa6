#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>
#include <unordered_map>

namespace callgate {
namespace engine {
namespace common {

// JSON-backed configuration with dot-notation lookup ("throttle.retry_delay_ms")
// and string overrides that take precedence over the loaded document.
class ConfigManager {
 public:
  ConfigManager() = default;
  ~ConfigManager() = default;

  // Load configuration from JSON file
  bool LoadFromFile(const std::string& config_path);

  // Load configuration from an in-memory JSON document
  bool LoadFromString(const std::string& json_text);

  // Log the loaded document
  void PrintAllConfig() const;

  std::string GetString(const std::string& key, const std::string& default_value = "") const;
  int GetInt(const std::string& key, int default_value = 0) const;

  // Integer millisecond value, e.g. "shop.timeout_ms"
  std::chrono::milliseconds GetMilliseconds(const std::string& key,
                                            std::chrono::milliseconds default_value) const;

  // Check whether a key resolves to a non-null node or an override
  bool Has(const std::string& key) const;

  // Overrides (command line, tests)
  void SetString(const std::string& key, const std::string& value);

 private:
  bool AcceptRoot(nlohmann::json root, const std::string& source);
  const nlohmann::json* FindNode(const std::string& key) const;
  const std::string* FindOverride(const std::string& key) const;

  nlohmann::json config_root_;
  std::unordered_map<std::string, std::string> overrides_;
};

}  // namespace common
}  // namespace engine
}  // namespace callgate
