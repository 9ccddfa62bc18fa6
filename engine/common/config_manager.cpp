#include "config_manager.hpp"
#include <spdlog/spdlog.h>
#include <fstream>

namespace callgate {
namespace engine {
namespace common {

bool ConfigManager::LoadFromFile(const std::string& config_path) {
  std::ifstream file(config_path);
  if (!file.is_open()) {
    SPDLOG_WARN("Failed to open config file: {}", config_path);
    return false;
  }

  try {
    return AcceptRoot(nlohmann::json::parse(file), config_path);
  } catch (const nlohmann::json::exception& e) {
    SPDLOG_WARN("Failed to parse config {}: {}", config_path, e.what());
    return false;
  }
}

bool ConfigManager::LoadFromString(const std::string& json_text) {
  try {
    return AcceptRoot(nlohmann::json::parse(json_text), "<string>");
  } catch (const nlohmann::json::exception& e) {
    SPDLOG_WARN("Failed to parse inline config: {}", e.what());
    return false;
  }
}

bool ConfigManager::AcceptRoot(nlohmann::json root, const std::string& source) {
  if (!root.is_object()) {
    SPDLOG_WARN("Config {} loaded but root is not an object", source);
    return false;
  }
  config_root_ = std::move(root);
  SPDLOG_INFO("Loaded config from: {} (has {} top-level keys)", source, config_root_.size());
  return true;
}

void ConfigManager::PrintAllConfig() const {
  // Never log the access token verbatim
  nlohmann::json redacted = config_root_;
  if (redacted.is_object() && redacted.contains("shop") && redacted["shop"].is_object() &&
      redacted["shop"].contains("access_token")) {
    redacted["shop"]["access_token"] = "***";
  }
  SPDLOG_INFO("Effective config:\n{}", redacted.dump(2));
}

std::string ConfigManager::GetString(const std::string& key, const std::string& default_value) const {
  if (const std::string* value = FindOverride(key)) {
    return *value;
  }
  const nlohmann::json* node = FindNode(key);
  if (node && node->is_string()) {
    return node->get<std::string>();
  }
  SPDLOG_TRACE("GetString('{}'): not found, using default: {}", key, default_value);
  return default_value;
}

int ConfigManager::GetInt(const std::string& key, int default_value) const {
  if (const std::string* value = FindOverride(key)) {
    try {
      return std::stoi(*value);
    } catch (const std::exception& e) {
      SPDLOG_WARN("GetInt('{}'): bad override '{}': {}", key, *value, e.what());
      return default_value;
    }
  }
  const nlohmann::json* node = FindNode(key);
  if (node && node->is_number_integer()) {
    return node->get<int>();
  }
  SPDLOG_TRACE("GetInt('{}'): not found, using default {}", key, default_value);
  return default_value;
}

std::chrono::milliseconds ConfigManager::GetMilliseconds(
    const std::string& key, std::chrono::milliseconds default_value) const {
  int value = GetInt(key, static_cast<int>(default_value.count()));
  if (value < 0) {
    SPDLOG_WARN("GetMilliseconds('{}'): negative value {}, using default {}",
                key, value, default_value.count());
    return default_value;
  }
  return std::chrono::milliseconds(value);
}

bool ConfigManager::Has(const std::string& key) const {
  if (FindOverride(key)) {
    return true;
  }
  const nlohmann::json* node = FindNode(key);
  return node && !node->is_null();
}

void ConfigManager::SetString(const std::string& key, const std::string& value) {
  overrides_[key] = value;
}

const std::string* ConfigManager::FindOverride(const std::string& key) const {
  auto it = overrides_.find(key);
  return it == overrides_.end() ? nullptr : &it->second;
}

const nlohmann::json* ConfigManager::FindNode(const std::string& key) const {
  if (!config_root_.is_object()) {
    return nullptr;  // Config not loaded
  }

  // Walk "a.b.c" one segment at a time, skipping empty segments
  const nlohmann::json* node = &config_root_;
  size_t begin = 0;
  while (begin <= key.size()) {
    size_t end = key.find('.', begin);
    if (end == std::string::npos) {
      end = key.size();
    }
    if (end > begin) {
      std::string part = key.substr(begin, end - begin);
      if (!node->is_object()) {
        SPDLOG_DEBUG("FindNode('{}'): node is not an object at part '{}'", key, part);
        return nullptr;
      }
      auto it = node->find(part);
      if (it == node->end()) {
        return nullptr;
      }
      node = &*it;
    }
    begin = end + 1;
  }
  return node;
}

}  // namespace common
}  // namespace engine
}  // namespace callgate
