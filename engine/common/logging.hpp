#pragma once

#include "config_manager.hpp"
#include <spdlog/spdlog.h>
#include <string>

namespace callgate {
namespace engine {
namespace common {

// Map "trace" / "debug" / "info" / "warn" / "error" / "critical" / "off" to a
// spdlog level. Unknown names map to info.
spdlog::level::level_enum ParseLogLevel(const std::string& level_name);

// Install the default logger: file sink (app.log.file) plus colored console,
// level from app.log.level. Falls back to console-only if the file sink fails.
void InitializeLogging(const ConfigManager& config, const std::string& logger_name);

}  // namespace common
}  // namespace engine
}  // namespace callgate
