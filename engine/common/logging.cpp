#include "logging.hpp"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <vector>

namespace callgate {
namespace engine {
namespace common {

namespace {
constexpr const char* LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v [%s:%#]";
}  // namespace

spdlog::level::level_enum ParseLogLevel(const std::string& level_name) {
  if (level_name == "trace") return spdlog::level::trace;
  if (level_name == "debug") return spdlog::level::debug;
  if (level_name == "info") return spdlog::level::info;
  if (level_name == "warn" || level_name == "warning") return spdlog::level::warn;
  if (level_name == "error") return spdlog::level::err;
  if (level_name == "critical") return spdlog::level::critical;
  if (level_name == "off") return spdlog::level::off;
  return spdlog::level::info;
}

void InitializeLogging(const ConfigManager& config, const std::string& logger_name) {
  std::string log_file_path = config.GetString("app.log.file", "logs/" + logger_name + ".log");
  std::string log_level_str = config.GetString("app.log.level", "info");
  spdlog::level::level_enum level = ParseLogLevel(log_level_str);

  std::string path_str = log_file_path;
  try {
    std::filesystem::path p = std::filesystem::absolute(log_file_path);
    path_str = p.string();
    if (p.has_parent_path()) {
      std::filesystem::create_directories(p.parent_path());
    }

    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path_str, true);
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    std::vector<spdlog::sink_ptr> sinks{file_sink, console_sink};

    auto logger = std::make_shared<spdlog::logger>(logger_name, sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->set_pattern(LOG_PATTERN);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
    spdlog::set_level(level);

    SPDLOG_INFO("Logging to file: {} with level: {}", path_str, log_level_str);
  } catch (const std::exception& e) {
    std::fprintf(stderr, "[%s] InitializeLogging failed (path=%s): %s\n",
                 logger_name.c_str(), path_str.c_str(), e.what());
    // Console only
    auto logger = spdlog::stdout_color_mt(logger_name + "_console");
    logger->set_pattern(LOG_PATTERN);
    spdlog::set_default_logger(logger);
    spdlog::set_level(level);
  }
}

}  // namespace common
}  // namespace engine
}  // namespace callgate
