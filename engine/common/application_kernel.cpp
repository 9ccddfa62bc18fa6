#include "application_kernel.hpp"
#include "logging.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <stdexcept>
#include <thread>

namespace callgate {
namespace engine {
namespace common {

std::atomic<ApplicationKernel*> ApplicationKernel::instance_{nullptr};

ApplicationKernel::ApplicationKernel() : app_name_("callgate_app") {
  instance_.store(this);
}

ApplicationKernel::~ApplicationKernel() {
  Shutdown();
  ApplicationKernel* self = this;
  instance_.compare_exchange_strong(self, nullptr);
}

bool ApplicationKernel::Initialize(int argc, char** argv) {
  try {
    loaded_config_file_ = ParseCommandLineArguments(argc, argv);
    if (!config_.LoadFromFile(loaded_config_file_)) {
      throw std::runtime_error("Cannot load config file " + loaded_config_file_);
    }

    // Logging needs the config
    InitializeLogging(config_, app_name_);
    SPDLOG_INFO("Starting application: {} (config: {})", app_name_, loaded_config_file_);
    config_.PrintAllConfig();

    SetupSignalHandlers();

    try {
      OnInitialize();
    } catch (const std::exception& e) {
      SPDLOG_ERROR("OnInitialize hook failed: {}", e.what());
      return false;
    }
  } catch (const std::exception& e) {
    SPDLOG_ERROR("Initialization failed: {}", e.what());
    return false;
  }
  return true;
}

std::string ApplicationKernel::ParseCommandLineArguments(int argc, char** argv) {
  CLI::App app{app_name_};
  std::string config_file;
  app.add_option("--config_file", config_file, "Path to configuration file")
     ->required()
     ->check(CLI::ExistingFile);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    throw std::runtime_error(std::string("Command-line parsing error: ") + e.what());
  }
  return config_file;
}

int ApplicationKernel::Run(int argc, char** argv) {
  if (!Initialize(argc, argv)) {
    return 1;
  }

  running_ = true;
  try {
    OnStart();
  } catch (const std::exception& e) {
    SPDLOG_ERROR("Start failed: {}", e.what());
    Shutdown();
    return 1;
  }
  SPDLOG_INFO("Application {} started", app_name_);

  while (running_.load(std::memory_order_acquire)) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  SPDLOG_INFO("Stopping application {}", app_name_);
  Shutdown();
  SPDLOG_INFO("Application {} stopped", app_name_);
  return exit_code_;
}

void ApplicationKernel::SetupSignalHandlers() {
  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);
}

void ApplicationKernel::SignalHandler(int signal) {
  // Only lock-free atomics here; the main loop does the real work
  ApplicationKernel* app = instance_.load();
  if (app && (signal == SIGINT || signal == SIGTERM)) {
    app->running_.store(false, std::memory_order_release);
  }
}

void ApplicationKernel::Shutdown() {
  if (shutdown_done_.exchange(true)) {
    return;
  }
  running_ = false;

  // Abort anything still waiting on a bucket, a retry delay or the network
  cancellation_.Cancel();

  try {
    OnStop();
  } catch (const std::exception& e) {
    SPDLOG_ERROR("Stop hook exception: {}", e.what());
  }
  try {
    OnShutdown();
  } catch (const std::exception& e) {
    SPDLOG_ERROR("Shutdown hook exception: {}", e.what());
  }
}

}  // namespace common
}  // namespace engine
}  // namespace callgate
