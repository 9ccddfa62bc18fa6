#pragma once

#include "cancellation.hpp"
#include "config_manager.hpp"
#include <atomic>
#include <csignal>
#include <string>

namespace callgate {
namespace engine {
namespace common {

/**
 * @brief Base application framework providing common infrastructure.
 *
 * Lifecycle:
 * 1. Initialize: parse --config_file, load config, set up logging and signals
 * 2. Start: OnStart() (derived class logic)
 * 3. Run: wait until SIGINT/SIGTERM or RequestStop()
 * 4. Stop: cancel the shared token, OnStop(), OnShutdown()
 *
 * Long-running work started in OnStart() should pass GetCancellationToken()
 * to blocking calls so that a signal aborts them promptly.
 */
class ApplicationKernel {
 public:
  ApplicationKernel();
  virtual ~ApplicationKernel();

  ApplicationKernel(const ApplicationKernel&) = delete;
  ApplicationKernel& operator=(const ApplicationKernel&) = delete;

  /**
   * @brief Main entry point for the application.
   * @return Exit code (0 for success, non-zero for error).
   */
  int Run(int argc, char** argv);

  /** @brief Ask the main loop to exit (thread-safe). */
  void RequestStop() { running_.store(false, std::memory_order_release); }

  ConfigManager& GetConfig() { return config_; }
  const ConfigManager& GetConfig() const { return config_; }

  const std::string& GetAppName() const { return app_name_; }
  void SetAppName(const std::string& name) { app_name_ = name; }

  /** @brief Token cancelled when the application begins stopping. */
  CancellationToken GetCancellationToken() const { return cancellation_.GetToken(); }

  /** @brief Exit code returned by Run(); derived classes may set it. */
  void SetExitCode(int code) { exit_code_ = code; }

 protected:
  /** @brief Called after config and logging are ready. */
  virtual void OnInitialize() {}

  /** @brief Called when application starts (begin processing). */
  virtual void OnStart() {}

  /** @brief Called after the cancellation token fired. */
  virtual void OnStop() {}

  /** @brief Called during final cleanup. */
  virtual void OnShutdown() {}

 private:
  bool Initialize(int argc, char** argv);
  std::string ParseCommandLineArguments(int argc, char** argv);
  void SetupSignalHandlers();
  static void SignalHandler(int signal);
  void Shutdown();

  std::string app_name_;
  ConfigManager config_;
  CancellationSource cancellation_;
  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_done_{false};
  int exit_code_{0};
  std::string loaded_config_file_;

  static std::atomic<ApplicationKernel*> instance_;  ///< For the signal handler
};

}  // namespace common
}  // namespace engine
}  // namespace callgate
