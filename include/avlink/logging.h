#pragma once

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace avlink {

enum class LogLevel {
  kDebug,
  kInfo,
  kWarning,
  kError,
};

const char* LogLevelName(LogLevel level);

/**
 * Structured log event emitted by the control plane (connect, disconnect,
 * command result, health transition, ...). Storage is up to the sink.
 */
struct LogEvent {
  LogLevel level = LogLevel::kInfo;
  /// Emitting component, e.g. "registry", "health".
  std::string component;
  /// Event name, e.g. "connect_failed".
  std::string event;
  std::string message;
  std::vector<std::pair<std::string, std::string>> fields;

  /// Single line rendering: "LEVEL component.event: message k=v ...".
  std::string Format() const;
};

using LogCallback = std::function<void(const LogEvent&)>;

/**
 * Small logging front end shared by components. Events go to the configured
 * callback, or to stderr when none is set.
 */
class Logger {
 public:
  using Fields = std::vector<std::pair<std::string, std::string>>;

  Logger() = default;
  Logger(std::string component, LogCallback callback,
         LogLevel min_level = LogLevel::kInfo);

  void Log(LogLevel level, const std::string& event, const std::string& message,
           Fields fields = {}) const;

  void Debug(const std::string& event, const std::string& message,
             Fields fields = {}) const {
    Log(LogLevel::kDebug, event, message, std::move(fields));
  }
  void Info(const std::string& event, const std::string& message,
            Fields fields = {}) const {
    Log(LogLevel::kInfo, event, message, std::move(fields));
  }
  void Warn(const std::string& event, const std::string& message,
            Fields fields = {}) const {
    Log(LogLevel::kWarning, event, message, std::move(fields));
  }
  void Error(const std::string& event, const std::string& message,
             Fields fields = {}) const {
    Log(LogLevel::kError, event, message, std::move(fields));
  }

  const std::string& component() const { return component_; }

 private:
  std::string component_;
  LogCallback callback_;
  LogLevel min_level_ = LogLevel::kInfo;
};

}  // namespace avlink
