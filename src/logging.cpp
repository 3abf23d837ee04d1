#include "avlink/logging.h"

#include <iostream>
#include <sstream>

namespace avlink {

const char* LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "DEBUG";
    case LogLevel::kInfo:
      return "INFO";
    case LogLevel::kWarning:
      return "WARN";
    case LogLevel::kError:
      return "ERROR";
  }
  return "INFO";
}

std::string LogEvent::Format() const {
  std::ostringstream oss;
  oss << LogLevelName(level) << ' ' << component;
  if (!event.empty()) {
    oss << '.' << event;
  }
  oss << ": " << message;
  for (const auto& field : fields) {
    oss << ' ' << field.first << '=' << field.second;
  }
  return oss.str();
}

Logger::Logger(std::string component, LogCallback callback, LogLevel min_level)
    : component_(std::move(component)),
      callback_(std::move(callback)),
      min_level_(min_level) {}

void Logger::Log(LogLevel level, const std::string& event,
                 const std::string& message, Fields fields) const {
  if (level < min_level_) {
    return;
  }
  LogEvent log_event;
  log_event.level = level;
  log_event.component = component_;
  log_event.event = event;
  log_event.message = message;
  log_event.fields = std::move(fields);
  if (callback_) {
    try {
      callback_(log_event);
      return;
    } catch (const std::exception& ex) {
      std::cerr << "[avlink] log callback threw: " << ex.what() << std::endl;
    }
  }
  std::cerr << "[avlink] " << log_event.Format() << std::endl;
}

}  // namespace avlink
