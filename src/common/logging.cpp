#include "common/logging.h"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace chadbuffer {
namespace common {

LogLevel Logger::parse_level(const std::string &name) {
  if (name == "trace")
    return LogLevel::TRACE;
  if (name == "debug")
    return LogLevel::DEBUG;
  if (name == "warn")
    return LogLevel::WARN;
  if (name == "error")
    return LogLevel::ERROR;
  if (name == "critical")
    return LogLevel::CRITICAL;
  return LogLevel::INFO;
}

std::string Logger::level_to_string(LogLevel level) {
  switch (level) {
  case LogLevel::TRACE:
    return "TRACE";
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  case LogLevel::ERROR:
    return "ERROR";
  case LogLevel::CRITICAL:
    return "CRITICAL";
  default:
    return "UNKNOWN";
  }
}

std::string Logger::escape_json_string(const std::string &input) const {
  std::ostringstream escaped;
  for (char c : input) {
    switch (c) {
    case '"':
      escaped << "\\\"";
      break;
    case '\\':
      escaped << "\\\\";
      break;
    case '\n':
      escaped << "\\n";
      break;
    case '\r':
      escaped << "\\r";
      break;
    case '\t':
      escaped << "\\t";
      break;
    default:
      if (c >= 0 && c < 32) {
        escaped << "\\u" << std::hex << std::setfill('0') << std::setw(4)
                << static_cast<int>(c);
      } else {
        escaped << c;
      }
      break;
    }
  }
  return escaped.str();
}

std::string Logger::format_json(const LogEntry &entry) const {
  std::ostringstream json;

  auto time_t = std::chrono::system_clock::to_time_t(entry.timestamp);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                entry.timestamp.time_since_epoch()) %
            1000;

  json << "{" << "\"timestamp\":\""
       << std::put_time(std::gmtime(&time_t), "%Y-%m-%dT%H:%M:%S") << "."
       << std::setfill('0') << std::setw(3) << ms.count() << "Z\","
       << "\"level\":\"" << level_to_string(entry.level) << "\","
       << "\"module\":\"" << escape_json_string(entry.module) << "\","
       << "\"message\":\"" << escape_json_string(entry.message) << "\"";

  if (!entry.error_code.empty()) {
    json << ",\"error_code\":\"" << escape_json_string(entry.error_code)
         << "\"";
  }

  if (!entry.context.empty()) {
    json << ",\"context\":{";
    bool first = true;
    for (const auto &[key, value] : entry.context) {
      if (!first)
        json << ",";
      json << "\"" << escape_json_string(key) << "\":\""
           << escape_json_string(value) << "\"";
      first = false;
    }
    json << "}";
  }

  json << "}";
  return json.str();
}

std::string Logger::format_text(const LogEntry &entry) const {
  std::ostringstream text;

  auto time_t = std::chrono::system_clock::to_time_t(entry.timestamp);

  text << "[" << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S")
       << "] " << "[" << level_to_string(entry.level) << "] " << "["
       << entry.module << "] " << entry.message;

  if (!entry.error_code.empty()) {
    text << " (error: " << entry.error_code << ")";
  }

  if (!entry.context.empty()) {
    text << " {";
    bool first = true;
    for (const auto &[key, value] : entry.context) {
      if (!first)
        text << ", ";
      text << key << "=" << value;
      first = false;
    }
    text << "}";
  }

  return text.str();
}

} // namespace common
} // namespace chadbuffer
