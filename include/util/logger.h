#ifndef WARDEN_LOGGER_H_
#define WARDEN_LOGGER_H_

#include <string>

namespace warden {

enum LogLevel {
  DEBUG,
  INFO,
  WARN,
  ERROR
};

// Process-wide diagnostic logger. Security events do not go through here
// implicitly; they are handed to an AuditSink (see audit/warden_audit_sink.h).
class Logger {
public:
  static void Init();
  static bool Init(const std::string& log_file_path);  // Also append to a file; false if unopenable
  static void SetLevel(LogLevel level);
  static LogLevel GetLevel();
  static void Log(LogLevel level, const std::string& component, const std::string& message);

  // Convenience methods
  static void Debug(const std::string& component, const std::string& message);
  static void Info(const std::string& component, const std::string& message);
  static void Warn(const std::string& component, const std::string& message);
  static void Error(const std::string& component, const std::string& message);

  // Parse "debug", "info", "warn", "error". Returns false on unknown names.
  static bool ParseLevel(const std::string& name, LogLevel* level);

private:
  static LogLevel current_level_;
  static std::string GetTimestamp();
  static std::string LevelToString(LogLevel level);
};

} // namespace warden

// LOG_DEBUG only compiles in debug builds
#ifdef WARDEN_DEBUG_BUILD
  #define LOG_DEBUG(component, msg) warden::Logger::Debug(component, msg)
#else
  #define LOG_DEBUG(component, msg) ((void)0)
#endif

#define LOG_INFO(component, msg) warden::Logger::Info(component, msg)
#define LOG_WARN(component, msg) warden::Logger::Warn(component, msg)
#define LOG_ERROR(component, msg) warden::Logger::Error(component, msg)

#endif  // WARDEN_LOGGER_H_
