#include "util/logger.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <fcntl.h>   // for open()
#include <unistd.h>  // for write(), close()

namespace warden {

#ifdef WARDEN_DEBUG_BUILD
LogLevel Logger::current_level_ = DEBUG;
#else
LogLevel Logger::current_level_ = INFO;
#endif

static std::mutex log_mutex;
static std::string log_file_path_global;

void Logger::Init() {
  std::lock_guard<std::mutex> lock(log_mutex);
#ifdef WARDEN_DEBUG_BUILD
  current_level_ = DEBUG;
#else
  current_level_ = INFO;
#endif
  log_file_path_global.clear();
}

bool Logger::Init(const std::string& log_file_path) {
  Init();

  // Probe once so a bad path is reported at startup rather than per line
  int fd = open(log_file_path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
  if (fd < 0) {
    std::cerr << "[Logger] ERROR: Failed to open log file: " << log_file_path << std::endl;
    return false;
  }
  close(fd);

  std::lock_guard<std::mutex> lock(log_mutex);
  log_file_path_global = log_file_path;
  return true;
}

void Logger::SetLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(log_mutex);
  current_level_ = level;
}

LogLevel Logger::GetLevel() {
  std::lock_guard<std::mutex> lock(log_mutex);
  return current_level_;
}

bool Logger::ParseLevel(const std::string& name, LogLevel* level) {
  if (name == "debug" || name == "DEBUG") {
    *level = DEBUG;
  } else if (name == "info" || name == "INFO") {
    *level = INFO;
  } else if (name == "warn" || name == "WARN" || name == "warning") {
    *level = WARN;
  } else if (name == "error" || name == "ERROR") {
    *level = ERROR;
  } else {
    return false;
  }
  return true;
}

std::string Logger::GetTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      now.time_since_epoch()) % 1000;
  auto timer = std::chrono::system_clock::to_time_t(now);
  std::tm bt{};
  localtime_r(&timer, &bt);

  std::ostringstream oss;
  oss << std::put_time(&bt, "%H:%M:%S");
  oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
  return oss.str();
}

std::string Logger::LevelToString(LogLevel level) {
  switch (level) {
    case DEBUG: return "DEBUG";
    case INFO:  return "INFO ";
    case WARN:  return "WARN ";
    case ERROR: return "ERROR";
    default:    return "UNKNOWN";
  }
}

void Logger::Log(LogLevel level, const std::string& component, const std::string& message) {
  std::lock_guard<std::mutex> lock(log_mutex);
  if (level < current_level_) {
    return;
  }

  std::string log_line = "[" + GetTimestamp() + "] " +
                         "[" + LevelToString(level) + "] " +
                         "[" + component + "] " +
                         message + "\n";

  std::cerr << log_line;

  // Open per line with O_APPEND so several processes can share one file
  if (!log_file_path_global.empty()) {
    int fd = open(log_file_path_global.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
    if (fd >= 0) {
      ssize_t bytes_written = write(fd, log_line.c_str(), log_line.length());
      (void)bytes_written;  // A failed log write must not fail the caller
      close(fd);
    }
  }
}

void Logger::Debug(const std::string& component, const std::string& message) {
  Log(DEBUG, component, message);
}

void Logger::Info(const std::string& component, const std::string& message) {
  Log(INFO, component, message);
}

void Logger::Warn(const std::string& component, const std::string& message) {
  Log(WARN, component, message);
}

void Logger::Error(const std::string& component, const std::string& message) {
  Log(ERROR, component, message);
}

} // namespace warden
