#include "logger.h"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <mutex>
#include <unistd.h>  // for write(), close()
#include <fcntl.h>   // for open()

namespace VigilLogger {

#ifdef VIGIL_DEBUG_BUILD
Level Logger::current_level_ = DEBUG;
#else
Level Logger::current_level_ = INFO;
#endif

static std::mutex log_mutex;
static std::ostream* log_stream = &std::cerr;
static std::string log_file_path_global;

void Logger::Init() {
#ifdef VIGIL_DEBUG_BUILD
  current_level_ = DEBUG;
#else
  current_level_ = INFO;
#endif
}

void Logger::Init(const std::string& log_file_path) {
  Init();

  // Probe the file once so a bad path is reported up front
  int fd = open(log_file_path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
  if (fd < 0) {
    std::cerr << "[Logger] ERROR: Failed to open log file: " << log_file_path << std::endl;
    return;
  }
  close(fd);

  std::lock_guard<std::mutex> lock(log_mutex);
  log_file_path_global = log_file_path;
}

void Logger::SetLevel(Level level) {
  current_level_ = level;
}

Level Logger::GetLevel() {
  return current_level_;
}

void Logger::SetOutputStream(std::ostream* stream) {
  std::lock_guard<std::mutex> lock(log_mutex);
  log_stream = stream;
}

std::ostream* Logger::GetOutputStream() {
  std::lock_guard<std::mutex> lock(log_mutex);
  return log_stream;
}

bool Logger::ParseLevel(const std::string& name, Level* level) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (lower == "debug") {
    *level = DEBUG;
  } else if (lower == "info") {
    *level = INFO;
  } else if (lower == "warn" || lower == "warning") {
    *level = WARN;
  } else if (lower == "error") {
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
  std::tm bt;
  localtime_r(&timer, &bt);

  std::ostringstream oss;
  oss << std::put_time(&bt, "%H:%M:%S");
  oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
  return oss.str();
}

std::string Logger::LevelToString(Level level) {
  switch (level) {
    case DEBUG: return "DEBUG";
    case INFO:  return "INFO ";
    case WARN:  return "WARN ";
    case ERROR: return "ERROR";
    default:    return "UNKNOWN";
  }
}

void Logger::Log(Level level, const std::string& component, const std::string& message) {
  if (level < current_level_) {
    return;
  }

  std::string log_line = "[" + GetTimestamp() + "] " +
                         "[" + LevelToString(level) + "] " +
                         "[" + component + "] " +
                         message + "\n";

  std::lock_guard<std::mutex> lock(log_mutex);

  if (log_stream) {
    *log_stream << log_line;
  }

  // O_APPEND keeps lines whole when several processes share the file
  if (!log_file_path_global.empty()) {
    int fd = open(log_file_path_global.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
    if (fd >= 0) {
      ssize_t bytes_written = write(fd, log_line.c_str(), log_line.length());
      (void)bytes_written;  // Logging never fails the caller
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

} // namespace VigilLogger
