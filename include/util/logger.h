#ifndef VIGIL_LOGGER_H_
#define VIGIL_LOGGER_H_

#include <string>
#include <sstream>
#include <iostream>
#include <chrono>
#include <iomanip>

namespace VigilLogger {

enum Level {
  DEBUG,
  INFO,
  WARN,
  ERROR
};

class Logger {
public:
  static void Init();
  static void Init(const std::string& log_file_path);  // Also append to log file
  static void SetLevel(Level level);
  static Level GetLevel();

  // Redirect console output (stderr by default). Passing nullptr silences it.
  static void SetOutputStream(std::ostream* stream);
  static std::ostream* GetOutputStream();

  // Accepts debug|info|warn|error, case-insensitive
  static bool ParseLevel(const std::string& name, Level* level);

  static void Log(Level level, const std::string& component, const std::string& message);

  // Convenience methods
  static void Debug(const std::string& component, const std::string& message);
  static void Info(const std::string& component, const std::string& message);
  static void Warn(const std::string& component, const std::string& message);
  static void Error(const std::string& component, const std::string& message);

private:
  static Level current_level_;
  static std::string GetTimestamp();
  static std::string LevelToString(Level level);
};

} // namespace VigilLogger

// LOG_DEBUG only compiles in debug builds
#ifdef VIGIL_DEBUG_BUILD
  #define LOG_DEBUG(component, msg) VigilLogger::Logger::Debug(component, msg)
#else
  #define LOG_DEBUG(component, msg) ((void)0)
#endif

#define LOG_INFO(component, msg) VigilLogger::Logger::Info(component, msg)
#define LOG_WARN(component, msg) VigilLogger::Logger::Warn(component, msg)
#define LOG_ERROR(component, msg) VigilLogger::Logger::Error(component, msg)

#endif  // VIGIL_LOGGER_H_
