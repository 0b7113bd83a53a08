#pragma once

#include <fstream>
#include <mutex>
#include <string>

namespace blockwire::util {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

const char* LogLevelName(LogLevel level);
// Throws std::runtime_error for unknown names.
LogLevel ParseLogLevelString(const std::string& value);

// Line-oriented, timestamped logger. Writes to stderr until a file is
// configured.
class Logger {
 public:
  void EnableFile(const std::string& path);
  void SetThreshold(LogLevel level);
  void Log(LogLevel level, const std::string& message);

 private:
  mutable std::mutex mutex_;
  std::ofstream stream_;
  LogLevel level_threshold_{LogLevel::kInfo};
};

Logger& GlobalLogger();

void LogDebug(const std::string& message);
void LogInfo(const std::string& message);
void LogWarn(const std::string& message);
void LogError(const std::string& message);

}  // namespace blockwire::util
