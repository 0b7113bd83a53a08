#include "util/logging.hpp"

#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace blockwire::util {

namespace {

struct LevelEntry {
  LogLevel level;
  const char* name;
};

constexpr LevelEntry kLevels[] = {
    {LogLevel::kDebug, "DEBUG"},
    {LogLevel::kInfo, "INFO"},
    {LogLevel::kWarn, "WARN"},
    {LogLevel::kError, "ERROR"},
};

// UTC, ISO-8601, second resolution.
std::string FormatUtc(std::chrono::system_clock::time_point when) {
  const std::time_t time = std::chrono::system_clock::to_time_t(when);
  std::tm tm_buf{};
#ifdef _WIN32
  gmtime_s(&tm_buf, &time);
#else
  gmtime_r(&time, &tm_buf);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

}  // namespace

const char* LogLevelName(LogLevel level) {
  for (const auto& entry : kLevels) {
    if (entry.level == level) return entry.name;
  }
  return "UNKNOWN";
}

LogLevel ParseLogLevelString(const std::string& value) {
  std::string upper;
  upper.reserve(value.size());
  for (char c : value) {
    upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  }
  if (upper == "WARNING") upper = "WARN";
  for (const auto& entry : kLevels) {
    if (upper == entry.name) return entry.level;
  }
  throw std::runtime_error("invalid log level: " + value);
}

void Logger::EnableFile(const std::string& path) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (stream_.is_open()) {
    stream_.close();
  }
  const auto parent = std::filesystem::path(path).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
  }
  stream_.open(path, std::ios::app);
  if (!stream_) {
    throw std::runtime_error("failed to open log file: " + path);
  }
}

void Logger::SetThreshold(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  level_threshold_ = level;
}

void Logger::Log(LogLevel level, const std::string& message) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (static_cast<int>(level) < static_cast<int>(level_threshold_)) {
    return;
  }
  std::ostringstream line;
  line << "[" << FormatUtc(std::chrono::system_clock::now()) << "] [" << LogLevelName(level)
       << "] " << message << '\n';
  if (stream_.is_open()) {
    stream_ << line.str();
    stream_.flush();
  } else {
    std::cerr << line.str();
  }
}

Logger& GlobalLogger() {
  static Logger logger;
  return logger;
}

void LogDebug(const std::string& message) { GlobalLogger().Log(LogLevel::kDebug, message); }
void LogInfo(const std::string& message) { GlobalLogger().Log(LogLevel::kInfo, message); }
void LogWarn(const std::string& message) { GlobalLogger().Log(LogLevel::kWarn, message); }
void LogError(const std::string& message) { GlobalLogger().Log(LogLevel::kError, message); }

}  // namespace blockwire::util
