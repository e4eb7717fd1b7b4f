#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace lidar::runtime::config {
class RuntimeConfig;
}

namespace lidar::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DoubleField(std::string_view key, double value);

// lidarctl keeps stdout for command output and logs to stderr.
enum class LogSink {
  kStdout,
  kStderr,
};

void InitializeLogging(const lidar::runtime::config::RuntimeConfig& config, LogSink console = LogSink::kStdout);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace lidar::observability

#define LIDAR_LOG_INFO(message, ...) ::lidar::observability::LogInfo((message), ##__VA_ARGS__)
#define LIDAR_LOG_WARN(message, ...) ::lidar::observability::LogWarn((message), ##__VA_ARGS__)
#define LIDAR_LOG_ERROR(message, ...) ::lidar::observability::LogError((message), ##__VA_ARGS__)
