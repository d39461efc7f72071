#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace shortener::runtime::config {
class RuntimeConfig;
}

namespace shortener::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Level and pattern come from SHORTENER_LOG_LEVEL / SHORTENER_LOG_PATTERN,
// then the config, then defaults. An unknown level name falls back to info.
void InitializeLogging(const shortener::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

// Tags every later line with backend=<name>; set once the store is selected.
void BindBackend(std::string_view backend);

// message followed by key=value pairs. Values holding spaces, quotes or '='
// are double quoted with backslash escapes.
std::string FormatLine(std::string_view message, std::initializer_list<LogField> fields);

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

} // namespace shortener::observability

#define SHORTENER_LOG_INFO(message, ...) ::shortener::observability::LogInfo((message), ##__VA_ARGS__)
#define SHORTENER_LOG_WARN(message, ...) ::shortener::observability::LogWarn((message), ##__VA_ARGS__)
#define SHORTENER_LOG_ERROR(message, ...) ::shortener::observability::LogError((message), ##__VA_ARGS__)
