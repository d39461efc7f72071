#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <mutex>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace shortener::observability {
namespace {

constexpr const char* kLoggerName     = "shortener";
constexpr const char* kDefaultLevel   = "info";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

std::mutex  g_backend_mutex;
std::string g_backend;

std::string FromEnvOr(const char* name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(name); value && *value) return value;
  if (!configured.empty()) return configured;
  return fallback;
}

bool NeedsQuoting(std::string_view value) {
  if (value.empty()) return true;
  return value.find_first_of(" \t\"=\\") != std::string_view::npos;
}

void AppendValue(std::string& out, std::string_view value) {
  if (!NeedsQuoting(value)) {
    out.append(value);
    return;
  }

  out.push_back('"');
  for (char c : value) {
    if (c == '"' || c == '\\') out.push_back('\\');
    out.push_back(c);
  }
  out.push_back('"');
}

void AppendField(std::string& out, std::string_view key, std::string_view value) {
  out.push_back(' ');
  out.append(key);
  out.push_back('=');
  AppendValue(out, value);
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const shortener::runtime::config::RuntimeConfig& config) {
  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stderr_color_mt(kLoggerName);
  }
  logger->set_pattern(FromEnvOr("SHORTENER_LOG_PATTERN", config.logging().pattern(), kDefaultPattern));

  // spdlog maps unrecognized names to off, which would silence the service
  const auto level_name = FromEnvOr("SHORTENER_LOG_LEVEL", config.logging().level(), kDefaultLevel);
  auto       level      = spdlog::level::from_str(level_name);
  const bool unknown    = level == spdlog::level::off && level_name != "off";
  if (unknown) level = spdlog::level::info;

  logger->set_level(level);
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  if (unknown) LogWarn("unknown log level, using info", {StringField("level", level_name)});
}

void ShutdownLogging() {
  BindBackend({});
  spdlog::shutdown();
}

void BindBackend(std::string_view backend) {
  std::lock_guard lock(g_backend_mutex);
  g_backend = backend;
}

std::string FormatLine(std::string_view message, std::initializer_list<LogField> fields) {
  std::string line(message);
  for (const auto& field : fields) AppendField(line, field.key, field.value);

  std::lock_guard lock(g_backend_mutex);
  if (!g_backend.empty()) AppendField(line, "backend", g_backend);
  return line;
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) return;
  spdlog::log(level, "{}", FormatLine(message, fields));
}

} // namespace shortener::observability
