#include "internal/observability/logging.hpp"

#include <cassert>
#include <cstdlib>
#include <iostream>

#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace {

using shortener::observability::BindBackend;
using shortener::observability::FormatLine;
using shortener::observability::IntField;
using shortener::observability::StringField;

void TestPlainFieldsAreKeyValue() {
  const auto line = FormatLine("delete batch accepted", {StringField("user_id", "u1"), IntField("count", 3)});
  assert(line == "delete batch accepted user_id=u1 count=3");
}

void TestValuesWithSpacesAreQuoted() {
  const auto line = FormatLine("request failed", {StringField("error", "error saving URL https://a.example as id1: \"io\"")});
  assert(line == "request failed error=\"error saving URL https://a.example as id1: \\\"io\\\"\"");

  assert(FormatLine("x", {StringField("url", "https://a.example/?q=1")}) == "x url=\"https://a.example/?q=1\"");
  assert(FormatLine("x", {StringField("user_id", "")}) == "x user_id=\"\"");
}

void TestBoundBackendTagsEveryLine() {
  BindBackend("sqlite");
  assert(FormatLine("shortener service ready", {IntField("delete_workers", 4)}) ==
         "shortener service ready delete_workers=4 backend=sqlite");
  assert(FormatLine("ping", {}) == "ping backend=sqlite");

  BindBackend("");
  assert(FormatLine("ping", {}) == "ping");
}

void TestUnknownLevelFallsBackToInfo() {
  unsetenv("SHORTENER_LOG_LEVEL");

  shortener::runtime::config::RuntimeConfig config;
  config.mutable_logging()->set_level("verbose");
  shortener::observability::InitializeLogging(config);
  assert(spdlog::default_logger()->level() == spdlog::level::info);

  config.mutable_logging()->set_level("warn");
  shortener::observability::InitializeLogging(config);
  assert(spdlog::default_logger()->level() == spdlog::level::warn);

  shortener::observability::ShutdownLogging();
}

} // namespace

int main() {
  TestPlainFieldsAreKeyValue();
  TestValuesWithSpacesAreQuoted();
  TestBoundBackendTagsEveryLine();
  TestUnknownLevelFallsBackToInfo();

  std::cout << "logging_test: pass\n";
  return 0;
}
