#include "test_load.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <thread>

#include "internal/generator/short_id_generator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/shortener_service.hpp"
#include "internal/util/cancellation.hpp"

namespace shortener::loadgen {

using observability::IntField;
using observability::StringField;

namespace {

std::string IdFromShortUrl(const std::string& short_url) {
  const auto slash = short_url.rfind('/');
  return slash == std::string::npos ? short_url : short_url.substr(slash + 1);
}

} // namespace

LoadReport GenerateTestLoad(service::ShortenerService& service, std::size_t count) {
  const auto ctx = util::CancellationToken::None();

  LoadReport report;
  report.requested = count;

  SHORTENER_LOG_INFO("generating test load", {IntField("count", static_cast<std::int64_t>(count))});

  generator::RandomShortIdGenerator salt(4);
  const auto run = std::chrono::duration_cast<std::chrono::nanoseconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                       .count();

  for (std::size_t i = 0; i < count; ++i) {
    const auto url = "https://example.com/" + std::to_string(run) + "/" + std::to_string(i) + "/" + salt.Generate();
    try {
      service.Shorten(ctx, url, kTestUser);
      ++report.shortened;
    } catch (const std::exception& ex) {
      ++report.failed;
      SHORTENER_LOG_WARN("failed to shorten url during test load", {StringField("error", ex.what())});
    }

    // let background flushes breathe
    if (i % 100 == 99) std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }

  std::vector<model::UserUrl> urls;
  try {
    urls = service.GetURLsByUserID(ctx, kTestUser);
  } catch (const std::exception& ex) {
    SHORTENER_LOG_WARN("failed to list urls during test load", {StringField("error", ex.what())});
  }
  report.listed = urls.size();

  const auto sample = std::min(kResolveSample, urls.size());
  for (std::size_t i = 0; i < sample; ++i) {
    const auto id = IdFromShortUrl(urls[i].short_url);
    if (service.Get(ctx, id)) {
      ++report.resolved;
    } else {
      ++report.missing;
      SHORTENER_LOG_WARN("url not found during test load", {StringField("short_id", id)});
    }
  }

  SHORTENER_LOG_INFO("test load finished", {IntField("shortened", static_cast<std::int64_t>(report.shortened)),
                                            IntField("failed", static_cast<std::int64_t>(report.failed)),
                                            IntField("listed", static_cast<std::int64_t>(report.listed)),
                                            IntField("missing", static_cast<std::int64_t>(report.missing))});
  return report;
}

} // namespace shortener::loadgen
