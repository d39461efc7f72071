#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/loadgen/test_load.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/cancellation.hpp"

using shortener::util::CancellationToken;

namespace {

constexpr int kExitOk      = 0;
constexpr int kExitUsage   = 1;
constexpr int kExitFailure = 2;

void Usage() {
  std::cout << "Usage:\n"
            << "  shortenerctl [--config <yaml>] shorten <url> [--user U]\n"
            << "  shortenerctl [--config <yaml>] batch <correlation=url>... [--user U]\n"
            << "  shortenerctl [--config <yaml>] get <id>\n"
            << "  shortenerctl [--config <yaml>] list --user U\n"
            << "  shortenerctl [--config <yaml>] delete --user U <id>...\n"
            << "  shortenerctl [--config <yaml>] ping\n"
            << "  shortenerctl [--config <yaml>] backend\n"
            << "  shortenerctl [--config <yaml>] load <count>\n"
            << "\n"
            << "SERVER_ADDRESS, BASE_URL, DATABASE_DSN and FILE_STORAGE_PATH override the config file.\n";
}

struct Invocation {
  std::string              config_path;
  std::string              command;
  std::string              user;
  std::vector<std::string> args;
};

bool Parse(int argc, char** argv, Invocation& out) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" || arg == "--user") {
      if (i + 1 >= argc) return false;
      (arg == "--config" ? out.config_path : out.user) = argv[++i];
    } else if (out.command.empty()) {
      out.command = arg;
    } else {
      out.args.push_back(arg);
    }
  }
  return !out.command.empty();
}

int Run(const Invocation& inv, shortener::service::ShortenerService& service, const shortener::db::UrlRepository& repository) {
  const auto ctx = CancellationToken::None();

  if (inv.command == "shorten") {
    if (inv.args.size() != 1) return kExitUsage;
    auto result = service.Shorten(ctx, inv.args[0], inv.user);
    std::cout << result.short_url << (result.is_new ? "" : " (existing)") << "\n";
    return kExitOk;
  }

  if (inv.command == "batch") {
    if (inv.args.empty()) return kExitUsage;
    std::vector<shortener::model::BatchShortenRequest> items;
    for (const auto& arg : inv.args) {
      const auto eq = arg.find('=');
      if (eq == std::string::npos || eq == 0) {
        std::cerr << "expected <correlation>=<url>, got '" << arg << "'\n";
        return kExitUsage;
      }
      items.push_back({.correlation_id = arg.substr(0, eq), .original_url = arg.substr(eq + 1)});
    }
    for (const auto& result : service.ShortenBatch(ctx, items, inv.user)) {
      std::cout << result.correlation_id << "\t" << result.short_url << "\n";
    }
    return kExitOk;
  }

  if (inv.command == "get") {
    if (inv.args.size() != 1) return kExitUsage;
    auto url = service.Get(ctx, inv.args[0]);
    if (!url) {
      std::cerr << "not found: " << inv.args[0] << "\n";
      return kExitFailure;
    }
    std::cout << *url << "\n";
    return kExitOk;
  }

  if (inv.command == "list") {
    if (inv.user.empty() || !inv.args.empty()) return kExitUsage;
    for (const auto& url : service.GetURLsByUserID(ctx, inv.user)) {
      std::cout << url.short_url << "\t" << url.original_url << "\n";
    }
    return kExitOk;
  }

  if (inv.command == "delete") {
    if (inv.user.empty() || inv.args.empty()) return kExitUsage;
    service.DeleteURLs(ctx, inv.args, inv.user);
    std::cout << "accepted " << inv.args.size() << "\n";
    return kExitOk;
  }

  if (inv.command == "ping") {
    if (!inv.args.empty()) return kExitUsage;
    const auto result = service.Ping(ctx);
    if (result.IsUnsupported()) {
      std::cout << "unsupported\n";
      return kExitOk;
    }
    if (!result) {
      std::cerr << "ping failed: " << result.Describe() << "\n";
      return kExitFailure;
    }
    std::cout << "ok\n";
    return kExitOk;
  }

  if (inv.command == "backend") {
    if (!inv.args.empty()) return kExitUsage;
    std::cout << repository.Name() << "\n";
    return kExitOk;
  }

  if (inv.command == "load") {
    if (inv.args.size() != 1) return kExitUsage;
    std::size_t count = 0;
    try {
      count = std::stoul(inv.args[0]);
    } catch (const std::exception&) {
      std::cerr << "invalid count: " << inv.args[0] << "\n";
      return kExitUsage;
    }
    const auto report = shortener::loadgen::GenerateTestLoad(service, count);
    std::cout << "shortened=" << report.shortened << " failed=" << report.failed << " listed=" << report.listed
              << " resolved=" << report.resolved << " missing=" << report.missing << "\n";
    return report.failed == 0 && report.missing == 0 ? kExitOk : kExitFailure;
  }

  std::cerr << "unknown command: " << inv.command << "\n";
  return kExitUsage;
}

} // namespace

int main(int argc, char** argv) {
  Invocation inv;
  if (!Parse(argc, argv, inv)) {
    Usage();
    return kExitUsage;
  }

  int code = kExitOk;
  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = inv.config_path.empty() ? shortener::config::ConfigLoader::Defaults()
                                          : shortener::config::ConfigLoader::LoadFromYaml(inv.config_path);
    shortener::config::ConfigLoader::ApplyEnvironment(config);

    shortener::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = shortener::factory::Build(config);

    code = Run(inv, *app.shortener_service, *app.repository);
    if (code == kExitUsage) Usage();

    // accepted deletions finish before the process exits
    app.Shutdown();
  } catch (const std::exception& e) {
    SHORTENER_LOG_ERROR("Fatal error", {shortener::observability::StringField("error", e.what())});
    code = kExitFailure;
  }

  shortener::observability::ShutdownLogging();
  return code;
}
