#include "factory.hpp"

#include <memory>
#include <string>

#include "internal/db/repository_selector.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"

namespace shortener::factory {

using observability::IntField;
using observability::StringField;

void Application::Shutdown() {
  if (deletions) deletions->Stop();
}

/*
    Build full application dependency graph
*/
Application Build(const shortener::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  app.repository = db::SelectRepository(config.database().dsn(), config.database().file_storage_path());
  observability::BindBackend(app.repository->Name());

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  const auto length = config.generator().length() == 0 ? generator::RandomShortIdGenerator::kDefaultLength
                                                        : static_cast<std::size_t>(config.generator().length());
  app.generator = std::make_shared<generator::RandomShortIdGenerator>(length);
  app.cache     = std::make_shared<cache::UserUrlCache>();

  // ------------------------------------------------------------------
  // Delete pipeline
  // ------------------------------------------------------------------
  const auto workers = config.deletion().workers() == 0 ? 4u : config.deletion().workers();
  app.deletions      = std::make_shared<deletion::DeleteWorkerPool>(app.repository, workers);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.repository = app.repository;
  ctx.generator  = app.generator;
  ctx.cache      = app.cache;
  ctx.deletions  = app.deletions;
  ctx.base_url   = config.server().base_url();

  app.shortener_service = std::make_shared<service::ShortenerService>(std::move(ctx));

  SHORTENER_LOG_INFO("shortener service ready", {StringField("base_url", config.server().base_url()),
                                                 IntField("delete_workers", workers)});
  return app;
}

} // namespace shortener::factory
