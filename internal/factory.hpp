#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/cache/user_url_cache.hpp"
#include "internal/db/api/url_repository.hpp"
#include "internal/deletion/delete_worker_pool.hpp"
#include "internal/generator/short_id_generator.hpp"
#include "internal/service/shortener_service.hpp"

namespace shortener::factory {

/*
  Application

  Owns all long-lived singletons used by the process.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::UrlRepository> repository;
  std::shared_ptr<generator::ShortIdGenerator> generator;
  std::shared_ptr<cache::UserUrlCache> cache;
  std::shared_ptr<deletion::DeleteWorkerPool> deletions;

  std::shared_ptr<service::ShortenerService> shortener_service;

  // Drains pending deletions and stops the workers.
  void Shutdown();
};

/*
  Build

  Constructs the entire backend based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place that picks concrete storage and generator types.
*/
Application Build(const shortener::runtime::config::RuntimeConfig& config);

} // namespace shortener::factory
