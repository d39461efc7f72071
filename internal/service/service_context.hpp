#pragma once

#include <memory>
#include <string>

namespace shortener::db { class UrlRepository; }
namespace shortener::generator { class ShortIdGenerator; }
namespace shortener::cache { class UserUrlCache; }
namespace shortener::deletion { class DeleteWorkerPool; }

namespace shortener::service {

/*
  Dependency container handed to the service.

  base_url is prepended verbatim to every id ("<base_url>/<id>"); it must
  not carry a trailing slash.
*/
struct ServiceContext {
  std::shared_ptr<shortener::db::UrlRepository> repository;
  std::shared_ptr<shortener::generator::ShortIdGenerator> generator;
  std::shared_ptr<shortener::cache::UserUrlCache> cache;
  std::shared_ptr<shortener::deletion::DeleteWorkerPool> deletions;
  std::string base_url;
};

}
