#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/url_repository.hpp"
#include "internal/db/file/file_repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

#if SHORTENER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if SHORTENER_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using shortener::db::CancellationToken;
using shortener::db::ErrorCode;
using shortener::db::UrlRepository;
using shortener::db::file::FileRepository;
using shortener::db::memory::MemoryRepository;

const CancellationToken kCtx = CancellationToken::None();

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                          name;
  std::function<std::shared_ptr<UrlRepository>()>      make_repository;
  std::function<bool()>                                supports_restart;
  std::function<void(std::shared_ptr<UrlRepository>&)> restart;
  std::function<void()>                                cleanup;
  bool                                                 supports_ping = false;
};

bool HasUrl(const std::vector<shortener::db::UserUrl>& urls, const std::string& id, const std::string& original) {
  for (const auto& url : urls) {
    if (url.short_url == id && url.original_url == original) return true;
  }
  return false;
}

void VerifySaveGetFind(UrlRepository& repo, const std::string& p) {
  const auto url = "https://example.com/" + p + "/save";
  assert(repo.Save(kCtx, p + "s1", url, p + "user"));

  const auto got = repo.Get(kCtx, p + "s1");
  assert(got.has_value());
  assert(*got == url);

  const auto found = repo.FindByOriginalURL(kCtx, url);
  assert(found.has_value());
  assert(*found == p + "s1");

  assert(!repo.Get(kCtx, p + "missing").has_value());
  assert(!repo.FindByOriginalURL(kCtx, url + "/missing").has_value());
}

void VerifyDuplicateIdIsRejected(UrlRepository& repo, const std::string& p) {
  assert(repo.Save(kCtx, p + "dup", "https://example.com/" + p + "/first", p + "user"));

  const auto result = repo.Save(kCtx, p + "dup", "https://example.com/" + p + "/second", p + "other");
  assert(!result);
  assert(result.code == ErrorCode::AlreadyExists);
  assert(*repo.Get(kCtx, p + "dup") == "https://example.com/" + p + "/first");
}

void VerifySaveBatchIsAtomic(UrlRepository& repo, const std::string& p) {
  const auto user = p + "batch-user";
  assert(repo.SaveBatch(kCtx, {{p + "b1", "https://example.com/" + p + "/b"}, {p + "b2", "https://example.com/" + p + "/b"}}, user));
  assert(*repo.Get(kCtx, p + "b1") == "https://example.com/" + p + "/b");
  assert(*repo.Get(kCtx, p + "b2") == "https://example.com/" + p + "/b");

  const auto result = repo.SaveBatch(kCtx, {{p + "b3", "https://example.com/" + p + "/b3"}, {p + "b1", "https://example.com/" + p + "/x"}}, user);
  assert(!result);
  assert(result.code == ErrorCode::AlreadyExists);
  assert(!repo.Get(kCtx, p + "b3").has_value());
  assert(*repo.Get(kCtx, p + "b1") == "https://example.com/" + p + "/b");

  assert(repo.GetURLsByUserID(kCtx, user).size() == 2);
}

void VerifyOwnershipAndSoftDelete(UrlRepository& repo, const std::string& p) {
  const auto alice = p + "alice";
  const auto bob   = p + "bob";
  const auto a1    = "https://example.com/" + p + "/a1";
  const auto a2    = "https://example.com/" + p + "/a2";

  assert(repo.Save(kCtx, p + "a1", a1, alice));
  assert(repo.Save(kCtx, p + "a2", a2, alice));
  assert(repo.Save(kCtx, p + "ob1", "https://example.com/" + p + "/ob1", bob));

  auto listed = repo.GetURLsByUserID(kCtx, alice);
  assert(listed.size() == 2);
  assert(HasUrl(listed, p + "a1", a1));
  assert(HasUrl(listed, p + "a2", a2));

  // foreign and unknown ids are skipped without error
  assert(repo.DeleteURLs(kCtx, {p + "a1", p + "nope"}, bob));
  assert(repo.Get(kCtx, p + "a1").has_value());

  assert(repo.DeleteURLs(kCtx, {p + "a1"}, alice));
  assert(!repo.Get(kCtx, p + "a1").has_value());
  assert(!repo.FindByOriginalURL(kCtx, a1).has_value());

  listed = repo.GetURLsByUserID(kCtx, alice);
  assert(listed.size() == 1);
  assert(HasUrl(listed, p + "a2", a2));

  // deleting twice is harmless
  assert(repo.DeleteURLs(kCtx, {p + "a1"}, alice));

  // deleted url may be reused under a new id; the old id stays reserved
  assert(repo.Save(kCtx, p + "a3", a1, alice));
  assert(*repo.FindByOriginalURL(kCtx, a1) == p + "a3");
  assert(repo.Save(kCtx, p + "a1", a1, alice).code == ErrorCode::AlreadyExists);
}

void VerifyCancelledTokenIsHonored(UrlRepository& repo, const std::string& p) {
  CancellationToken ctx;
  ctx.Cancel();

  assert(repo.Save(ctx, p + "c1", "https://example.com/" + p + "/c", p + "user").code == ErrorCode::Cancelled);
  assert(repo.SaveBatch(ctx, {{p + "c2", "https://example.com/" + p + "/c2"}}, p + "user").code == ErrorCode::Cancelled);
  assert(repo.DeleteURLs(ctx, {p + "c1"}, p + "user").code == ErrorCode::Cancelled);
  assert(!repo.Get(kCtx, p + "c1").has_value());

  bool threw = false;
  try {
    repo.GetURLsByUserID(ctx, p + "user");
  } catch (const shortener::util::Cancelled&) {
    threw = true;
  }
  assert(threw);
}

void VerifyConcurrentWriters(UrlRepository& repo, const std::string& p) {
  constexpr int kThreads   = 4;
  constexpr int kPerThread = 25;

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < kPerThread; ++i) {
        const auto id = p + "w" + std::to_string(t) + "_" + std::to_string(i);
        assert(repo.Save(kCtx, id, "https://example.com/" + id, p + "writer"));
      }
    });
  }
  for (auto& thread : threads) thread.join();

  assert(repo.GetURLsByUserID(kCtx, p + "writer").size() == kThreads * kPerThread);
}

void VerifyPing(UrlRepository& repo, const BackendFactory& backend) {
  const auto result = repo.Ping(kCtx);
  if (backend.supports_ping) {
    assert(result);
  } else {
    assert(result.code == ErrorCode::Unsupported);
    assert(result.message == backend.name + " storage does not support database connection check");
  }
}

void VerifyRestartKeepsState(std::shared_ptr<UrlRepository>& repo, const BackendFactory& backend, const std::string& p) {
  assert(repo->Save(kCtx, p + "keep", "https://example.com/" + p + "/keep", p + "restart"));
  assert(repo->Save(kCtx, p + "drop", "https://example.com/" + p + "/drop", p + "restart"));
  assert(repo->DeleteURLs(kCtx, {p + "drop"}, p + "restart"));

  backend.restart(repo);

  assert(*repo->Get(kCtx, p + "keep") == "https://example.com/" + p + "/keep");
  assert(!repo->Get(kCtx, p + "drop").has_value());
  assert(repo->GetURLsByUserID(kCtx, p + "restart").size() == 1);
}

std::vector<BackendFactory> Backends() {
  std::vector<BackendFactory> backends;

  backends.push_back(BackendFactory{
      .name             = "memory",
      .make_repository  = [] { return std::make_shared<MemoryRepository>(); },
      .supports_restart = [] { return false; },
      .restart          = [](std::shared_ptr<UrlRepository>&) {},
      .cleanup          = [] {},
  });

  const auto dir = std::filesystem::temp_directory_path() / "shortener_repository_parity";
  std::filesystem::create_directories(dir);

  const auto file_path = (dir / "urls.json").string();
  backends.push_back(BackendFactory{
      .name = "file",
      .make_repository =
          [file_path] {
            std::filesystem::remove(file_path);
            return std::make_shared<FileRepository>(file_path);
          },
      .supports_restart = [] { return true; },
      .restart =
          [file_path](std::shared_ptr<UrlRepository>& repo) {
            repo.reset();
            repo = std::make_shared<FileRepository>(file_path);
          },
      .cleanup = [file_path] { std::filesystem::remove(file_path); },
  });

#if SHORTENER_DB_SQLITE
  const auto sqlite_path = (dir / "urls.db").string();
  backends.push_back(BackendFactory{
      .name = "sqlite",
      .make_repository =
          [sqlite_path] {
            for (const auto& suffix : {"", "-wal", "-shm"}) std::filesystem::remove(sqlite_path + suffix);
            return std::make_shared<shortener::db::sqlite::SqliteRepository>(std::make_shared<shortener::db::sqlite::SqliteDB>(sqlite_path));
          },
      .supports_restart = [] { return true; },
      .restart =
          [sqlite_path](std::shared_ptr<UrlRepository>& repo) {
            repo.reset();
            repo = std::make_shared<shortener::db::sqlite::SqliteRepository>(std::make_shared<shortener::db::sqlite::SqliteDB>(sqlite_path));
          },
      .cleanup =
          [sqlite_path] {
            for (const auto& suffix : {"", "-wal", "-shm"}) std::filesystem::remove(sqlite_path + suffix);
          },
      .supports_ping = true,
  });
#endif

#if SHORTENER_DB_POSTGRES
  if (const char* dsn = std::getenv("SHORTENER_TEST_POSTGRES_DSN"); dsn && *dsn) {
    const std::string conninfo = dsn;
    backends.push_back(BackendFactory{
        .name = "postgres",
        .make_repository =
            [conninfo] {
              return std::make_shared<shortener::db::postgres::PgRepository>(std::make_shared<shortener::db::postgres::PgPool>(conninfo));
            },
        .supports_restart = [] { return true; },
        .restart =
            [conninfo](std::shared_ptr<UrlRepository>& repo) {
              repo.reset();
              repo = std::make_shared<shortener::db::postgres::PgRepository>(std::make_shared<shortener::db::postgres::PgPool>(conninfo));
            },
        .cleanup       = [] {},
        .supports_ping = true,
    });
  } else {
    std::cout << "repository_parity_test: SHORTENER_TEST_POSTGRES_DSN not set, skipping postgres\n";
  }
#endif

  return backends;
}

void RunBackend(const BackendFactory& backend) {
  // ids are unique per run so a shared postgres database can be reused
  const auto p = backend.name + std::to_string(NowMs()) + "_";

  auto repo = backend.make_repository();
  assert(std::string(repo->Name()) == backend.name);

  VerifySaveGetFind(*repo, p);
  VerifyDuplicateIdIsRejected(*repo, p);
  VerifySaveBatchIsAtomic(*repo, p);
  VerifyOwnershipAndSoftDelete(*repo, p);
  VerifyCancelledTokenIsHonored(*repo, p);
  VerifyConcurrentWriters(*repo, p);
  VerifyPing(*repo, backend);

  if (backend.supports_restart()) {
    VerifyRestartKeepsState(repo, backend, p);
  }

  repo.reset();
  backend.cleanup();
  std::cout << "repository_parity_test: " << backend.name << " ok\n";
}

} // namespace

int main() {
  for (const auto& backend : Backends()) {
    RunBackend(backend);
  }

  std::cout << "repository_parity_test: pass\n";
  return 0;
}
