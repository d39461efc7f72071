#include "internal/db/memory/memory_repository.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using shortener::db::CancellationToken;
using shortener::db::ErrorCode;
using shortener::db::memory::MemoryRepository;

const CancellationToken kCtx = CancellationToken::None();

void TestSaveThenGet() {
  MemoryRepository repo;
  assert(repo.Save(kCtx, "abc", "https://example.com", "u1"));

  const auto url = repo.Get(kCtx, "abc");
  assert(url.has_value());
  assert(*url == "https://example.com");
  assert(!repo.Get(kCtx, "missing").has_value());
}

void TestDuplicateIdIsRejectedWithoutOverwrite() {
  MemoryRepository repo;
  assert(repo.Save(kCtx, "abc", "https://first.example", "u1"));

  const auto result = repo.Save(kCtx, "abc", "https://second.example", "u2");
  assert(!result);
  assert(result.code == ErrorCode::AlreadyExists);
  assert(*repo.Get(kCtx, "abc") == "https://first.example");
}

void TestSaveBatchIsAllOrNothing() {
  MemoryRepository repo;
  assert(repo.Save(kCtx, "taken", "https://taken.example", "u1"));

  const auto result = repo.SaveBatch(kCtx, {{"fresh", "https://fresh.example"}, {"taken", "https://other.example"}}, "u1");
  assert(result.code == ErrorCode::AlreadyExists);
  assert(!repo.Get(kCtx, "fresh").has_value());
  assert(repo.Size() == 1);

  assert(repo.SaveBatch(kCtx, {{"a", "https://a.example"}, {"b", "https://a.example"}}, "u1"));
  assert(repo.Size() == 3);
}

void TestFindByOriginalUrlSkipsDeleted() {
  MemoryRepository repo;
  assert(repo.Save(kCtx, "abc", "https://example.com", "u1"));
  assert(*repo.FindByOriginalURL(kCtx, "https://example.com") == "abc");

  assert(repo.DeleteURLs(kCtx, {"abc"}, "u1"));
  assert(!repo.FindByOriginalURL(kCtx, "https://example.com").has_value());

  // a deleted url may be shortened again under a new id
  assert(repo.Save(kCtx, "def", "https://example.com", "u1"));
  assert(*repo.FindByOriginalURL(kCtx, "https://example.com") == "def");
}

void TestListByUserReturnsOnlyLiveOwnedRecords() {
  MemoryRepository repo;
  assert(repo.Save(kCtx, "a1", "https://a1.example", "alice"));
  assert(repo.Save(kCtx, "a2", "https://a2.example", "alice"));
  assert(repo.Save(kCtx, "b1", "https://b1.example", "bob"));
  assert(repo.DeleteURLs(kCtx, {"a2"}, "alice"));

  const auto urls = repo.GetURLsByUserID(kCtx, "alice");
  assert(urls.size() == 1);
  assert(urls[0].short_url == "a1");
  assert(urls[0].original_url == "https://a1.example");
  assert(repo.GetURLsByUserID(kCtx, "nobody").empty());
}

void TestDeleteSkipsForeignIds() {
  MemoryRepository repo;
  assert(repo.Save(kCtx, "a1", "https://a1.example", "alice"));

  assert(repo.DeleteURLs(kCtx, {"a1", "missing"}, "bob"));
  assert(repo.Get(kCtx, "a1").has_value());

  assert(repo.DeleteURLs(kCtx, {"a1"}, "alice"));
  assert(!repo.Get(kCtx, "a1").has_value());
}

void TestPingIsUnsupported() {
  MemoryRepository repo;
  const auto       result = repo.Ping(kCtx);
  assert(result.IsUnsupported());
  assert(result.message == "memory storage does not support database connection check");
}

void TestCancelledTokenStopsWork() {
  MemoryRepository  repo;
  CancellationToken ctx;
  ctx.Cancel();

  assert(repo.Save(ctx, "abc", "https://example.com", "u1").code == ErrorCode::Cancelled);
  assert(repo.Size() == 0);

  bool threw = false;
  try {
    repo.FindByOriginalURL(ctx, "https://example.com");
  } catch (const shortener::util::Cancelled&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestSaveThenGet();
  TestDuplicateIdIsRejectedWithoutOverwrite();
  TestSaveBatchIsAllOrNothing();
  TestFindByOriginalUrlSkipsDeleted();
  TestListByUserReturnsOnlyLiveOwnedRecords();
  TestDeleteSkipsForeignIds();
  TestPingIsUnsupported();
  TestCancelledTokenStopsWork();

  std::cout << "memory_repository_test: pass\n";
  return 0;
}
