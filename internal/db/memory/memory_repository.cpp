#include "memory_repository.hpp"

#include <mutex>

#include "internal/util/errors.hpp"

namespace shortener::db::memory {

namespace {

void ThrowIfCancelled(const CancellationToken& ctx, const char* op) {
  if (ctx.IsCancelled()) {
    throw util::Cancelled(std::string("memory storage: ") + op + " cancelled");
  }
}

} // namespace

MemoryRepository::MemoryRepository() = default;

Result MemoryRepository::Save(const CancellationToken& ctx, const std::string& short_id, const std::string& original_url,
                              const std::string& user_id) {
  if (ctx.IsCancelled()) return Result::Err(ErrorCode::Cancelled, "save cancelled");

  std::unique_lock lock(mutex_);
  if (urls_.contains(short_id)) return Result::Err(ErrorCode::AlreadyExists, "short id " + short_id + " already exists");

  urls_[short_id] = model::UrlRecord{short_id, original_url, user_id, false};
  return Result::Ok();
}

Result MemoryRepository::SaveBatch(const CancellationToken& ctx, const UrlBatch& items, const std::string& user_id) {
  if (ctx.IsCancelled()) return Result::Err(ErrorCode::Cancelled, "save batch cancelled");

  std::unique_lock lock(mutex_);
  for (const auto& [short_id, _] : items) {
    if (urls_.contains(short_id)) return Result::Err(ErrorCode::AlreadyExists, "short id " + short_id + " already exists");
  }
  for (const auto& [short_id, original_url] : items) {
    urls_[short_id] = model::UrlRecord{short_id, original_url, user_id, false};
  }
  return Result::Ok();
}

std::optional<std::string> MemoryRepository::Get(const CancellationToken&, const std::string& short_id) {
  std::shared_lock lock(mutex_);
  auto it = urls_.find(short_id);
  if (it == urls_.end() || it->second.is_deleted) return std::nullopt;
  return it->second.original_url;
}

std::optional<std::string> MemoryRepository::FindByOriginalURL(const CancellationToken& ctx, const std::string& original_url) {
  ThrowIfCancelled(ctx, "find by original url");

  std::shared_lock lock(mutex_);
  for (const auto& [short_id, record] : urls_) {
    if (!record.is_deleted && record.original_url == original_url) return short_id;
  }
  return std::nullopt;
}

std::vector<UserUrl> MemoryRepository::GetURLsByUserID(const CancellationToken& ctx, const std::string& user_id) {
  ThrowIfCancelled(ctx, "list by user");

  std::shared_lock lock(mutex_);
  std::vector<UserUrl> out;
  for (const auto& [short_id, record] : urls_) {
    if (!record.is_deleted && record.user_id == user_id) out.push_back({short_id, record.original_url});
  }
  return out;
}

Result MemoryRepository::DeleteURLs(const CancellationToken& ctx, const std::vector<std::string>& short_ids,
                                    const std::string& user_id) {
  if (ctx.IsCancelled()) return Result::Err(ErrorCode::Cancelled, "delete cancelled");

  std::unique_lock lock(mutex_);
  for (const auto& short_id : short_ids) {
    auto it = urls_.find(short_id);
    if (it != urls_.end() && it->second.user_id == user_id) it->second.is_deleted = true;
  }
  return Result::Ok();
}

Result MemoryRepository::Ping(const CancellationToken&) {
  return Result::Err(ErrorCode::Unsupported, "memory storage does not support database connection check");
}

std::size_t MemoryRepository::Size() const {
  std::shared_lock lock(mutex_);
  return urls_.size();
}

} // namespace shortener::db::memory
