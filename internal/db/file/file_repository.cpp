#include "file_repository.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "shortener/v1/url_record.pb.h"

namespace shortener::db::file {

namespace fs = std::filesystem;

using observability::IntField;
using observability::StringField;

namespace {

void ThrowIfCancelled(const CancellationToken& ctx, const char* op) {
  if (ctx.IsCancelled()) {
    throw util::Cancelled(std::string("file storage: ") + op + " cancelled");
  }
}

bool IsBlank(const std::string& text) {
  return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
}

} // namespace

FileRepository::FileRepository(std::string path) : path_(std::move(path)) {
  if (path_.empty()) {
    throw std::runtime_error("file storage path is empty");
  }

  Load();

  std::error_code ec;
  if (!fs::exists(path_, ec)) {
    // proves the location is writable before the selector commits to it
    auto created = Flush();
    if (!created) {
      throw std::runtime_error("cannot create file storage " + path_ + ": " + created.message);
    }
  }

  flusher_ = std::thread(&FileRepository::RunFlusher, this);
}

FileRepository::~FileRepository() {
  {
    std::lock_guard lock(flusher_mutex_);
    stop_ = true;
  }
  flusher_cv_.notify_all();
  if (flusher_.joinable()) flusher_.join();

  // no-op when nothing changed since the last rewrite
  auto result = Flush();
  if (!result) {
    SHORTENER_LOG_ERROR("final file storage flush failed", {StringField("path", path_), StringField("error", result.Describe())});
  }
}

void FileRepository::Load() {
  std::error_code ec;
  if (!fs::exists(path_, ec)) {
    return;
  }

  std::ifstream in(path_);
  if (!in) {
    throw std::runtime_error("cannot open file storage " + path_);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  const auto json = buffer.str();
  if (IsBlank(json)) {
    return;
  }

  shortener::v1::UrlRecordSet set;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(json, &set, options);
  if (!status.ok()) {
    throw std::runtime_error("cannot parse file storage " + path_ + ": " + status.ToString());
  }

  for (const auto& r : set.records()) {
    urls_[r.short_id()] = model::UrlRecord{r.short_id(), r.original_url(), r.user_id(), r.is_deleted()};
  }

  SHORTENER_LOG_INFO("file storage loaded", {StringField("path", path_), IntField("records", static_cast<std::int64_t>(urls_.size()))});
}

// ------------------------------------------------------------------
// Writes
// ------------------------------------------------------------------

Result FileRepository::Save(const CancellationToken& ctx, const std::string& short_id, const std::string& original_url,
                            const std::string& user_id) {
  if (ctx.IsCancelled()) return Result::Err(ErrorCode::Cancelled, "save cancelled");

  {
    std::unique_lock lock(mutex_);
    if (urls_.contains(short_id)) return Result::Err(ErrorCode::AlreadyExists, "short id " + short_id + " already exists");
    urls_[short_id] = model::UrlRecord{short_id, original_url, user_id, false};
    ++generation_;
  }

  RequestFlush();
  return Result::Ok();
}

Result FileRepository::SaveBatch(const CancellationToken& ctx, const UrlBatch& items, const std::string& user_id) {
  if (ctx.IsCancelled()) return Result::Err(ErrorCode::Cancelled, "save batch cancelled");

  {
    std::unique_lock lock(mutex_);
    for (const auto& [short_id, _] : items) {
      if (urls_.contains(short_id)) return Result::Err(ErrorCode::AlreadyExists, "short id " + short_id + " already exists");
    }
    for (const auto& [short_id, original_url] : items) {
      urls_[short_id] = model::UrlRecord{short_id, original_url, user_id, false};
    }
    ++generation_;
  }

  RequestFlush();
  return Result::Ok();
}

Result FileRepository::DeleteURLs(const CancellationToken& ctx, const std::vector<std::string>& short_ids,
                                  const std::string& user_id) {
  if (ctx.IsCancelled()) return Result::Err(ErrorCode::Cancelled, "delete cancelled");

  bool changed = false;
  {
    std::unique_lock lock(mutex_);
    for (const auto& short_id : short_ids) {
      auto it = urls_.find(short_id);
      if (it != urls_.end() && it->second.user_id == user_id && !it->second.is_deleted) {
        it->second.is_deleted = true;
        changed               = true;
      }
    }
    if (changed) ++generation_;
  }

  if (changed) RequestFlush();
  return Result::Ok();
}

// ------------------------------------------------------------------
// Reads
// ------------------------------------------------------------------

std::optional<std::string> FileRepository::Get(const CancellationToken&, const std::string& short_id) {
  std::shared_lock lock(mutex_);
  auto it = urls_.find(short_id);
  if (it == urls_.end() || it->second.is_deleted) return std::nullopt;
  return it->second.original_url;
}

std::optional<std::string> FileRepository::FindByOriginalURL(const CancellationToken& ctx, const std::string& original_url) {
  ThrowIfCancelled(ctx, "find by original url");

  std::shared_lock lock(mutex_);
  for (const auto& [short_id, record] : urls_) {
    if (!record.is_deleted && record.original_url == original_url) return short_id;
  }
  return std::nullopt;
}

std::vector<UserUrl> FileRepository::GetURLsByUserID(const CancellationToken& ctx, const std::string& user_id) {
  ThrowIfCancelled(ctx, "list by user");

  std::shared_lock lock(mutex_);
  std::vector<UserUrl> out;
  for (const auto& [short_id, record] : urls_) {
    if (!record.is_deleted && record.user_id == user_id) out.push_back({short_id, record.original_url});
  }
  return out;
}

Result FileRepository::Ping(const CancellationToken&) {
  return Result::Err(ErrorCode::Unsupported, "file storage does not support database connection check");
}

// ------------------------------------------------------------------
// Flushing
// ------------------------------------------------------------------

Result FileRepository::Flush() {
  std::lock_guard flush_lock(flush_mutex_);

  shortener::v1::UrlRecordSet set;
  uint64_t                    generation = 0;
  {
    std::shared_lock lock(mutex_);
    generation = generation_;
    for (const auto& [_, record] : urls_) {
      auto* r = set.add_records();
      r->set_short_id(record.short_id);
      r->set_original_url(record.original_url);
      r->set_user_id(record.user_id);
      r->set_is_deleted(record.is_deleted);
    }
  }

  std::error_code ec;
  if (generation == flushed_generation_ && fs::exists(path_, ec)) {
    return Result::Ok();
  }

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.preserve_proto_field_names    = true;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(set, &json, options);
  if (!status.ok()) {
    return Result::Err(ErrorCode::InternalError, "serialize file storage: " + status.ToString());
  }

  const auto tmp_path = path_ + ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::trunc);
    if (!out) {
      return Result::Err(ErrorCode::IOError, "open " + tmp_path + " for writing");
    }
    out << json;
    out.flush();
    if (!out) {
      return Result::Err(ErrorCode::IOError, "write " + tmp_path);
    }
  }

  fs::rename(tmp_path, path_, ec);
  if (ec) {
    const auto reason = ec.message();
    fs::remove(tmp_path, ec);
    return Result::Err(ErrorCode::IOError, "rename " + tmp_path + ": " + reason);
  }

  flushed_generation_ = generation;
  return Result::Ok();
}

void FileRepository::RequestFlush() {
  {
    std::lock_guard lock(flusher_mutex_);
    flush_requested_ = true;
  }
  flusher_cv_.notify_all();
}

void FileRepository::WaitForPendingFlushes() {
  std::unique_lock lock(flusher_mutex_);
  flusher_cv_.wait(lock, [this] { return stop_ || (!flush_requested_ && !flushing_); });
}

void FileRepository::RunFlusher() {
  std::unique_lock lock(flusher_mutex_);
  for (;;) {
    flusher_cv_.wait(lock, [this] { return stop_ || flush_requested_; });
    if (!flush_requested_) {
      break;
    }

    flush_requested_ = false;
    flushing_        = true;
    lock.unlock();

    auto result = Flush();
    if (!result) {
      SHORTENER_LOG_ERROR("file storage flush failed", {StringField("path", path_), StringField("error", result.Describe())});
    }

    lock.lock();
    flushing_ = false;
    flusher_cv_.notify_all();
  }
}

} // namespace shortener::db::file
