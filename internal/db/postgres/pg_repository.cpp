#include "pg_repository.hpp"

#include "internal/db/sql/migrations.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace shortener::db::postgres {

namespace {

class PgMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit PgMigrationExecutor(pqxx::work& tx) : tx_(tx) {
  }

  void ExecuteSQL(const std::string& sql) override {
    tx_.exec(sql);
  }

 private:
  pqxx::work& tx_;
};

void ThrowIfCancelled(const CancellationToken& ctx, const char* op) {
  if (ctx.IsCancelled()) {
    throw util::Cancelled(std::string("postgres storage: ") + op + " cancelled");
  }
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
  auto       conn = pool_->Connect();
  pqxx::work tx(*conn);
  PgMigrationExecutor executor(tx);
  sql::RunMigrations(executor, sql::UrlSchema());
  tx.commit();
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::Conflict, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Writes
// ------------------------------------------------------------------

Result PgRepository::Save(const CancellationToken& ctx, const std::string& short_id, const std::string& original_url,
                          const std::string& user_id) {
  if (ctx.IsCancelled()) return Result::Err(ErrorCode::Cancelled, "save cancelled");

  try {
    PgTransaction tx(pool_);
    tx.Work().exec_prepared("insert_url", short_id, original_url, user_id);
    tx.Commit();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::SaveBatch(const CancellationToken& ctx, const UrlBatch& items, const std::string& user_id) {
  if (ctx.IsCancelled()) return Result::Err(ErrorCode::Cancelled, "save batch cancelled");

  try {
    PgTransaction tx(pool_);
    for (const auto& [short_id, original_url] : items) {
      tx.Work().exec_prepared("insert_url", short_id, original_url, user_id);
    }
    tx.Commit();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteURLs(const CancellationToken& ctx, const std::vector<std::string>& short_ids,
                                const std::string& user_id) {
  if (ctx.IsCancelled()) return Result::Err(ErrorCode::Cancelled, "delete cancelled");

  try {
    PgTransaction tx(pool_);
    for (const auto& short_id : short_ids) {
      tx.Work().exec_prepared("mark_deleted", short_id, user_id);
    }
    tx.Commit();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Reads
// ------------------------------------------------------------------

std::optional<std::string> PgRepository::Get(const CancellationToken&, const std::string& short_id) {
  try {
    PgTransaction tx(pool_);
    auto res = tx.Work().exec_prepared("get_url", short_id);
    tx.Commit();
    if (res.empty()) return std::nullopt;
    return std::string(res[0][0].c_str());
  } catch (const std::exception& e) {
    SHORTENER_LOG_ERROR("postgres get failed", {observability::StringField("short_id", short_id),
                                                observability::StringField("error", e.what())});
    return std::nullopt;
  }
}

std::optional<std::string> PgRepository::FindByOriginalURL(const CancellationToken& ctx, const std::string& original_url) {
  ThrowIfCancelled(ctx, "find by original url");

  try {
    PgTransaction tx(pool_);
    auto res = tx.Work().exec_prepared("find_by_original_url", original_url);
    tx.Commit();
    if (res.empty()) return std::nullopt;
    return std::string(res[0][0].c_str());
  } catch (const std::exception& e) {
    throw util::StorageError(std::string("postgres find by original url: ") + e.what());
  }
}

std::vector<UserUrl> PgRepository::GetURLsByUserID(const CancellationToken& ctx, const std::string& user_id) {
  ThrowIfCancelled(ctx, "list by user");

  try {
    PgTransaction tx(pool_);
    auto res = tx.Work().exec_prepared("list_by_user", user_id);
    tx.Commit();

    std::vector<UserUrl> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      out.push_back({row[0].c_str(), row[1].c_str()});
    }
    return out;
  } catch (const std::exception& e) {
    throw util::StorageError(std::string("postgres list by user: ") + e.what());
  }
}

Result PgRepository::Ping(const CancellationToken& ctx) {
  if (ctx.IsCancelled()) return Result::Err(ErrorCode::Cancelled, "ping cancelled");

  try {
    auto                 conn = pool_->Acquire();
    pqxx::nontransaction ping(*conn);
    ping.exec("SELECT 1");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace shortener::db::postgres
