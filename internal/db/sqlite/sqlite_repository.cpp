#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace shortener::db::sqlite {

using shortener::db::ErrorCode;
using shortener::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

// finalizes on scope exit
struct Statement {
    sqlite3_stmt* st = nullptr;
    ~Statement() { sqlite3_finalize(st); }
};

static void ThrowIfCancelled(const CancellationToken& ctx, const char* op) {
    if (ctx.IsCancelled())
        throw util::Cancelled(std::string("sqlite storage: ") + op + " cancelled");
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {
    auto lock = db_->Lock();
    sql::RunMigrations(*db_, sql::UrlSchema());
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

Result SqliteRepository::Insert(sqlite3* db, const std::string& short_id, const std::string& original_url,
                                 const std::string& user_id) {
    Statement s;
    if (sqlite3_prepare_v2(db, sql::INSERT_URL, -1, &s.st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(s.st, 1, short_id);
    BindText(s.st, 2, original_url);
    BindText(s.st, 3, user_id);

    int rc = sqlite3_step(s.st);
    if (rc != SQLITE_DONE) {
        // extended code distinguishes a primary key clash from other constraints
        rc = sqlite3_extended_errcode(db);
    }
    return Translate(db, rc);
}

// ------------------------------------------------------------------
// Writes
// ------------------------------------------------------------------

Result SqliteRepository::Save(const CancellationToken& ctx, const std::string& short_id,
                              const std::string& original_url, const std::string& user_id) {
    if (ctx.IsCancelled()) return Result::Err(ErrorCode::Cancelled, "save cancelled");

    auto lock = db_->Lock();
    return Insert(db_->Handle(), short_id, original_url, user_id);
}

Result SqliteRepository::SaveBatch(const CancellationToken& ctx, const UrlBatch& items, const std::string& user_id) {
    if (ctx.IsCancelled()) return Result::Err(ErrorCode::Cancelled, "save batch cancelled");

    try {
        SqliteTransaction tx(db_);
        for (const auto& [short_id, original_url] : items) {
            auto result = Insert(tx.Handle(), short_id, original_url, user_id);
            if (!result) {
                tx.Rollback();
                return result;
            }
        }
        tx.Commit();
        return Result::Ok();
    } catch (const std::exception& e) {
        return Result::Err(ErrorCode::InternalError, e.what());
    }
}

Result SqliteRepository::DeleteURLs(const CancellationToken& ctx, const std::vector<std::string>& short_ids,
                                    const std::string& user_id) {
    if (ctx.IsCancelled()) return Result::Err(ErrorCode::Cancelled, "delete cancelled");

    try {
        SqliteTransaction tx(db_);
        for (const auto& short_id : short_ids) {
            Statement s;
            if (sqlite3_prepare_v2(tx.Handle(), sql::MARK_DELETED, -1, &s.st, nullptr) != SQLITE_OK)
                return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(tx.Handle()));

            BindText(s.st, 1, short_id);
            BindText(s.st, 2, user_id);

            auto result = Translate(tx.Handle(), sqlite3_step(s.st));
            if (!result) return result;
        }
        tx.Commit();
        return Result::Ok();
    } catch (const std::exception& e) {
        return Result::Err(ErrorCode::InternalError, e.what());
    }
}

// ------------------------------------------------------------------
// Reads
// ------------------------------------------------------------------

std::optional<std::string> SqliteRepository::Get(const CancellationToken&, const std::string& short_id) {
    auto  lock = db_->Lock();
    auto* db   = db_->Handle();

    Statement s;
    if (sqlite3_prepare_v2(db, sql::SELECT_BY_SHORT_ID, -1, &s.st, nullptr) != SQLITE_OK) {
        SHORTENER_LOG_ERROR("sqlite get failed", {observability::StringField("short_id", short_id),
                                                  observability::StringField("error", sqlite3_errmsg(db))});
        return std::nullopt;
    }

    BindText(s.st, 1, short_id);

    int rc = sqlite3_step(s.st);
    if (rc == SQLITE_ROW) return ColText(s.st, 0);
    if (rc != SQLITE_DONE) {
        SHORTENER_LOG_ERROR("sqlite get failed", {observability::StringField("short_id", short_id),
                                                  observability::StringField("error", sqlite3_errmsg(db))});
    }
    return std::nullopt;
}

std::optional<std::string> SqliteRepository::FindByOriginalURL(const CancellationToken& ctx,
                                                               const std::string& original_url) {
    ThrowIfCancelled(ctx, "find by original url");

    auto  lock = db_->Lock();
    auto* db   = db_->Handle();

    Statement s;
    if (sqlite3_prepare_v2(db, sql::SELECT_BY_ORIGINAL_URL, -1, &s.st, nullptr) != SQLITE_OK)
        throw util::StorageError(std::string("sqlite find by original url: ") + sqlite3_errmsg(db));

    BindText(s.st, 1, original_url);

    int rc = sqlite3_step(s.st);
    if (rc == SQLITE_ROW) return ColText(s.st, 0);
    if (rc != SQLITE_DONE)
        throw util::StorageError(std::string("sqlite find by original url: ") + sqlite3_errmsg(db));
    return std::nullopt;
}

std::vector<UserUrl> SqliteRepository::GetURLsByUserID(const CancellationToken& ctx, const std::string& user_id) {
    ThrowIfCancelled(ctx, "list by user");

    auto  lock = db_->Lock();
    auto* db   = db_->Handle();

    Statement s;
    if (sqlite3_prepare_v2(db, sql::SELECT_BY_USER_ID, -1, &s.st, nullptr) != SQLITE_OK)
        throw util::StorageError(std::string("sqlite list by user: ") + sqlite3_errmsg(db));

    BindText(s.st, 1, user_id);

    std::vector<UserUrl> out;
    int rc;
    while ((rc = sqlite3_step(s.st)) == SQLITE_ROW) {
        out.push_back({ColText(s.st, 0), ColText(s.st, 1)});
    }
    if (rc != SQLITE_DONE)
        throw util::StorageError(std::string("sqlite list by user: ") + sqlite3_errmsg(db));
    return out;
}

Result SqliteRepository::Ping(const CancellationToken& ctx) {
    if (ctx.IsCancelled()) return Result::Err(ErrorCode::Cancelled, "ping cancelled");

    auto lock = db_->Lock();
    try {
        db_->Exec(sql::PING);
        return Result::Ok();
    } catch (const std::exception& e) {
        return Result::Err(ErrorCode::IOError, e.what());
    }
}

} // namespace shortener::db::sqlite
