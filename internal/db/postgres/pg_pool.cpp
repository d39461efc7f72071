#include "pg_pool.hpp"

namespace shortener::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto conn = Connect();
          PrepareStatements(*conn);
          return Wrap(conn.release());
        } catch (...) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

std::unique_ptr<pqxx::connection> PgPool::Connect() const {
  return std::make_unique<pqxx::connection>(conninfo_);
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("insert_url",
               "INSERT INTO urls(short_id,original_url,user_id) "
               "VALUES($1,$2,$3)");

  conn.prepare("get_url", "SELECT original_url FROM urls WHERE short_id=$1 AND is_deleted=FALSE");

  conn.prepare("find_by_original_url",
               "SELECT short_id FROM urls "
               "WHERE original_url=$1 AND is_deleted=FALSE LIMIT 1");

  conn.prepare("list_by_user", "SELECT short_id,original_url FROM urls WHERE user_id=$1 AND is_deleted=FALSE");

  conn.prepare("mark_deleted", "UPDATE urls SET is_deleted=TRUE WHERE short_id=$1 AND user_id=$2");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    if (conn->is_open()) {
      idle_.emplace_back(conn);
    } else {
      // broken connections are dropped, freeing a slot for a fresh one
      delete conn;
      --live_connections_;
    }
  }
  cv_.notify_one();
}

} // namespace shortener::db::postgres
