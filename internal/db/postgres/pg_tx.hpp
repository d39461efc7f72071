#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "pg_pool.hpp"

namespace shortener::db::postgres {

/*
  One pqxx::work on a pooled connection. Aborts on destruction unless
  committed; the connection returns to the pool afterwards.
*/
class PgTransaction final {
public:
  explicit PgTransaction(const std::shared_ptr<PgPool>& pool);
  ~PgTransaction();

  PgTransaction(const PgTransaction&)            = delete;
  PgTransaction& operator=(const PgTransaction&) = delete;

  pqxx::work& Work() { return *tx_; }

  void Commit();

private:
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work> tx_;
  bool finished_ = false;
};

}
