#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace shortener::db::postgres {

PgTransaction::PgTransaction(const std::shared_ptr<PgPool>& pool)
{
  conn_ = pool->Acquire();
  tx_ = std::make_unique<pqxx::work>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try { tx_->abort(); }
    catch (const std::exception& ex) {
      SHORTENER_LOG_WARN("postgres abort failed", {observability::StringField("error", ex.what())});
    }
  }
  // the work must go before its connection is handed back
  tx_.reset();
}

void PgTransaction::Commit() {
  tx_->commit();
  finished_ = true;
}

}
