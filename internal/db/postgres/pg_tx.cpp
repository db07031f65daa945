#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace scanhub::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) : conn_(pool->Acquire()) {
  tx_ = std::make_unique<pqxx::work>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      SCANHUB_LOG_ERROR("postgres rollback failed", {scanhub::observability::StringField("error", e.what())});
    }
  }
  // the work must be gone before its connection returns to the pool
  tx_.reset();
}

void PgTransaction::LockProduct(int64_t product) {
  tx_->exec_prepared("lock_product", product);
}

void PgTransaction::Commit() {
  finished_ = true;
  tx_->commit();
  committed_ = true;
}

void PgTransaction::Rollback() {
  finished_ = true;
  tx_->abort();
}

} // namespace scanhub::db::postgres
