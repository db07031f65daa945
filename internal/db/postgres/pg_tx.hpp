#pragma once

#include <cstdint>
#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace scanhub::db::postgres {

/*
  One pqxx::work on a pooled connection. Destroying an unfinished
  transaction rolls it back before the connection returns to the pool.
*/
class PgTransaction final : public db::Transaction {
 public:
  explicit PgTransaction(std::shared_ptr<PgPool> pool);
  ~PgTransaction();

  pqxx::work& Work() {
    return *tx_;
  }

  // Serializes writers of one product until commit or rollback. Row locks
  // alone cannot cover a product that has no record yet.
  void LockProduct(int64_t product);

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

 private:
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work>       tx_;
  bool                              committed_ = false;
  bool                              finished_  = false;
};

} // namespace scanhub::db::postgres
