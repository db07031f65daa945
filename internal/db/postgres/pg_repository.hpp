#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace scanhub::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  std::optional<model::PairingRecord> MarkLatestOverwritten(Transaction&, int64_t product) override;
  Result InsertPairing(Transaction&, model::PairingRecord& record) override;
  Result UpdateSyncStatus(Transaction&, int64_t id, model::SyncStatus status, const std::string& diagnostic) override;
  std::optional<model::PairingRecord> GetPairing(Transaction&, int64_t id) override;
  std::optional<int64_t> FindLatestPlatformForIdentity(Transaction&, const std::string& login) override;

private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
};

}
