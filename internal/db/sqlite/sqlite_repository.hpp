#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace scanhub::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  std::optional<model::PairingRecord> MarkLatestOverwritten(Transaction&, int64_t product) override;
  Result InsertPairing(Transaction&, model::PairingRecord& record) override;
  Result UpdateSyncStatus(Transaction&, int64_t id, model::SyncStatus status, const std::string& diagnostic) override;
  std::optional<model::PairingRecord> GetPairing(Transaction&, int64_t id) override;
  std::optional<int64_t> FindLatestPlatformForIdentity(Transaction&, const std::string& login) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
