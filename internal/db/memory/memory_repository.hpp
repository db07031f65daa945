#pragma once

#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/db/api/repository.hpp"

namespace scanhub::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  std::optional<model::PairingRecord> MarkLatestOverwritten(Transaction&, int64_t product) override;
  Result InsertPairing(Transaction&, model::PairingRecord& record) override;
  Result UpdateSyncStatus(Transaction&, int64_t id, model::SyncStatus status, const std::string& diagnostic) override;
  std::optional<model::PairingRecord> GetPairing(Transaction&, int64_t id) override;
  std::optional<int64_t> FindLatestPlatformForIdentity(Transaction&, const std::string& login) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::map<int64_t, model::PairingRecord> pairings;

    // newest record id per product / per login
    std::unordered_map<int64_t, int64_t>     latest_by_product;
    std::unordered_map<std::string, int64_t> latest_by_login;

    int64_t next_id = 1;
  };

  // Held by a MemoryTransaction for its whole lifetime.
  std::mutex tx_mutex_;
  State      committed_;
};

}
