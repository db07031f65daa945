#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace scanhub::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

std::optional<model::PairingRecord> MemoryRepository::MarkLatestOverwritten(Transaction& t, int64_t product) {
  auto& tx     = TX(t);
  auto  latest = tx.LatestForProduct(product);
  if (!latest) return std::nullopt;

  auto record = tx.Find(*latest);
  if (!record) return std::nullopt;

  auto marked      = *record;
  marked.overwrite = true;
  tx.Put(marked);
  return record;
}

Result MemoryRepository::InsertPairing(Transaction& t, model::PairingRecord& r) {
  auto& tx = TX(t);
  r.id     = tx.NextId();
  tx.Insert(r);
  return Result::Ok();
}

Result MemoryRepository::UpdateSyncStatus(Transaction& t, int64_t id, model::SyncStatus status, const std::string& diagnostic) {
  if (!model::IsTerminal(status)) {
    return Result::Err(ErrorCode::ConstraintViolation, "sync status can only move to success or failure");
  }

  auto& tx     = TX(t);
  auto  record = tx.Find(id);
  if (!record) return Result::Err(ErrorCode::NotFound, "pairing " + std::to_string(id) + " not found");
  if (model::IsTerminal(record->sync_status)) {
    return Result::Err(ErrorCode::Conflict, "pairing " + std::to_string(id) + " already " + std::string(model::ToString(record->sync_status)));
  }

  record->sync_status = status;
  record->sync_error  = diagnostic;
  tx.Put(*record);
  return Result::Ok();
}

std::optional<model::PairingRecord> MemoryRepository::GetPairing(Transaction& t, int64_t id) {
  return TX(t).Find(id);
}

std::optional<int64_t> MemoryRepository::FindLatestPlatformForIdentity(Transaction& t, const std::string& login) {
  auto& tx     = TX(t);
  auto  latest = tx.LatestForLogin(login);
  if (!latest) return std::nullopt;

  auto record = tx.Find(*latest);
  if (!record) return std::nullopt;
  return record->platform;
}

} // namespace scanhub::db::memory
