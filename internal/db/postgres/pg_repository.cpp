#include "pg_repository.hpp"

#include <string>

namespace scanhub::db::postgres {

namespace {

// Column order matches the latest_pairing_for_product / get_pairing statements.
model::PairingRecord ReadPairing(const pqxx::row& row) {
  model::PairingRecord r;
  r.id            = row[0].as<int64_t>();
  r.login         = row[1].c_str();
  r.platform      = row[2].as<int64_t>();
  r.product       = row[3].as<int64_t>();
  r.scanned_at_ms = row[4].as<uint64_t>();
  r.overwrite     = row[5].as<bool>();
  r.sync_status   = static_cast<model::SyncStatus>(row[6].as<int>());
  r.sync_error    = row[7].is_null() ? "" : row[7].c_str();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

std::optional<model::PairingRecord> PgRepository::MarkLatestOverwritten(Transaction& t, int64_t product) {
  auto& tx   = TX(t);
  auto& work = tx.Work();

  tx.LockProduct(product);

  auto res = work.exec_prepared("latest_pairing_for_product", product);
  if (res.empty()) return std::nullopt;

  auto latest = ReadPairing(res[0]);
  work.exec_prepared("mark_pairing_overwritten", latest.id);
  return latest;
}

Result PgRepository::InsertPairing(Transaction& t, model::PairingRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_pairing", r.login, r.platform, r.product, static_cast<int64_t>(r.scanned_at_ms));
    r.id     = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateSyncStatus(Transaction& t, int64_t id, model::SyncStatus status, const std::string& diagnostic) {
  if (!model::IsTerminal(status)) {
    return Result::Err(ErrorCode::ConstraintViolation, "sync status can only move to success or failure");
  }

  try {
    auto& work = TX(t).Work();
    std::optional<std::string> error;
    if (!diagnostic.empty()) error = diagnostic;

    auto res = work.exec_prepared("update_sync_status", id, static_cast<int>(status), error);
    if (res.affected_rows() == 0) {
      auto existing = work.exec_prepared("get_pairing", id);
      if (existing.empty()) {
        return Result::Err(ErrorCode::NotFound, "pairing " + std::to_string(id) + " not found");
      }
      auto record = ReadPairing(existing[0]);
      return Result::Err(ErrorCode::Conflict, "pairing " + std::to_string(id) + " already " + std::string(model::ToString(record.sync_status)));
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::PairingRecord> PgRepository::GetPairing(Transaction& t, int64_t id) {
  auto res = TX(t).Work().exec_prepared("get_pairing", id);
  if (res.empty()) return std::nullopt;
  return ReadPairing(res[0]);
}

std::optional<int64_t> PgRepository::FindLatestPlatformForIdentity(Transaction& t, const std::string& login) {
  auto res = TX(t).Work().exec_prepared("latest_platform_for_login", login);
  if (res.empty()) return std::nullopt;
  return res[0][0].as<int64_t>();
}

} // namespace scanhub::db::postgres
