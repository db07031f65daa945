#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace scanhub::db::model {

/*
  Reconciliation status of a pairing. Values match the persisted column.
*/
enum class SyncStatus : int {
  kFailure = -1,
  kPending = 0,
  kSuccess = 1,
};

constexpr bool IsTerminal(SyncStatus status) {
  return status != SyncStatus::kPending;
}

constexpr std::string_view ToString(SyncStatus status) {
  switch (status) {
    case SyncStatus::kSuccess:
      return "success";
    case SyncStatus::kFailure:
      return "failure";
    case SyncStatus::kPending:
    default:
      return "pending";
  }
}

/*
  Persistent pairing row.

  Created once with overwrite=false and status pending. The only later
  mutations are the overwrite flip by a newer record for the same product and
  the single terminal status update by reconciliation.
*/
struct PairingRecord {
  int64_t id = 0;

  std::string login;

  int64_t platform = 0;
  int64_t product  = 0;

  uint64_t scanned_at_ms = 0;

  bool overwrite = false;

  SyncStatus  sync_status = SyncStatus::kPending;
  std::string sync_error;
};

} // namespace scanhub::db::model
