#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "internal/session/broadcaster.hpp"

namespace scanhub::db {
class Repository;
}
namespace scanhub::session {
class SessionRegistry;
}
namespace scanhub::reconcile {
class ReconciliationScheduler;
}

namespace scanhub::core {

/*
  Result of one HandleNewPairing call.
*/
struct PairingOutcome {
  // false when the identity had no live context; nothing else happened
  bool applied = false;

  bool platform_changed = false;

  std::optional<int64_t> record_id;
  std::optional<int64_t> previous_platform;

  bool overwrite = false;
  bool moved     = false;

  scanhub::session::DeliveryReport platform_deliveries;
  scanhub::session::DeliveryReport pairing_deliveries;
  scanhub::session::DeliveryReport moved_deliveries;
};

/*
  Commit protocol for a scan.

  1. Rebinds the identity to the scanned platform and tells its outputs.
  2. With a product: marks the product's latest record overwritten and
     inserts the new record in one transaction, routes new_pairing and
     product_moved to platform-bound outputs, then queues reconciliation.

  Calls for the same identity are serialized. Calls for the same product
  are serialized by the repository transaction.
*/
class PairingCoordinator {
 public:
  PairingCoordinator(std::shared_ptr<scanhub::session::SessionRegistry> registry, std::shared_ptr<scanhub::db::Repository> repository,
                     std::shared_ptr<scanhub::reconcile::ReconciliationScheduler> scheduler);

  // Throws if the repository fails; the transaction is rolled back and no
  // pairing event is sent.
  PairingOutcome HandleNewPairing(const std::string& login, int64_t platform, std::optional<int64_t> product);

  // Identities with a HandleNewPairing call in progress.
  std::size_t LockedIdentities() const;

 private:
  struct IdentitySlot {
    std::mutex  mutex;
    std::size_t users = 0;
  };

  // Holds an identity's slot for one call; the slot is dropped with its last user.
  class IdentityLease {
   public:
    IdentityLease(PairingCoordinator& owner, const std::string& login);
    ~IdentityLease();

    IdentityLease(const IdentityLease&)            = delete;
    IdentityLease& operator=(const IdentityLease&) = delete;

    std::mutex& mutex() {
      return slot_->mutex;
    }

   private:
    PairingCoordinator&           owner_;
    std::string                   login_;
    std::shared_ptr<IdentitySlot> slot_;
  };

  PairingOutcome HandleNewPairingLocked(const std::string& login, int64_t platform, std::optional<int64_t> product);

  std::shared_ptr<scanhub::session::SessionRegistry>           registry_;
  std::shared_ptr<scanhub::db::Repository>                     repository_;
  std::shared_ptr<scanhub::reconcile::ReconciliationScheduler> scheduler_;
  scanhub::session::Broadcaster                                broadcaster_;

  mutable std::mutex                                             identity_slots_guard_;
  std::unordered_map<std::string, std::shared_ptr<IdentitySlot>> identity_slots_;
};

} // namespace scanhub::core
