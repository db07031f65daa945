#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/pairing_record.hpp"

namespace scanhub::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - MarkLatestOverwritten + InsertPairing inside one transaction are
    serialized per product: two concurrent commits for the same product
    can never both observe "no prior record"
  - A record's sync status leaves pending at most once

  The pairings table is the single arbiter of which platform currently
  holds a product.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Pairings
  // ---------------------------------------------------------------------

  // Finds the product's most recently committed record (highest id), flips
  // its overwrite flag and returns it as it was before the flip. nullopt when
  // the product was never paired. Locks the product until the transaction
  // ends.
  virtual std::optional<model::PairingRecord> MarkLatestOverwritten(Transaction&, int64_t product) = 0;

  // Assigns record.id on success.
  virtual Result InsertPairing(Transaction&, model::PairingRecord& record) = 0;

  // Moves a pending record to a terminal status. Conflict if it already left
  // pending, NotFound if the id is unknown.
  virtual Result UpdateSyncStatus(Transaction&, int64_t id, model::SyncStatus status, const std::string& diagnostic) = 0;

  virtual std::optional<model::PairingRecord> GetPairing(Transaction&, int64_t id) = 0;

  // Platform of the identity's most recently committed record; used to hydrate a new
  // identity context.
  virtual std::optional<int64_t> FindLatestPlatformForIdentity(Transaction&, const std::string& login) = 0;
};

} // namespace scanhub::db
