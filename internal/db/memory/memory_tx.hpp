#pragma once

#include <mutex>
#include <optional>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace scanhub::db::memory {

/*
  Transaction = exclusive repository lock + write set.

  Writes are buffered and merged into the committed state on Commit().
  Holding the lock for the transaction lifetime serializes read-mark-insert
  sequences, like BEGIN IMMEDIATE does for SQLite.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  std::optional<model::PairingRecord> Find(int64_t id) const;
  std::optional<int64_t>              LatestForProduct(int64_t product) const;
  std::optional<int64_t>              LatestForLogin(const std::string& login) const;

  // Insert also advances the product and login indexes.
  void    Insert(const model::PairingRecord& record);
  void    Put(const model::PairingRecord& record);
  int64_t NextId();

 private:
  MemoryRepository&            repo_;
  std::unique_lock<std::mutex> lock_;
  MemoryRepository::State      writes_;
  bool                         committed_   = false;
  bool                         rolled_back_ = false;
};

} // namespace scanhub::db::memory
