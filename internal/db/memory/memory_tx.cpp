#include "memory_tx.hpp"

#include <stdexcept>

namespace scanhub::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), lock_(repo.tx_mutex_) {
  writes_.next_id = repo_.committed_.next_id;
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

std::optional<model::PairingRecord> MemoryTransaction::Find(int64_t id) const {
  if (auto it = writes_.pairings.find(id); it != writes_.pairings.end()) return it->second;
  if (auto it = repo_.committed_.pairings.find(id); it != repo_.committed_.pairings.end()) return it->second;
  return std::nullopt;
}

std::optional<int64_t> MemoryTransaction::LatestForProduct(int64_t product) const {
  if (auto it = writes_.latest_by_product.find(product); it != writes_.latest_by_product.end()) return it->second;
  if (auto it = repo_.committed_.latest_by_product.find(product); it != repo_.committed_.latest_by_product.end()) return it->second;
  return std::nullopt;
}

std::optional<int64_t> MemoryTransaction::LatestForLogin(const std::string& login) const {
  if (auto it = writes_.latest_by_login.find(login); it != writes_.latest_by_login.end()) return it->second;
  if (auto it = repo_.committed_.latest_by_login.find(login); it != repo_.committed_.latest_by_login.end()) return it->second;
  return std::nullopt;
}

void MemoryTransaction::Put(const model::PairingRecord& record) {
  if (committed_ || rolled_back_) {
    throw std::runtime_error("memory transaction is no longer active");
  }
  writes_.pairings[record.id] = record;
}

void MemoryTransaction::Insert(const model::PairingRecord& record) {
  Put(record);
  writes_.latest_by_product[record.product] = record.id;
  writes_.latest_by_login[record.login]     = record.id;
}

int64_t MemoryTransaction::NextId() {
  return writes_.next_id++;
}

void MemoryTransaction::Commit() {
  if (rolled_back_) {
    throw std::runtime_error("commit after rollback");
  }

  auto& state = repo_.committed_;
  for (auto& [id, record] : writes_.pairings) {
    state.pairings[id] = std::move(record);
  }
  for (const auto& [product, id] : writes_.latest_by_product) {
    state.latest_by_product[product] = id;
  }
  for (const auto& [login, id] : writes_.latest_by_login) {
    state.latest_by_login[login] = id;
  }
  state.next_id = writes_.next_id;

  committed_ = true;
  lock_.unlock();
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
  writes_      = {};
  if (lock_.owns_lock()) lock_.unlock();
}

} // namespace scanhub::db::memory
