#include "pg_pool.hpp"

namespace scanhub::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  available_.wait(lock, [this] { return !idle_.empty() || open_connections_ < max_connections_; });

  while (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    if (conn->is_open()) {
      return Lend(conn.release());
    }
    // the server dropped it while idle
    --open_connections_;
  }

  // reserve the slot, then connect without holding the lock
  ++open_connections_;
  lock.unlock();

  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
    return Lend(conn.release());
  } catch (...) {
    {
      std::lock_guard relock(mutex_);
      --open_connections_;
    }
    available_.notify_one();
    throw;
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  // released at commit or abort
  conn.prepare("lock_product", "SELECT pg_advisory_xact_lock($1)");

  conn.prepare("latest_pairing_for_product",
               "SELECT id, login, platform, product, scanned_at_ms, is_overwrite, sync_status, sync_error "
               "FROM pairings WHERE product=$1 ORDER BY id DESC LIMIT 1 FOR UPDATE");

  conn.prepare("mark_pairing_overwritten", "UPDATE pairings SET is_overwrite=TRUE WHERE id=$1");

  conn.prepare("insert_pairing",
               "INSERT INTO pairings(login,platform,product,scanned_at_ms,is_overwrite,sync_status) "
               "VALUES($1,$2,$3,$4,FALSE,0) RETURNING id");

  conn.prepare("update_sync_status",
               "UPDATE pairings SET sync_status=$2, sync_error=$3 WHERE id=$1 AND sync_status=0");

  conn.prepare("get_pairing",
               "SELECT id, login, platform, product, scanned_at_ms, is_overwrite, sync_status, sync_error "
               "FROM pairings WHERE id=$1");

  conn.prepare("latest_platform_for_login",
               "SELECT platform FROM pairings WHERE login=$1 ORDER BY id DESC LIMIT 1");
}

std::shared_ptr<pqxx::connection> PgPool::Lend(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->GiveBack(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::GiveBack(pqxx::connection* conn) {
  std::unique_ptr<pqxx::connection> owned(conn);
  {
    std::lock_guard lock(mutex_);
    if (owned->is_open()) {
      idle_.push_back(std::move(owned));
    } else {
      // a broken connection frees its slot instead of going back idle
      --open_connections_;
    }
  }
  available_.notify_one();
}

std::size_t PgPool::IdleConnections() const {
  std::lock_guard lock(mutex_);
  return idle_.size();
}

} // namespace scanhub::db::postgres
