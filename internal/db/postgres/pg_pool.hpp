#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace scanhub::db::postgres {

/*
  Bounded pool of pairing-store connections.

  A pqxx::connection serves one PgTransaction at a time and carries the
  pairing statements prepared when it was opened. Acquire hands out an idle
  connection or opens a new one, and blocks once max_connections are checked
  out. The returned shared_ptr gives the connection back when dropped; a
  connection that is no longer open is discarded instead and frees its slot.
  Connections released after the pool is gone are simply closed.
*/
class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 16);

  std::shared_ptr<pqxx::connection> Acquire();

  std::size_t IdleConnections() const;

 private:
  static void                       PrepareStatements(pqxx::connection& conn);
  std::shared_ptr<pqxx::connection> Lend(pqxx::connection* conn);
  void                              GiveBack(pqxx::connection* conn);

  const std::string conninfo_;
  const std::size_t max_connections_;

  mutable std::mutex                             mutex_;
  std::condition_variable                        available_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    open_connections_ = 0;
};

} // namespace scanhub::db::postgres
