#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/model/pairing_record.hpp"
#include "internal/db/sql/sql_queries.hpp"

#if SCANHUB_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if SCANHUB_DB_POSTGRES
#include <pqxx/pqxx>

#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using scanhub::db::ErrorCode;
using scanhub::db::Repository;
using scanhub::db::memory::MemoryRepository;
using scanhub::db::model::PairingRecord;
using scanhub::db::model::SyncStatus;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

// Products are offset per run so a shared postgres database does not
// carry rows from earlier runs into the assertions.
int64_t UniqueProduct(int64_t n) {
  static const int64_t base = static_cast<int64_t>(NowMs() % 1000000000) * 1000;
  return base + n;
}

PairingRecord Commit(Repository& repo, const std::string& login, int64_t platform, int64_t product, uint64_t scanned_at_ms,
                     std::optional<PairingRecord>* prior = nullptr) {
  auto tx     = repo.Begin();
  auto marked = repo.MarkLatestOverwritten(*tx, product);
  if (prior) *prior = marked;

  PairingRecord record;
  record.login         = login;
  record.platform      = platform;
  record.product       = product;
  record.scanned_at_ms = scanned_at_ms;
  auto inserted        = repo.InsertPairing(*tx, record);
  assert(inserted);
  tx->Commit();
  assert(record.id > 0);
  return record;
}

std::optional<PairingRecord> Load(Repository& repo, int64_t id) {
  auto tx     = repo.Begin();
  auto record = repo.GetPairing(*tx, id);
  tx->Commit();
  return record;
}

void VerifyInsertAndGet(Repository& repo, const std::string& login) {
  const auto product = UniqueProduct(1);
  auto       record  = Commit(repo, login, 5, product, 1000);

  auto loaded = Load(repo, record.id);
  assert(loaded.has_value());
  assert(loaded->login == login);
  assert(loaded->platform == 5);
  assert(loaded->product == product);
  assert(loaded->scanned_at_ms == 1000);
  assert(!loaded->overwrite);
  assert(loaded->sync_status == SyncStatus::kPending);
  assert(loaded->sync_error.empty());

  assert(!Load(repo, record.id + 1000000).has_value());
}

void VerifyOverwriteChain(Repository& repo, const std::string& login) {
  const auto product = UniqueProduct(2);

  std::optional<PairingRecord> prior;
  auto                         first = Commit(repo, login, 5, product, 1000, &prior);
  assert(!prior.has_value());

  auto second = Commit(repo, login, 7, product, 2000, &prior);
  assert(prior.has_value());
  assert(prior->id == first.id);
  assert(prior->platform == 5);
  // the returned record is the state before the flip
  assert(!prior->overwrite);

  auto third = Commit(repo, login, 7, product, 3000, &prior);
  assert(prior->id == second.id);
  assert(prior->platform == 7);

  assert(Load(repo, first.id)->overwrite);
  assert(Load(repo, second.id)->overwrite);
  assert(!Load(repo, third.id)->overwrite);

  // same timestamp: the later id wins
  auto tied = Commit(repo, login, 9, product, 3000, &prior);
  assert(prior->id == third.id);
  assert(!Load(repo, tied.id)->overwrite);
}

std::size_t CountLive(Repository& repo, const std::vector<int64_t>& ids) {
  std::size_t live = 0;
  for (auto id : ids) {
    auto record = Load(repo, id);
    assert(record.has_value());
    if (!record->overwrite) ++live;
  }
  return live;
}

// Scanner clocks and lock acquisition can disagree; the live record is the
// last one committed, whatever its timestamp.
void VerifyLatestFollowsCommitOrder(Repository& repo, const std::string& login) {
  const auto product = UniqueProduct(10);

  std::optional<PairingRecord> prior;
  auto                         first  = Commit(repo, login, 7, product, 1001, &prior);
  auto                         second = Commit(repo, login, 5, product, 1000, &prior);
  assert(prior->id == first.id);

  auto third = Commit(repo, login, 9, product, 1002, &prior);
  assert(prior->id == second.id);
  assert(prior->platform == 5);

  auto fourth = Commit(repo, login, 3, product, 999, &prior);
  assert(prior->id == third.id);
  assert(prior->platform == 9);

  assert(CountLive(repo, {first.id, second.id, third.id, fourth.id}) == 1);
  assert(!Load(repo, fourth.id)->overwrite);
}

void VerifyRollbackBehavior(Repository& repo, const std::string& login) {
  const auto product = UniqueProduct(3);
  auto       first   = Commit(repo, login, 5, product, 1000);

  {
    auto tx = repo.Begin();
    assert(repo.MarkLatestOverwritten(*tx, product).has_value());

    PairingRecord record;
    record.login         = login;
    record.platform      = 7;
    record.product       = product;
    record.scanned_at_ms = 2000;
    assert(repo.InsertPairing(*tx, record));
    tx->Rollback();
  }

  {
    // destructor without commit rolls back as well
    auto tx = repo.Begin();
    assert(repo.MarkLatestOverwritten(*tx, product).has_value());
  }

  assert(!Load(repo, first.id)->overwrite);

  std::optional<PairingRecord> prior;
  Commit(repo, login, 9, product, 3000, &prior);
  assert(prior->id == first.id);
}

void VerifySyncStatusLeavesPendingOnce(Repository& repo, const std::string& login) {
  auto ok     = Commit(repo, login, 5, UniqueProduct(4), 1000);
  auto failed = Commit(repo, login, 5, UniqueProduct(5), 1000);

  {
    auto tx = repo.Begin();
    assert(repo.UpdateSyncStatus(*tx, ok.id, SyncStatus::kSuccess, ""));
    assert(repo.UpdateSyncStatus(*tx, failed.id, SyncStatus::kFailure, "legacy rejected"));
    tx->Commit();
  }

  auto loaded_ok = Load(repo, ok.id);
  assert(loaded_ok->sync_status == SyncStatus::kSuccess);
  auto loaded_failed = Load(repo, failed.id);
  assert(loaded_failed->sync_status == SyncStatus::kFailure);
  assert(loaded_failed->sync_error == "legacy rejected");

  auto tx = repo.Begin();
  assert(repo.UpdateSyncStatus(*tx, ok.id, SyncStatus::kFailure, "late").code == ErrorCode::Conflict);
  assert(repo.UpdateSyncStatus(*tx, ok.id + 1000000, SyncStatus::kSuccess, "").code == ErrorCode::NotFound);
  assert(repo.UpdateSyncStatus(*tx, failed.id, SyncStatus::kPending, "").code == ErrorCode::ConstraintViolation);
  tx->Commit();

  assert(Load(repo, ok.id)->sync_status == SyncStatus::kSuccess);
}

void VerifyLatestPlatformForIdentity(Repository& repo, const std::string& login) {
  {
    auto tx = repo.Begin();
    assert(!repo.FindLatestPlatformForIdentity(*tx, login + "-never-scanned").has_value());
    tx->Commit();
  }

  const auto base = NowMs();
  Commit(repo, login, 11, UniqueProduct(6), base);
  Commit(repo, login, 12, UniqueProduct(7), base + 10);

  {
    auto tx       = repo.Begin();
    auto platform = repo.FindLatestPlatformForIdentity(*tx, login);
    tx->Commit();
    assert(platform == 12);
  }

  // an older timestamp committed later still wins
  Commit(repo, login, 13, UniqueProduct(11), base - 10);

  auto tx       = repo.Begin();
  auto platform = repo.FindLatestPlatformForIdentity(*tx, login);
  tx->Commit();
  assert(platform == 13);
}

void VerifyConcurrentCommits(Repository& repo, const std::string& login) {
  const auto    product  = UniqueProduct(8);
  constexpr int kThreads = 8;

  std::atomic<int>         fresh{0};
  std::vector<int64_t>     ids(kThreads);
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i] {
      std::optional<PairingRecord> prior;
      // timestamps deliberately disagree with the order the lock is won
      ids[i] = Commit(repo, login, 100 + i, product, 1000 + (kThreads - i), &prior).id;
      if (!prior) ++fresh;
    });
  }
  for (auto& t : threads) t.join();

  assert(fresh == 1);
  assert(CountLive(repo, ids) == 1);

  // the next commit supersedes exactly the live record
  std::optional<PairingRecord> prior;
  auto                         next = Commit(repo, login, 200, product, 1, &prior);
  assert(prior.has_value());
  assert(!prior->overwrite);
  ids.push_back(next.id);
  assert(CountLive(repo, ids) == 1);
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& login) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo   = backend.make_repository();
  auto record = Commit(*repo, login, 5, UniqueProduct(9), 1000);

  backend.restart(repo);
  auto loaded = Load(*repo, record.id);
  assert(loaded.has_value());
  assert(loaded->product == record.product);
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if SCANHUB_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("scanhub_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<scanhub::db::sqlite::SqliteDB>(db_path);
    db->Exec(scanhub::db::sql::CREATE_PAIRINGS_SQLITE);
    db->Exec(scanhub::db::sql::CREATE_PAIRINGS_INDEXES_SQLITE);
    return std::make_shared<scanhub::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup =
          [db_path]() {
            std::filesystem::remove(db_path);
            std::filesystem::remove(db_path + "-wal");
            std::filesystem::remove(db_path + "-shm");
          },
  };
}
#endif

#if SCANHUB_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("SCANHUB_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("SCANHUB_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    {
      pqxx::connection conn(conninfo);
      pqxx::work       tx(conn);
      tx.exec(scanhub::db::sql::CREATE_PAIRINGS_POSTGRES);
      tx.commit();
    }
    return std::make_shared<scanhub::db::postgres::PgRepository>(std::make_shared<scanhub::db::postgres::PgPool>(conninfo));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}

void VerifyPoolDiscardsClosedConnections() {
  const char* uri = std::getenv("SCANHUB_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) return;

  auto pool = std::make_shared<scanhub::db::postgres::PgPool>(uri, 1);
  {
    auto conn = pool->Acquire();
  }
  assert(pool->IdleConnections() == 1);

  {
    auto conn = pool->Acquire();
    assert(pool->IdleConnections() == 0);
    conn->close();
  }
  // the closed connection is dropped and its slot is usable again
  assert(pool->IdleConnections() == 0);
  auto conn = pool->Acquire();
  assert(conn->is_open());
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  const auto login = backend.name + "-" + std::to_string(NowMs());

  VerifyInsertAndGet(*repo, login);
  VerifyOverwriteChain(*repo, login);
  VerifyLatestFollowsCommitOrder(*repo, login);
  VerifyRollbackBehavior(*repo, login);
  VerifySyncStatusLeavesPendingOnce(*repo, login);
  VerifyLatestPlatformForIdentity(*repo, login + "-latest");
  VerifyConcurrentCommits(*repo, login);

  VerifyRestartDurability(backend, login + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if SCANHUB_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if SCANHUB_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

#if SCANHUB_DB_POSTGRES
  VerifyPoolDiscardsClosedConnections();
#endif

  std::cout << "scanhub_integration_repository_parity: pass\n";
  return 0;
}
