#pragma once

#include <atomic>
#include <cstddef>
#include <list>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/db/model/pairing_record.hpp"
#include "reconciliation_scheduler.hpp"

namespace scanhub::db {
class Repository;
}
namespace scanhub::legacy {
class LegacySink;
}

namespace scanhub::reconcile {

/*
  Propagates committed pairings to the legacy sink and records the terminal
  sync status.

  A dispatcher thread drains the scheduler and starts every task on its own
  attempt thread right away, so a slow or hung sink call never delays the
  next record. Each task is attempted once; a sink failure or exception
  marks the record failed with a diagnostic.

  Stop() abandons tasks the dispatcher has not picked up (their records stay
  pending) and waits for attempts already inside the sink.
*/
class ReconciliationWorker {
 public:
  ReconciliationWorker(std::shared_ptr<ReconciliationScheduler> scheduler, std::shared_ptr<scanhub::db::Repository> repository,
                       std::shared_ptr<scanhub::legacy::LegacySink> sink);
  ~ReconciliationWorker();

  void Start();
  void Stop();

  // Runs one task on the calling thread and returns the stored status.
  scanhub::db::model::SyncStatus Execute(const ReconciliationTask& task);

  // Attempts started and not yet finished.
  std::size_t InFlight() const;

 private:
  struct AttemptThread {
    std::thread thread;
    bool        finished = false;
  };
  using AttemptList = std::list<AttemptThread>;

  void Dispatch();
  void Launch(const ReconciliationTask& task);
  void RunAttempt(ReconciliationTask task, AttemptList::iterator slot);

  // joins and drops attempts that have already returned
  void ReapFinishedLocked();

  std::shared_ptr<ReconciliationScheduler>     scheduler_;
  std::shared_ptr<scanhub::db::Repository>     repository_;
  std::shared_ptr<scanhub::legacy::LegacySink> sink_;

  std::thread       dispatcher_;
  std::atomic<bool> running_{false};

  mutable std::mutex attempts_mutex_;
  AttemptList        attempts_;
  std::size_t        in_flight_ = 0;
};

} // namespace scanhub::reconcile
