#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

#include "reconciliation_task.hpp"

namespace scanhub::reconcile {

/*
  Thread-safe blocking queue for reconciliation workers.

  Shutdown wakes every waiter and abandons whatever is still queued; the
  corresponding records stay pending.
*/
class ReconciliationScheduler {
 public:
  // Returns false once the scheduler has been shut down.
  bool Enqueue(const ReconciliationTask& task);

  // blocking wait; nullopt after shutdown
  std::optional<ReconciliationTask> Dequeue();

  // Returns the number of abandoned tasks.
  std::size_t Shutdown();

  std::size_t Pending() const;

 private:
  mutable std::mutex             mutex_;
  std::condition_variable        cv_;
  std::queue<ReconciliationTask> queue_;
  bool                           shutdown_ = false;
};

} // namespace scanhub::reconcile
