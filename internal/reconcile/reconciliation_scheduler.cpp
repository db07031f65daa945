#include "reconciliation_scheduler.hpp"

namespace scanhub::reconcile {

bool ReconciliationScheduler::Enqueue(const ReconciliationTask& task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return false;
    queue_.push(task);
  }
  cv_.notify_one();
  return true;
}

std::optional<ReconciliationTask> ReconciliationScheduler::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_) return std::nullopt;

  ReconciliationTask task = queue_.front();
  queue_.pop();
  return task;
}

std::size_t ReconciliationScheduler::Shutdown() {
  std::size_t abandoned = 0;
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
    abandoned = queue_.size();
    std::queue<ReconciliationTask>().swap(queue_);
  }
  cv_.notify_all();
  return abandoned;
}

std::size_t ReconciliationScheduler::Pending() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace scanhub::reconcile
