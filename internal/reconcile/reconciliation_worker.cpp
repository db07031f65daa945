#include "reconciliation_worker.hpp"

#include <chrono>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/db/api/result_errors.hpp"
#include "internal/legacy/legacy_sink.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace scanhub::reconcile {

using observability::IntField;
using observability::StringField;

ReconciliationWorker::ReconciliationWorker(std::shared_ptr<ReconciliationScheduler> scheduler,
                                           std::shared_ptr<scanhub::db::Repository> repository,
                                           std::shared_ptr<scanhub::legacy::LegacySink> sink)
    : scheduler_(std::move(scheduler)), repository_(std::move(repository)), sink_(std::move(sink)) {
}

ReconciliationWorker::~ReconciliationWorker() {
  Stop();
}

void ReconciliationWorker::Start() {
  if (running_.exchange(true)) return;

  dispatcher_ = std::thread(&ReconciliationWorker::Dispatch, this);
  SCANHUB_LOG_INFO("reconciliation worker started");
}

void ReconciliationWorker::Stop() {
  const auto abandoned   = scheduler_->Shutdown();
  const bool was_running = running_.exchange(false);

  if (dispatcher_.joinable()) dispatcher_.join();

  // Finishing attempts still write their slot; splicing keeps the iterators
  // valid while they are joined outside the lock.
  AttemptList remaining;
  std::size_t in_flight = 0;
  {
    std::lock_guard lock(attempts_mutex_);
    remaining.splice(remaining.end(), attempts_);
    in_flight = in_flight_;
  }
  if (in_flight > 0) {
    SCANHUB_LOG_INFO("waiting for in-flight reconciliations", {IntField("in_flight", static_cast<int64_t>(in_flight))});
  }
  for (auto& attempt : remaining) {
    if (attempt.thread.joinable()) attempt.thread.join();
  }

  if (was_running || abandoned > 0) {
    SCANHUB_LOG_INFO("reconciliation worker stopped", {IntField("abandoned", static_cast<int64_t>(abandoned))});
  }
}

std::size_t ReconciliationWorker::InFlight() const {
  std::lock_guard lock(attempts_mutex_);
  return in_flight_;
}

scanhub::db::model::SyncStatus ReconciliationWorker::Execute(const ReconciliationTask& task) {
  observability::SpanScope span("reconcile.pairing");
  span.SetAttribute("record_id", task.record_id);
  span.SetAttribute("product", task.product);

  const auto started = std::chrono::steady_clock::now();

  scanhub::legacy::LegacySaveResult result;
  try {
    result = sink_->AttemptSave(task.platform, task.product);
  } catch (const std::exception& e) {
    result.ok      = false;
    result.message = e.what();
  }
  if (!result.ok && result.message.empty()) {
    result.message = "legacy sink reported failure";
  }

  const auto elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
  observability::Metrics::Instance().ObserveReconciliationMs(elapsed_ms);

  const auto status = result.ok ? scanhub::db::model::SyncStatus::kSuccess : scanhub::db::model::SyncStatus::kFailure;

  auto tx = repository_->Begin();
  scanhub::db::ThrowIfDbError(repository_->UpdateSyncStatus(*tx, task.record_id, status, result.message),
                              "reconcile pairing " + std::to_string(task.record_id));
  tx->Commit();

  observability::Metrics::Instance().RecordReconciliation(scanhub::db::model::ToString(status));
  if (result.ok) {
    SCANHUB_LOG_INFO("pairing reconciled", {IntField("record_id", task.record_id), IntField("platform", task.platform),
                                            IntField("product", task.product)});
  } else {
    span.RecordException(result.message);
    SCANHUB_LOG_WARN("pairing reconciliation failed", {IntField("record_id", task.record_id), IntField("product", task.product),
                                                       StringField("error", result.message)});
  }
  return status;
}

void ReconciliationWorker::Dispatch() {
  while (auto task = scheduler_->Dequeue()) {
    try {
      Launch(*task);
    } catch (const std::exception& e) {
      SCANHUB_LOG_ERROR("reconciliation attempt not started", {IntField("record_id", task->record_id), StringField("error", e.what())});
    }
  }
}

void ReconciliationWorker::Launch(const ReconciliationTask& task) {
  std::lock_guard lock(attempts_mutex_);
  ReapFinishedLocked();

  auto slot = attempts_.emplace(attempts_.end());
  try {
    slot->thread = std::thread(&ReconciliationWorker::RunAttempt, this, task, slot);
  } catch (...) {
    attempts_.erase(slot);
    throw;
  }
  ++in_flight_;
}

void ReconciliationWorker::RunAttempt(ReconciliationTask task, AttemptList::iterator slot) {
  try {
    Execute(task);
  } catch (const std::exception& e) {
    SCANHUB_LOG_ERROR("reconciliation status update failed", {IntField("record_id", task.record_id), StringField("error", e.what())});
  }

  std::lock_guard lock(attempts_mutex_);
  slot->finished = true;
  --in_flight_;
}

void ReconciliationWorker::ReapFinishedLocked() {
  for (auto it = attempts_.begin(); it != attempts_.end();) {
    if (!it->finished) {
      ++it;
      continue;
    }
    if (it->thread.joinable()) it->thread.join();
    it = attempts_.erase(it);
  }
}

} // namespace scanhub::reconcile
