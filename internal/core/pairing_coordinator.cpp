#include "pairing_coordinator.hpp"

#include "internal/db/api/repository.hpp"
#include "internal/db/api/result_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/reconcile/reconciliation_scheduler.hpp"
#include "internal/session/session_registry.hpp"
#include "internal/util/time.hpp"

namespace scanhub::core {

using observability::BoolField;
using observability::IntField;
using observability::StringField;

namespace {

scanhub::v1::ServerEvent PlatformChangedEvent(int64_t platform) {
  scanhub::v1::ServerEvent event;
  event.mutable_platform_changed()->set_platform(platform);
  return event;
}

scanhub::v1::ServerEvent NewPairingEvent(int64_t platform, int64_t product, int64_t record_id, bool overwrite) {
  scanhub::v1::ServerEvent event;
  auto*                    pairing = event.mutable_new_pairing();
  pairing->set_platform(platform);
  pairing->set_product(product);
  pairing->set_record_id(record_id);
  pairing->set_overwrite(overwrite);
  return event;
}

scanhub::v1::ServerEvent ProductMovedEvent(int64_t product, int64_t from, int64_t to) {
  scanhub::v1::ServerEvent event;
  auto*                    moved = event.mutable_product_moved();
  moved->set_product(product);
  moved->set_from_platform(from);
  moved->set_to_platform(to);
  return event;
}

} // namespace

PairingCoordinator::PairingCoordinator(std::shared_ptr<scanhub::session::SessionRegistry>           registry,
                                       std::shared_ptr<scanhub::db::Repository>                     repository,
                                       std::shared_ptr<scanhub::reconcile::ReconciliationScheduler> scheduler)
    : registry_(std::move(registry)), repository_(std::move(repository)), scheduler_(std::move(scheduler)) {
}

PairingCoordinator::IdentityLease::IdentityLease(PairingCoordinator& owner, const std::string& login) : owner_(owner), login_(login) {
  std::lock_guard lock(owner_.identity_slots_guard_);
  auto&           slot = owner_.identity_slots_[login_];
  if (!slot) {
    slot = std::make_shared<IdentitySlot>();
  }
  ++slot->users;
  slot_ = slot;
}

PairingCoordinator::IdentityLease::~IdentityLease() {
  std::lock_guard lock(owner_.identity_slots_guard_);
  if (--slot_->users == 0) {
    owner_.identity_slots_.erase(login_);
  }
}

std::size_t PairingCoordinator::LockedIdentities() const {
  std::lock_guard lock(identity_slots_guard_);
  return identity_slots_.size();
}

PairingOutcome PairingCoordinator::HandleNewPairing(const std::string& login, int64_t platform, std::optional<int64_t> product) {
  IdentityLease   lease(*this, login);
  std::lock_guard identity_lock(lease.mutex());
  return HandleNewPairingLocked(login, platform, product);
}

PairingOutcome PairingCoordinator::HandleNewPairingLocked(const std::string& login, int64_t platform, std::optional<int64_t> product) {
  PairingOutcome outcome;

  auto binding = registry_->BindPlatform(login, platform);
  if (!binding) {
    SCANHUB_LOG_DEBUG("pairing for unknown identity ignored", {StringField("login", login), IntField("platform", platform)});
    return outcome;
  }
  outcome.applied = true;

  if (binding->changed) {
    outcome.platform_changed    = true;
    outcome.platform_deliveries = broadcaster_.SendTo(binding->outputs, PlatformChangedEvent(platform));
    SCANHUB_LOG_INFO("platform changed",
                     {StringField("login", login), IntField("from", binding->previous.value_or(-1)), IntField("to", platform)});
  }

  if (!product) {
    return outcome;
  }

  observability::SpanScope span("pairing.commit");
  span.SetAttribute("login", login);
  span.SetAttribute("platform", platform);
  span.SetAttribute("product", *product);

  scanhub::db::model::PairingRecord record;
  record.login    = login;
  record.platform = platform;
  record.product  = *product;

  std::optional<scanhub::db::model::PairingRecord> prior;
  {
    auto tx = repository_->Begin();
    prior   = repository_->MarkLatestOverwritten(*tx, *product);
    // stamped while the product is locked so timestamps follow commit order
    record.scanned_at_ms = scanhub::util::NowMillis();
    scanhub::db::ThrowIfDbError(repository_->InsertPairing(*tx, record), "insert pairing");
    tx->Commit();
  }

  outcome.record_id = record.id;
  outcome.overwrite = prior.has_value();
  if (prior) {
    outcome.previous_platform = prior->platform;
  }
  outcome.moved = prior && prior->platform != platform;

  observability::Metrics::Instance().RecordPairing(outcome.overwrite);
  SCANHUB_LOG_INFO("pairing committed", {StringField("login", login), IntField("record_id", record.id), IntField("platform", platform),
                                         IntField("product", *product), BoolField("overwrite", outcome.overwrite)});

  outcome.pairing_deliveries =
      broadcaster_.SendTo(registry_->OutputsBoundTo(platform), NewPairingEvent(platform, *product, record.id, outcome.overwrite));

  if (outcome.moved) {
    outcome.moved_deliveries =
        broadcaster_.SendTo(registry_->OutputsBoundTo(prior->platform), ProductMovedEvent(*product, prior->platform, platform));
    SCANHUB_LOG_INFO("product moved", {IntField("product", *product), IntField("from", prior->platform), IntField("to", platform)});
  }

  reconcile::ReconciliationTask task;
  task.record_id = record.id;
  task.platform  = platform;
  task.product   = *product;
  task.login     = login;
  if (!scheduler_->Enqueue(task)) {
    SCANHUB_LOG_WARN("reconciliation not scheduled, shutting down", {IntField("record_id", record.id)});
  }

  return outcome;
}

} // namespace scanhub::core
