#include "session_registry.hpp"

#include <algorithm>

#include <google/protobuf/util/json_util.h>
#include <spdlog/spdlog.h>

#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"

namespace scanhub::session {

using observability::IntField;
using observability::StringField;

namespace {

scanhub::v1::ServerEvent ProducerConnectedEvent() {
  scanhub::v1::ServerEvent event;
  event.mutable_producer_connected();
  return event;
}

scanhub::v1::ServerEvent ProducerDisconnectedEvent() {
  scanhub::v1::ServerEvent event;
  event.mutable_producer_disconnected();
  return event;
}

bool RemoveConnection(std::vector<ConnectionPtr>& list, const ConnectionPtr& connection) {
  auto it = std::find(list.begin(), list.end(), connection);
  if (it == list.end()) {
    return false;
  }
  list.erase(it);
  return true;
}

bool ContainsConnection(const std::vector<ConnectionPtr>& list, const ConnectionPtr& connection) {
  return std::find(list.begin(), list.end(), connection) != list.end();
}

} // namespace

scanhub::v1::IdentitySnapshot ToSnapshot(const IdentityContext& context) {
  scanhub::v1::IdentitySnapshot snapshot;
  snapshot.set_login(context.metadata.login);
  if (context.metadata.id) {
    snapshot.set_user_id(*context.metadata.id);
  }
  snapshot.set_display_name(context.metadata.display_name);
  snapshot.set_input_count(static_cast<uint32_t>(context.inputs.size()));
  snapshot.set_output_count(static_cast<uint32_t>(context.outputs.size()));
  if (context.platform) {
    snapshot.set_current_platform(*context.platform);
  }
  for (const auto& c : context.inputs) {
    snapshot.add_input_ids(c->Id());
  }
  for (const auto& c : context.outputs) {
    snapshot.add_output_ids(c->Id());
  }
  return snapshot;
}

SessionRegistry::SessionRegistry(std::shared_ptr<scanhub::db::Repository> repository) : repository_(std::move(repository)) {
}

std::optional<int64_t> SessionRegistry::LoadPlatformHint(const std::string& login) const {
  if (!repository_) {
    return std::nullopt;
  }

  try {
    auto tx       = repository_->Begin();
    auto platform = repository_->FindLatestPlatformForIdentity(*tx, login);
    tx->Commit();
    return platform;
  } catch (const std::exception& e) {
    SCANHUB_LOG_WARN("platform hydration failed", {StringField("login", login), StringField("error", e.what())});
    return std::nullopt;
  }
}

DeliveryReport SessionRegistry::Register(const ConnectionPtr& connection, const IdentityMetadata& identity, Role role) {
  // store lookups happen without the registry lock held
  std::optional<int64_t> hint;
  bool                   hint_loaded = false;
  if (!Contains(identity.login)) {
    hint        = LoadPlatformHint(identity.login);
    hint_loaded = true;
  }

  std::vector<ConnectionPtr> broadcast_to;
  bool                       unicast = false;
  for (;;) {
    std::unique_lock lock(mutex_);

    auto it = contexts_.find(identity.login);
    if (it == contexts_.end()) {
      if (!hint_loaded) {
        // the context was destroyed after the check; a new one must be hydrated
        lock.unlock();
        hint        = LoadPlatformHint(identity.login);
        hint_loaded = true;
        continue;
      }
      it                  = contexts_.try_emplace(identity.login).first;
      it->second.metadata = identity;
      it->second.platform = hint;
      SCANHUB_LOG_INFO("identity context created",
                       {StringField("login", identity.login), IntField("hydrated_platform", hint.value_or(-1))});
    }
    auto& context = it->second;

    if (HasWriter(role) && !ContainsConnection(context.inputs, connection)) {
      context.inputs.push_back(connection);
      broadcast_to = context.outputs;
    }

    if (HasReader(role) && !ContainsConnection(context.outputs, connection)) {
      context.outputs.push_back(connection);
      unicast = !context.inputs.empty();
    }
    break;
  }

  SCANHUB_LOG_INFO("connection registered",
                   {StringField("login", identity.login), StringField("connection", connection->Id()), StringField("role", RoleName(role))});

  DeliveryReport report;
  if (!broadcast_to.empty()) {
    report.Append(broadcaster_.SendTo(broadcast_to, ProducerConnectedEvent()));
  }
  if (unicast) {
    report.Append(broadcaster_.SendTo({connection}, ProducerConnectedEvent()));
  }

  LogState();
  return report;
}

DeliveryReport SessionRegistry::Unregister(const ConnectionPtr& connection, const std::string& login, Role role) {
  std::vector<ConnectionPtr> notify;
  {
    std::lock_guard lock(mutex_);

    auto it = contexts_.find(login);
    if (it == contexts_.end()) {
      return {};
    }
    auto& context = it->second;

    if (HasWriter(role) && RemoveConnection(context.inputs, connection) && context.inputs.empty()) {
      notify = context.outputs;
    }
    if (HasReader(role)) {
      RemoveConnection(context.outputs, connection);
      // a read-writer leaving must not be told about its own departure
      RemoveConnection(notify, connection);
    }

    if (context.Empty()) {
      contexts_.erase(it);
      SCANHUB_LOG_INFO("identity context destroyed", {StringField("login", login)});
    }
  }

  SCANHUB_LOG_INFO("connection unregistered", {StringField("login", login), StringField("connection", connection->Id())});

  if (notify.empty()) {
    return {};
  }
  return broadcaster_.SendTo(notify, ProducerDisconnectedEvent());
}

std::optional<scanhub::v1::IdentitySnapshot> SessionRegistry::Lookup(const std::string& login) const {
  std::lock_guard lock(mutex_);
  auto            it = contexts_.find(login);
  if (it == contexts_.end()) {
    return std::nullopt;
  }
  return ToSnapshot(it->second);
}

bool SessionRegistry::Contains(const std::string& login) const {
  std::lock_guard lock(mutex_);
  return contexts_.contains(login);
}

std::optional<SessionRegistry::PlatformBinding> SessionRegistry::BindPlatform(const std::string& login, int64_t platform) {
  std::lock_guard lock(mutex_);
  auto            it = contexts_.find(login);
  if (it == contexts_.end()) {
    return std::nullopt;
  }

  auto&           context = it->second;
  PlatformBinding binding;
  binding.previous = context.platform;
  binding.changed  = context.platform != platform;
  if (binding.changed) {
    context.platform = platform;
  }
  binding.outputs = context.outputs;
  return binding;
}

std::vector<ConnectionPtr> SessionRegistry::OutputsBoundTo(int64_t platform) const {
  std::lock_guard            lock(mutex_);
  std::vector<ConnectionPtr> outputs;
  for (const auto& [login, context] : contexts_) {
    if (context.platform == platform) {
      outputs.insert(outputs.end(), context.outputs.begin(), context.outputs.end());
    }
  }
  return outputs;
}

std::vector<scanhub::v1::IdentitySnapshot> SessionRegistry::Snapshot() const {
  std::lock_guard                            lock(mutex_);
  std::vector<scanhub::v1::IdentitySnapshot> snapshots;
  snapshots.reserve(contexts_.size());
  for (const auto& [login, context] : contexts_) {
    snapshots.push_back(ToSnapshot(context));
  }
  return snapshots;
}

std::size_t SessionRegistry::Size() const {
  std::lock_guard lock(mutex_);
  return contexts_.size();
}

void SessionRegistry::LogState() const {
  if (!spdlog::should_log(spdlog::level::debug)) {
    return;
  }

  std::string state = "[";
  bool        first = true;
  for (const auto& snapshot : Snapshot()) {
    std::string json;
    if (!google::protobuf::util::MessageToJsonString(snapshot, &json).ok()) {
      continue;
    }
    if (!first) {
      state += ",";
    }
    first = false;
    state += json;
  }
  state += "]";

  SCANHUB_LOG_DEBUG("registry state", {StringField("identities", state)});
}

} // namespace scanhub::session
