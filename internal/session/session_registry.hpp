#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "broadcaster.hpp"
#include "connection.hpp"
#include "identity_context.hpp"

namespace scanhub::db {
class Repository;
}

namespace scanhub::session {

/*
  Owns login -> IdentityContext.

  All bookkeeping happens under one mutex; events are sent after the lock
  is released, to a copy of the recipient list. A context is created on the
  first connection for a login (hydrated with the login's most recent
  persisted platform when a repository is attached) and destroyed when its
  last connection leaves.
*/
class SessionRegistry {
 public:
  struct PlatformBinding {
    bool                       changed = false;
    std::optional<int64_t>     previous;
    std::vector<ConnectionPtr> outputs;
  };

  explicit SessionRegistry(std::shared_ptr<scanhub::db::Repository> repository = nullptr);

  DeliveryReport Register(const ConnectionPtr& connection, const IdentityMetadata& identity, Role role);

  DeliveryReport Unregister(const ConnectionPtr& connection, const std::string& login, Role role);

  std::optional<scanhub::v1::IdentitySnapshot> Lookup(const std::string& login) const;

  bool Contains(const std::string& login) const;

  // nullopt when no context exists for the login.
  std::optional<PlatformBinding> BindPlatform(const std::string& login, int64_t platform);

  std::vector<ConnectionPtr> OutputsBoundTo(int64_t platform) const;

  std::vector<scanhub::v1::IdentitySnapshot> Snapshot() const;

  std::size_t Size() const;

 private:
  std::optional<int64_t> LoadPlatformHint(const std::string& login) const;

  void LogState() const;

  std::shared_ptr<scanhub::db::Repository> repository_;
  Broadcaster                              broadcaster_;

  mutable std::mutex                               mutex_;
  std::unordered_map<std::string, IdentityContext> contexts_;
};

} // namespace scanhub::session
