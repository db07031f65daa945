#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "scanhub/v1/session.pb.h"

namespace scanhub::session {

/*
  Connection capability as bit flags. Writer connections are inputs
  (scanners), reader connections are outputs (dashboards).
*/
enum class Role : std::uint8_t {
  kNone       = 0,
  kReader     = 1 << 0,
  kWriter     = 1 << 1,
  kReadWriter = kReader | kWriter,
};

constexpr bool HasReader(Role role) {
  return (static_cast<std::uint8_t>(role) & static_cast<std::uint8_t>(Role::kReader)) != 0;
}

constexpr bool HasWriter(Role role) {
  return (static_cast<std::uint8_t>(role) & static_cast<std::uint8_t>(Role::kWriter)) != 0;
}

inline Role RoleFromProto(scanhub::v1::ConnectionRole role) {
  switch (role) {
    case scanhub::v1::CONNECTION_ROLE_READER:
      return Role::kReader;
    case scanhub::v1::CONNECTION_ROLE_WRITER:
      return Role::kWriter;
    case scanhub::v1::CONNECTION_ROLE_READ_WRITER:
      return Role::kReadWriter;
    default:
      return Role::kNone;
  }
}

const char* RoleName(Role role);

/*
  One live bidirectional channel to a client.

  Send must be safe to call from any thread and throws when the event
  cannot be handed to the transport (peer gone, stream closed).
*/
class Connection {
 public:
  virtual ~Connection() = default;

  virtual const std::string& Id() const = 0;

  virtual void Send(const scanhub::v1::ServerEvent& event) = 0;
};

using ConnectionPtr = std::shared_ptr<Connection>;

} // namespace scanhub::session
