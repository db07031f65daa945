#pragma once

#include <string>

#include "internal/session/connection.hpp"
#include "internal/session/identity_context.hpp"
#include "scanhub/v1/session.pb.h"
#include "service_context.hpp"

namespace scanhub::service {

/*
  An accepted connection: who it is and what it may do.
*/
struct Session {
  scanhub::session::ConnectionPtr    connection;
  scanhub::session::IdentityMetadata identity;
  scanhub::session::Role             role = scanhub::session::Role::kNone;
};

/*
  Transport-independent session protocol.

  Accept validates the first client message and registers the connection,
  Dispatch handles every later message and Close unregisters. A rejected
  Accept throws PolicyViolation and leaves the registry untouched.
*/
class SessionService {
 public:
  explicit SessionService(ServiceContext ctx);

  Session Accept(const scanhub::session::ConnectionPtr& connection, const scanhub::v1::ClientMessage& first);

  void Dispatch(const Session& session, const scanhub::v1::ClientMessage& message);

  void Close(const Session& session);

 private:
  void HandleNewPairing(const Session& session, const scanhub::v1::NewPairingRequest& request);

  ServiceContext ctx_;
};

} // namespace scanhub::service
