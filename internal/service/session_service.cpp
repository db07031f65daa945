#include "session_service.hpp"

#include "internal/core/pairing_coordinator.hpp"
#include "internal/identity/identity_resolver.hpp"
#include "internal/observability/logging.hpp"
#include "internal/session/session_registry.hpp"
#include "internal/util/errors.hpp"

namespace scanhub::service {

using observability::IntField;
using observability::StringField;

namespace {

identity::Credential ToCredential(const scanhub::v1::RegisterRequest& request) {
  identity::Credential credential;
  switch (request.credential_case()) {
    case scanhub::v1::RegisterRequest::kToken:
      credential.kind  = identity::Credential::Kind::kToken;
      credential.value = request.token();
      break;
    case scanhub::v1::RegisterRequest::kLogin:
      credential.kind  = identity::Credential::Kind::kLogin;
      credential.value = request.login();
      break;
    default:
      throw scanhub::util::PolicyViolation("policy violation: register carries no credential");
  }
  return credential;
}

} // namespace

SessionService::SessionService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

Session SessionService::Accept(const scanhub::session::ConnectionPtr& connection, const scanhub::v1::ClientMessage& first) {
  if (!first.has_register_()) {
    SCANHUB_LOG_WARN("session refused: first message is not register", {StringField("connection", connection->Id())});
    throw scanhub::util::PolicyViolation("policy violation: first message must be register");
  }

  const auto& request = first.register_();
  const auto  role    = scanhub::session::RoleFromProto(request.role());
  if (role == scanhub::session::Role::kNone) {
    throw scanhub::util::PolicyViolation("policy violation: connection role is required");
  }

  auto identity = ctx_.resolver->Resolve(ToCredential(request));
  if (!identity) {
    SCANHUB_LOG_WARN("session refused: credential not resolved", {StringField("connection", connection->Id())});
    throw scanhub::util::PolicyViolation("policy violation: credential not accepted");
  }

  Session session{connection, *identity, role};
  ctx_.registry->Register(connection, session.identity, role);

  try {
    auto snapshot = ctx_.registry->Lookup(session.identity.login);
    if (snapshot) {
      scanhub::v1::ServerEvent event;
      *event.mutable_registered() = std::move(*snapshot);
      connection->Send(event);
    }
  } catch (const std::exception&) {
    ctx_.registry->Unregister(connection, session.identity.login, role);
    throw;
  }

  return session;
}

void SessionService::Dispatch(const Session& session, const scanhub::v1::ClientMessage& message) {
  switch (message.kind_case()) {
    case scanhub::v1::ClientMessage::kNewPairing:
      HandleNewPairing(session, message.new_pairing());
      break;
    case scanhub::v1::ClientMessage::kRegister:
      SCANHUB_LOG_WARN("duplicate register ignored", {StringField("login", session.identity.login)});
      break;
    case scanhub::v1::ClientMessage::kPing:
    default:
      break;
  }
}

void SessionService::HandleNewPairing(const Session& session, const scanhub::v1::NewPairingRequest& request) {
  if (!scanhub::session::HasWriter(session.role)) {
    SCANHUB_LOG_DEBUG("pairing from non-writer connection ignored",
                      {StringField("login", session.identity.login), StringField("connection", session.connection->Id())});
    return;
  }
  if (!request.has_platform()) {
    SCANHUB_LOG_WARN("pairing without platform ignored", {StringField("login", session.identity.login)});
    return;
  }

  std::optional<int64_t> product;
  if (request.has_product()) {
    product = request.product();
  }

  try {
    ctx_.coordinator->HandleNewPairing(session.identity.login, request.platform(), product);
  } catch (const std::exception& e) {
    SCANHUB_LOG_ERROR("pairing commit failed", {StringField("login", session.identity.login), IntField("platform", request.platform()),
                                                IntField("product", product.value_or(-1)), StringField("error", e.what())});
  }
}

void SessionService::Close(const Session& session) {
  ctx_.registry->Unregister(session.connection, session.identity.login, session.role);
}

} // namespace scanhub::service
