#pragma once

#include <memory>

namespace scanhub::session { class SessionRegistry; }
namespace scanhub::core { class PairingCoordinator; }
namespace scanhub::identity { class IdentityResolver; }

namespace scanhub::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<scanhub::session::SessionRegistry> registry;
  std::shared_ptr<scanhub::core::PairingCoordinator> coordinator;
  std::shared_ptr<scanhub::identity::IdentityResolver> resolver;
};

}
