#pragma once

#include <optional>
#include <string>

#include "internal/session/identity_context.hpp"

namespace scanhub::identity {

struct Credential {
  enum class Kind {
    kToken,
    kLogin,
  };

  Kind        kind = Kind::kLogin;
  std::string value;
};

/*
  Maps a presented credential to identity metadata. nullopt means the
  credential is not acceptable and the session must be refused.
*/
class IdentityResolver {
 public:
  virtual ~IdentityResolver() = default;

  virtual std::optional<scanhub::session::IdentityMetadata> Resolve(const Credential& credential) const = 0;
};

} // namespace scanhub::identity
