#pragma once

#include <string>
#include <unordered_map>

#include "identity_resolver.hpp"

namespace scanhub::runtime::config {
class IdentityConfig;
}

namespace scanhub::identity {

/*
  Resolver backed by the configured user directory.

  Bare logins must name a configured user unless unknown logins are
  accepted. Tokens are compact HS256 JWTs signed with the configured
  secret; the `login` claim (or `sub`) names the user and an `exp` claim,
  when present, must lie in the future.
*/
class DirectoryIdentityResolver final : public IdentityResolver {
 public:
  explicit DirectoryIdentityResolver(const scanhub::runtime::config::IdentityConfig& config);

  std::optional<scanhub::session::IdentityMetadata> Resolve(const Credential& credential) const override;

 private:
  std::optional<scanhub::session::IdentityMetadata> ResolveLogin(const std::string& login) const;
  std::optional<std::string>                        VerifyToken(const std::string& token) const;

  std::string secret_;
  bool        accept_unknown_logins_ = false;

  std::unordered_map<std::string, scanhub::session::IdentityMetadata> users_;
};

} // namespace scanhub::identity
