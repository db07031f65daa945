#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "connection.hpp"

namespace scanhub::session {

/*
  What the identity resolver knows about a login.
*/
struct IdentityMetadata {
  std::string            login;
  std::optional<int64_t> id;
  std::string            display_name;
};

/*
  Registry-owned per-identity state. Exists only while at least one
  connection is registered under the login.
*/
struct IdentityContext {
  IdentityMetadata metadata;

  std::vector<ConnectionPtr> inputs;
  std::vector<ConnectionPtr> outputs;

  std::optional<int64_t> platform;

  bool Empty() const {
    return inputs.empty() && outputs.empty();
  }
};

scanhub::v1::IdentitySnapshot ToSnapshot(const IdentityContext& context);

} // namespace scanhub::session
