#include "connection.hpp"

namespace scanhub::session {

const char* RoleName(Role role) {
  switch (role) {
    case Role::kReader:
      return "reader";
    case Role::kWriter:
      return "writer";
    case Role::kReadWriter:
      return "read_writer";
    case Role::kNone:
    default:
      return "none";
  }
}

} // namespace scanhub::session
