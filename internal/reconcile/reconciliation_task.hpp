#pragma once

#include <cstdint>
#include <string>

namespace scanhub::reconcile {

/*
  Propagation of one committed pairing to the legacy system.
*/
struct ReconciliationTask {
  int64_t record_id = 0;

  int64_t platform = 0;
  int64_t product  = 0;

  std::string login;
};

} // namespace scanhub::reconcile
