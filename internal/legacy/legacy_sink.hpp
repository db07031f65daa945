#pragma once

#include <cstdint>
#include <string>

namespace scanhub::legacy {

struct LegacySaveResult {
  bool        ok = false;
  std::string message;
};

/*
  External system of record that committed pairings are propagated to.

  AttemptSave may block for as long as the remote side takes and may throw;
  callers treat a throw the same as ok=false.
*/
class LegacySink {
 public:
  virtual ~LegacySink() = default;

  virtual LegacySaveResult AttemptSave(int64_t platform, int64_t product) = 0;
};

} // namespace scanhub::legacy
