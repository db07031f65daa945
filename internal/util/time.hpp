#pragma once

#include <chrono>
#include <cstdint>

namespace scanhub::util {

/*
  Wall-clock helpers. Pairing timestamps and token expiry both read
  NowMillis().
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);
uint64_t NowMillis();

} // namespace scanhub::util
