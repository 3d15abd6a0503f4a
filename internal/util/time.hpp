#pragma once

#include <chrono>
#include <cstdint>

namespace artifact::util {

/*
  Wall clock used for created_at_ms stamps.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

int64_t ToUnixMillis(TimePoint tp);

} // namespace artifact::util
