// File: include/tcr/core/protocol/timestamp.hpp
#pragma once

#include <string>

#include "tcr/core/types.hpp"

namespace tcr {

// Formats an epoch timestamp in UTC as "yyyy-MM-dd'T'hh:mm:ss.SSSZ".
// hh is the clock-hour of the half day (01-12) and the zone is always "+0000";
// IDE consumers parse exactly this shape.
std::string format_timestamp(TimestampNs t);

// Whole milliseconds, truncated toward zero.
long long duration_millis(DurationNs d);

}  // namespace tcr
