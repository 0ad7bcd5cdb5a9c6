// File: include/qs/core/util/time_util.hpp
#pragma once

#include <string>
#include <string_view>

#include "qs/core/status.hpp"
#include "qs/core/types.hpp"

namespace qs {

// Parses an ISO-8601 instant to UTC epoch seconds.
// Accepted: YYYY-MM-DD[(T| )hh:mm[:ss[.fff...]]][Z|z|(+|-)hh[:]mm]
// Fractional seconds are truncated; offsets are folded into UTC.
Result<TimestampS> parse_iso8601_utc(std::string_view text);

// "YYYY-MM-DDThh:mm:ssZ"
std::string format_iso8601_utc(TimestampS t);

}  // namespace qs
