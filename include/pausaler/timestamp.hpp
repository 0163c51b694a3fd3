#pragma once

#include "types.hpp"
#include <cstdint>
#include <string>

namespace pausaler::timestamp
{

    /**
     * Format as RFC3339 UTC with second precision, e.g. 2025-01-01T00:00:00Z.
     * Sub-second precision is truncated.
     */
    std::string format_rfc3339(TimePoint tp);

    /**
     * Parse an RFC3339 date-time. Accepts a 'Z' or numeric offset and an
     * optional fractional second part.
     */
    Result<TimePoint> parse_rfc3339(const std::string &text);

    /** Truncate to whole seconds */
    TimePoint floor_seconds(TimePoint tp);

    int64_t to_unix_seconds(TimePoint tp);

    TimePoint from_unix_seconds(int64_t seconds);

} // namespace pausaler::timestamp
