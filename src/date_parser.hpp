#pragma once

#include <cstdint>
#include <string>

namespace dateparse {

// Days since 1970-01-01 for a proleptic Gregorian date (H. Hinnant's days_from_civil).
std::int64_t days_from_civil(int y, int m, int d);

// Seconds for a relative "<N> <unit> ago" amount, negated. Units are matched by
// prefix: sec, min, hour. Anything else is 0.
std::int64_t relative_offset(const std::string& unit, std::int64_t amount);

// Upload date of a chapter row. Accepts "5 min ago" style relative dates
// (returned as a negative offset from an unspecified now) and
// "yyyy-MM-dd HH:mm" absolute dates (returned as unix seconds). Anything else is 0.
std::int64_t parse_chapter_date(const std::string& raw);

} // namespace dateparse
