#include "date_parser.hpp"

#include "text_utils.hpp"

#include <charconv>
#include <limits>
#include <optional>
#include <vector>

namespace dateparse {

namespace {

template <typename Int>
std::optional<Int> parse_int(const std::string& s) {
    if (s.empty()) return std::nullopt;
    const char* first = s.data();
    const char* last = s.data() + s.size();
    if (*first == '+') ++first;
    Int value{};
    auto res = std::from_chars(first, last, value);
    if (res.ec != std::errc() || res.ptr != last) return std::nullopt;
    return value;
}

std::vector<std::string> split_spaces(const std::string& s) {
    std::vector<std::string> parts;
    size_t pos = 0;
    for (;;) {
        size_t next = s.find(' ', pos);
        parts.push_back(s.substr(pos, next == std::string::npos ? std::string::npos : next - pos));
        if (next == std::string::npos) break;
        pos = next + 1;
    }
    return parts;
}

} // namespace

std::int64_t days_from_civil(int y, int m, int d) {
    y -= m <= 2;
    const int era = (y >= 0 ? y : y - 399) / 400;
    const int yoe = y - era * 400;
    const int doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const int doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return static_cast<std::int64_t>(era) * 146097 + doe - 719468;
}

std::int64_t relative_offset(const std::string& unit, std::int64_t amount) {
    std::int64_t unitSeconds = 0;
    if (textutil::starts_with(unit, "min")) unitSeconds = 60;
    else if (textutil::starts_with(unit, "hour")) unitSeconds = 3600;
    else if (textutil::starts_with(unit, "sec")) unitSeconds = 1;
    if (unitSeconds == 0) return 0;

    // amounts come from page text; anything that does not fit is unparsable
    const std::int64_t limit = std::numeric_limits<std::int64_t>::max() / unitSeconds;
    if (amount > limit || amount < -limit) return 0;
    return -(amount * unitSeconds);
}

std::int64_t parse_chapter_date(const std::string& raw) {
    if (raw.empty()) return 0;

    if (textutil::ends_with(raw, "ago")) {
        auto parts = split_spaces(raw);
        if (parts.size() >= 2) {
            if (auto amount = parse_int<std::int64_t>(parts[0])) {
                return relative_offset(parts[1], *amount);
            }
        }
        return 0;
    }

    // yyyy-MM-dd HH:mm
    if (raw.size() >= 16) {
        const int year = parse_int<int>(raw.substr(0, 4)).value_or(1970);
        const int month = parse_int<int>(raw.substr(5, 2)).value_or(1);
        const int day = parse_int<int>(raw.substr(8, 2)).value_or(1);
        const int hour = parse_int<int>(raw.substr(11, 2)).value_or(0);
        const int minute = parse_int<int>(raw.substr(14, 2)).value_or(0);
        return days_from_civil(year, month, day) * 86400
            + static_cast<std::int64_t>(hour) * 3600
            + static_cast<std::int64_t>(minute) * 60;
    }
    return 0;
}

} // namespace dateparse
