#include "core/datetime.hpp"

#include <cctype>
#include <chrono>
#include <ctime>
#include <format>

namespace orabridge::datetime {

namespace {

struct CivilTime {
    std::tm tm{};
    std::string fraction;  // digits after '.', trailing zeros trimmed
};

Result<std::string> conversion_error(std::string_view text, std::string_view format) {
    return Result<std::string>::error(ErrorCategory::CONVERSION_ERROR,
        std::format("input '{}' does not match format '{}'", text, format));
}

bool calendar_valid(const std::tm& tm) {
    const std::chrono::year_month_day ymd{
        std::chrono::year{tm.tm_year + 1900},
        std::chrono::month{static_cast<unsigned>(tm.tm_mon + 1)},
        std::chrono::day{static_cast<unsigned>(tm.tm_mday)}};
    return ymd.ok();
}

/**
 * @brief strptime() that must consume the whole input
 * @return Pointer past the parsed prefix, or nullptr on mismatch
 */
const char* parse_prefix(const std::string& buf, const char* format, std::tm& out) {
    out = std::tm{};
    return ::strptime(buf.c_str(), format, &out);
}

std::string render_date(const std::tm& tm) {
    return std::format("{:04d}-{:02d}-{:02d}", tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday);
}

std::string render_time(const std::tm& tm) {
    return std::format("{:02d}:{:02d}:{:02d}", tm.tm_hour, tm.tm_min, tm.tm_sec);
}

} // anonymous namespace

Result<std::string> normalize_date(std::string_view text) {
    static constexpr const char* FORMAT = "%Y-%m-%d";
    const std::string buf(text);
    std::tm tm{};
    const char* end = parse_prefix(buf, FORMAT, tm);
    if (!end || *end != '\0' || !calendar_valid(tm)) {
        return conversion_error(text, FORMAT);
    }
    return Result<std::string>::ok(render_date(tm));
}

Result<std::string> normalize_datetime(std::string_view text) {
    static constexpr const char* FORMAT = "%Y-%m-%dT%H:%M:%S";
    const std::string buf(text);
    std::tm tm{};
    const char* end = parse_prefix(buf, FORMAT, tm);
    if (!end || *end != '\0' || !calendar_valid(tm)) {
        return conversion_error(text, FORMAT);
    }
    return Result<std::string>::ok(std::format("{} {}", render_date(tm), render_time(tm)));
}

Result<std::string> parse_native_datetime(std::string_view text) {
    static constexpr std::string_view ACCEPTED = "%Y-%m-%d[( |T)%H:%M:%S[.f]]";
    const std::string buf(text);
    CivilTime ct;

    const char* rest = parse_prefix(buf, "%Y-%m-%d", ct.tm);
    if (!rest) {
        return conversion_error(text, ACCEPTED);
    }

    if (*rest == ' ' || *rest == 'T') {
        std::tm time_part{};
        const std::string tail(rest + 1);
        const char* after = ::strptime(tail.c_str(), "%H:%M:%S", &time_part);
        if (!after) {
            return conversion_error(text, ACCEPTED);
        }
        ct.tm.tm_hour = time_part.tm_hour;
        ct.tm.tm_min = time_part.tm_min;
        ct.tm.tm_sec = time_part.tm_sec;

        if (*after == '.') {
            ++after;
            while (std::isdigit(static_cast<unsigned char>(*after))) {
                ct.fraction.push_back(*after++);
            }
            if (ct.fraction.empty()) {
                return conversion_error(text, ACCEPTED);
            }
            const auto last = ct.fraction.find_last_not_of('0');
            ct.fraction.erase(last == std::string::npos ? 0 : last + 1);
        }
        rest = after;
    }

    if (*rest != '\0' || !calendar_valid(ct.tm)) {
        return conversion_error(text, ACCEPTED);
    }

    std::string out = std::format("{}T{}", render_date(ct.tm), render_time(ct.tm));
    if (!ct.fraction.empty()) {
        out += '.';
        out += ct.fraction;
    }
    return Result<std::string>::ok(std::move(out));
}

std::string format_timestamp(const TimestampFields& ts) {
    std::string out = std::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}",
        ts.year, ts.month, ts.day, ts.hour, ts.minute, ts.second);
    if (ts.fsecond != 0) {
        out += std::format(".{:09}", ts.fsecond);
    }
    if (ts.tz_offset_minutes) {
        const int offset = *ts.tz_offset_minutes;
        const int magnitude = offset < 0 ? -offset : offset;
        out += std::format(" {}{:02}:{:02}", offset < 0 ? '-' : '+', magnitude / 60, magnitude % 60);
    }
    return out;
}

} // namespace orabridge::datetime
