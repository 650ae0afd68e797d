#include "db/oracle/placeholder.hpp"

#include <algorithm>
#include <charconv>

namespace orabridge {

std::string translate_placeholders(std::string sql) {
    const auto markers = static_cast<size_t>(std::count(sql.begin(), sql.end(), '?'));
    if (markers == 0) {
        return sql;
    }

    std::string out;
    // Each marker grows by at most the digits of the largest ordinal
    out.reserve(sql.size() + markers * (std::to_string(markers).size()));

    size_t ordinal = 0;
    char buf[24];
    for (const char c : sql) {
        if (c != '?') {
            out.push_back(c);
            continue;
        }
        out.push_back(':');
        const auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), ++ordinal);
        out.append(buf, ptr);
    }
    return out;
}

} // namespace orabridge
