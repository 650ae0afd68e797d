#pragma once

#include <string>

namespace orabridge {

/**
 * @brief Rewrite generic '?' markers into Oracle positional binds
 *
 * "VALUES (?,?)" -> "VALUES (:1,:2)". Markers are numbered left to right
 * from 1. Quoted literals are not skipped: a '?' inside '...' is rewritten
 * too. Input without '?' is returned as-is (moved, no copy).
 */
[[nodiscard]] std::string translate_placeholders(std::string sql);

} // namespace orabridge
