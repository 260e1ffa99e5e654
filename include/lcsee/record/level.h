/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: level.h
 * Description: Logcat severity levels (V, D, I, W, E, F) and their fixed
 *              ordering. Provides conversions between level letters and ranks
 *              used by the filter chain and the console sink.
 */

#pragma once

#include <optional>
#include <string>

namespace lcsee {
namespace record {

// Ordered by increasing severity
enum class Level {
    Verbose = 0,
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

// Parse a level letter ("V".."F"); nullopt for anything else
std::optional<Level> level_from_string(const std::string& letter);
std::optional<Level> level_from_char(char letter);

char level_to_char(Level level);

inline int level_rank(Level level) {
    return static_cast<int>(level);
}

} // namespace record
} // namespace lcsee
