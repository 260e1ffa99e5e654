/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: level.cc
 * Description: Conversions between logcat level letters and the Level
 *              enumeration.
 */

#include "lcsee/record/level.h"

namespace lcsee {
namespace record {

namespace {
    constexpr char LEVEL_LETTERS[] = "VDIWEF";
}

std::optional<Level> level_from_char(char letter) {
    for (int i = 0; i < 6; ++i) {
        if (LEVEL_LETTERS[i] == letter) {
            return static_cast<Level>(i);
        }
    }
    return std::nullopt;
}

std::optional<Level> level_from_string(const std::string& letter) {
    if (letter.size() != 1) {
        return std::nullopt;
    }
    return level_from_char(letter[0]);
}

char level_to_char(Level level) {
    return LEVEL_LETTERS[level_rank(level)];
}

} // namespace record
} // namespace lcsee
