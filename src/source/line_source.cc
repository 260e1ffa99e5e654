/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: line_source.cc
 * Description: Line clean-up shared by all line sources: CR stripping and
 *              best-effort UTF-8 decoding that drops invalid byte sequences.
 */

#include "lcsee/source/line_source.h"

namespace lcsee {
namespace source {

namespace {

bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

// Length of the valid UTF-8 sequence starting at `pos`, or 0 if invalid
size_t valid_sequence_length(const std::string& text, size_t pos) {
    const unsigned char lead = static_cast<unsigned char>(text[pos]);
    const size_t remaining = text.size() - pos;

    if (lead < 0x80) {
        return 1;
    }

    size_t len = 0;
    unsigned char min_second = 0x80;
    unsigned char max_second = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        len = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        len = 3;
        if (lead == 0xE0) min_second = 0xA0;   // overlong
        if (lead == 0xED) max_second = 0x9F;   // surrogates
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        len = 4;
        if (lead == 0xF0) min_second = 0x90;   // overlong
        if (lead == 0xF4) max_second = 0x8F;   // above U+10FFFF
    } else {
        return 0;
    }

    if (remaining < len) {
        return 0;
    }
    const unsigned char second = static_cast<unsigned char>(text[pos + 1]);
    if (second < min_second || second > max_second) {
        return 0;
    }
    for (size_t i = 2; i < len; ++i) {
        if (!is_continuation(static_cast<unsigned char>(text[pos + i]))) {
            return 0;
        }
    }
    return len;
}

} // namespace

std::string scrub_utf8(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        size_t len = valid_sequence_length(text, pos);
        if (len == 0) {
            ++pos;
            continue;
        }
        out.append(text, pos, len);
        pos += len;
    }
    return out;
}

std::string finish_line(std::string line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return scrub_utf8(line);
}

} // namespace source
} // namespace lcsee
