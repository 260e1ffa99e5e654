/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: console_sink.h
 * Description: Header for ConsoleSink class that renders records as one human
 *              readable line each, "<time> <pid>/<tid> <level> <tag>: <msg>",
 *              with optional ANSI coloring of the level letter.
 */

#pragma once

#include "lcsee/sinks/sink.h"
#include <iostream>

namespace lcsee {
namespace sinks {

class ConsoleSink : public Sink {
public:
    explicit ConsoleSink(std::ostream& out = std::cout, bool use_color = true);

    bool emit(const LogRecord& record) override;
    void flush() override;
    void close() override;
    std::string name() const override { return "console"; }

    // Plain text line for a record, without color
    static std::string format_line(const LogRecord& record);

private:
    std::ostream& out_;
    bool use_color_;
};

// ANSI SGR prefix for a level letter; empty when the level is not colored
const char* level_color(const std::string& level);

} // namespace sinks
} // namespace lcsee
