/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: sink.h
 * Description: Header for base Sink class for emitting accepted log records.
 *              Concrete implementations (ConsoleSink, JSONLSink, CSVSink)
 *              provide the human readable, JSON Lines and CSV outputs.
 */

#pragma once

#include "log_record.pb.h"
#include <stdexcept>
#include <string>

namespace lcsee {
namespace sinks {

// Output file cannot be opened or written
class SinkError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Base interface for record sinks
class Sink {
public:
    virtual ~Sink() = default;

    // Emit a record; false on a write failure
    virtual bool emit(const LogRecord& record) = 0;

    // Flush any buffered output
    virtual void flush() {}

    // Close the sink. Safe without any prior emit, and idempotent.
    virtual void close() {}

    // Short name for diagnostics
    virtual std::string name() const = 0;
};

} // namespace sinks
} // namespace lcsee
