/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: line_source.h
 * Description: Header for the base LineSource class, a pull-based sequence of
 *              raw log lines backed by an owned resource (file, child process).
 *              Concrete implementations (FileLineSource, ProcessLineSource,
 *              ReplayLineSource) release their resource in close() and on
 *              destruction.
 */

#pragma once

#include <atomic>
#include <optional>
#include <stdexcept>
#include <string>

namespace lcsee {
namespace source {

// Startup or mid-stream failure of a line source
class SourceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Base interface for all line sources
class LineSource {
public:
    virtual ~LineSource() = default;

    // Next line without its terminator, or nullopt at end of sequence.
    // May block (live stream, follow mode). Throws SourceError on I/O failure.
    virtual std::optional<std::string> next() = 0;

    // Release the underlying resource; idempotent
    virtual void close() {}

    // Flag cleared by the signal handler. Blocking sources end their
    // sequence once it reads false.
    virtual void set_stop_flag(const std::atomic<bool>* running) {
        running_ = running;
    }

protected:
    const std::atomic<bool>* running_ = nullptr;

    bool stop_requested() const {
        return running_ != nullptr && !running_->load();
    }
};

// Drop a trailing '\r' and any invalid UTF-8 byte sequence
std::string finish_line(std::string line);

// Copy of `text` without bytes that do not form valid UTF-8
std::string scrub_utf8(const std::string& text);

} // namespace source
} // namespace lcsee
