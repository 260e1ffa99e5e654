/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: jsonl_sink.h
 * Description: Header for JSONLSink class that emits records to JSONL (JSON
 *              Lines) files. Converts LogRecord protobuf messages to JSON and
 *              writes one object per record, optionally pretty printed.
 */

#pragma once

#include "lcsee/sinks/sink.h"
#include <fstream>
#include <optional>
#include <string>

namespace lcsee {
namespace sinks {

class JSONLSink : public Sink {
public:
    // Truncates or creates `file_path`; throws SinkError if it cannot be opened.
    // With `indent`, objects are pretty printed using that many spaces.
    explicit JSONLSink(const std::string& file_path, std::optional<int> indent = std::nullopt);
    ~JSONLSink() override;

    bool emit(const LogRecord& record) override;
    void flush() override;
    void close() override;
    std::string name() const override { return "json:" + file_path_; }

    // JSON text of one record, without the trailing newline
    static std::string to_json(const LogRecord& record, std::optional<int> indent);

private:
    std::string file_path_;
    std::optional<int> indent_;
    std::ofstream file_;
};

} // namespace sinks
} // namespace lcsee
