/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: csv_sink.h
 * Description: Header for CSVSink class that writes records as CSV rows. The
 *              header row is taken from the first record's fields at the first
 *              write and the column set stays fixed for the rest of the run.
 */

#pragma once

#include "lcsee/sinks/sink.h"
#include <fstream>
#include <string>
#include <vector>

namespace google {
namespace protobuf {
class FieldDescriptor;
} // namespace protobuf
} // namespace google

namespace lcsee {
namespace sinks {

class CSVSink : public Sink {
public:
    // Truncates or creates `file_path`; throws SinkError if it cannot be opened
    explicit CSVSink(const std::string& file_path);
    ~CSVSink() override;

    bool emit(const LogRecord& record) override;
    void flush() override;
    void close() override;
    std::string name() const override { return "csv:" + file_path_; }

    // RFC 4180 quoting of a single cell
    static std::string escape_field(const std::string& value);

private:
    std::string file_path_;
    std::ofstream file_;

    // Columns fixed by the first record; empty until then
    std::vector<const google::protobuf::FieldDescriptor*> columns_;

    void write_row(const std::vector<std::string>& cells);
};

} // namespace sinks
} // namespace lcsee
