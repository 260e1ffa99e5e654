/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: csv_sink.cc
 * Description: Implementation of CSVSink. Columns come from the record's
 *              message descriptor in field order. Unset optional fields (pid
 *              and tid of the time format) are written as empty cells, so
 *              records of every format line up with the fixed columns.
 */

#include "lcsee/sinks/csv_sink.h"
#include <google/protobuf/descriptor.h>
#include <google/protobuf/message.h>

namespace lcsee {
namespace sinks {

using google::protobuf::FieldDescriptor;

namespace {

constexpr const char* ROW_END = "\r\n";

std::string cell_value(const LogRecord& record, const FieldDescriptor* field) {
    const auto* reflection = record.GetReflection();
    if (field->has_presence() && !reflection->HasField(record, field)) {
        return "";
    }
    switch (field->cpp_type()) {
        case FieldDescriptor::CPPTYPE_INT32:
            return std::to_string(reflection->GetInt32(record, field));
        case FieldDescriptor::CPPTYPE_STRING:
            return reflection->GetString(record, field);
        default:
            return "";
    }
}

} // namespace

CSVSink::CSVSink(const std::string& file_path) : file_path_(file_path) {
    file_.open(file_path_, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!file_.is_open()) {
        throw SinkError("Failed to open CSV file: " + file_path_);
    }
}

CSVSink::~CSVSink() {
    close();
}

std::string CSVSink::escape_field(const std::string& value) {
    if (value.find_first_of(",\"\r\n") == std::string::npos) {
        return value;
    }
    std::string out = "\"";
    for (char c : value) {
        if (c == '"') {
            out += "\"\"";
        } else {
            out += c;
        }
    }
    out += "\"";
    return out;
}

void CSVSink::write_row(const std::vector<std::string>& cells) {
    for (size_t i = 0; i < cells.size(); ++i) {
        if (i > 0) {
            file_ << ",";
        }
        file_ << escape_field(cells[i]);
    }
    file_ << ROW_END;
}

bool CSVSink::emit(const LogRecord& record) {
    if (!file_.is_open()) {
        return false;
    }

    if (columns_.empty()) {
        const auto* descriptor = record.GetDescriptor();
        std::vector<std::string> header;
        for (int i = 0; i < descriptor->field_count(); ++i) {
            columns_.push_back(descriptor->field(i));
            header.push_back(descriptor->field(i)->name());
        }
        write_row(header);
    }

    std::vector<std::string> cells;
    cells.reserve(columns_.size());
    for (const auto* field : columns_) {
        cells.push_back(cell_value(record, field));
    }
    write_row(cells);
    return static_cast<bool>(file_);
}

void CSVSink::flush() {
    if (file_.is_open()) {
        file_.flush();
    }
}

void CSVSink::close() {
    if (file_.is_open()) {
        file_.close();
    }
}

} // namespace sinks
} // namespace lcsee
