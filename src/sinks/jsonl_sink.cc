/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: jsonl_sink.cc
 * Description: Implementation of JSONLSink class for emitting records to JSONL
 *              files. Uses the protobuf JSON printer with proto field names;
 *              unset pid/tid are left out of the object.
 */

#include "lcsee/sinks/jsonl_sink.h"
#include <google/protobuf/util/json_util.h>
#include <iostream>
#include <sstream>

namespace lcsee {
namespace sinks {

JSONLSink::JSONLSink(const std::string& file_path, std::optional<int> indent)
    : file_path_(file_path), indent_(indent) {
    file_.open(file_path_, std::ios::out | std::ios::trunc);
    if (!file_.is_open()) {
        throw SinkError("Failed to open JSONL file: " + file_path_);
    }
}

JSONLSink::~JSONLSink() {
    close();
}

std::string JSONLSink::to_json(const LogRecord& record, std::optional<int> indent) {
    std::string json;
    google::protobuf::util::JsonPrintOptions options;
    options.preserve_proto_field_names = true;
    // Empty tag/msg keep their keys; unset optional pid/tid stay absent
    options.always_print_primitive_fields = true;
    options.add_whitespace = indent.has_value();

    auto status = google::protobuf::util::MessageToJsonString(record, &json, options);
    if (!status.ok()) {
        throw SinkError("Failed to serialize record to JSON: " + std::string(status.message()));
    }

    while (!json.empty() && json.back() == '\n') {
        json.pop_back();
    }
    if (!indent) {
        return json;
    }

    // The record is flat: every field line sits one level deep. Replace the
    // printer's own indentation with the requested width.
    std::istringstream lines(json);
    std::ostringstream out;
    std::string line;
    bool first = true;
    while (std::getline(lines, line)) {
        size_t text = line.find_first_not_of(' ');
        if (!first) {
            out << "\n";
        }
        first = false;
        if (text == std::string::npos) {
            continue;
        }
        if (text > 0) {
            out << std::string(static_cast<size_t>(*indent), ' ');
        }
        out << line.substr(text);
    }
    return out.str();
}

bool JSONLSink::emit(const LogRecord& record) {
    if (!file_.is_open()) {
        return false;
    }

    std::string json;
    try {
        json = to_json(record, indent_);
    } catch (const SinkError& e) {
        std::cerr << e.what() << std::endl;
        return false;
    }

    file_ << json << "\n";
    return static_cast<bool>(file_);
}

void JSONLSink::flush() {
    if (file_.is_open()) {
        file_.flush();
    }
}

void JSONLSink::close() {
    if (file_.is_open()) {
        file_.close();
    }
}

} // namespace sinks
} // namespace lcsee
