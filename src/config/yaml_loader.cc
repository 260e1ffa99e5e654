/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: yaml_loader.cc
 * Description: Implementation of the YAML configuration loader. Reads the
 *              "source", "filters" and "output" sections and the top level
 *              "verbose" flag.
 */

#include "lcsee/config/yaml_loader.h"
#include <yaml-cpp/yaml.h>

namespace lcsee {
namespace config {

namespace {

// Overwrite `field` only when the key is present; a value of the wrong type
// throws YAML::BadConversion
template <typename T>
void read_value(const YAML::Node& node, const char* key, T& field) {
    if (node[key]) {
        field = node[key].as<T>();
    }
}

void load_source(const YAML::Node& node, SourceOptions& source) {
    if (node["mode"]) {
        std::string mode = node["mode"].as<std::string>();
        if (mode == "adb") {
            source.mode = SourceMode::Adb;
        } else if (mode == "file") {
            source.mode = SourceMode::File;
        } else {
            throw ConfigError("Unknown source mode '" + mode + "' (expected adb or file)");
        }
    }
    read_value(node, "serial", source.serial);
    read_value(node, "adb_path", source.adb_path);
    read_value(node, "buffer", source.buffer);
    read_value(node, "format", source.format);
    read_value(node, "clear", source.clear);
    read_value(node, "input", source.input_path);
    read_value(node, "follow", source.follow);
    read_value(node, "poll_interval_ms", source.poll_interval_ms);
}

void load_filters(const YAML::Node& node, FilterOptions& filters) {
    if (node["min_level"]) {
        std::string letter = node["min_level"].as<std::string>();
        auto level = record::level_from_string(letter);
        if (!level) {
            throw ConfigError("Invalid min_level '" + letter + "' (expected one of V D I W E F)");
        }
        filters.min_level = level;
    }

    if (node["tags"]) {
        filters.tags.clear();
        for (const auto& tag : node["tags"]) {
            filters.tags.push_back(tag.as<std::string>());
        }
    }

    if (node["grep"]) {
        std::string grep = node["grep"].as<std::string>();
        if (!grep.empty()) {
            filters.grep = grep;
        }
    }
    if (node["contains"]) {
        std::string contains = node["contains"].as<std::string>();
        if (!contains.empty()) {
            filters.contains = contains;
        }
    }
    read_value(node, "ignore_case", filters.ignore_case);
    if (node["pid"]) {
        filters.pid = node["pid"].as<int32_t>();
    }
}

void load_output(const YAML::Node& node, OutputOptions& output) {
    read_value(node, "color", output.color);
    read_value(node, "console", output.console);
    read_value(node, "json", output.json_path);
    if (node["json_indent"]) {
        output.json_indent = node["json_indent"].as<int>();
    }
    read_value(node, "csv", output.csv_path);
}

void load_root(const YAML::Node& root, Options& options) {
    if (!root.IsMap()) {
        if (root.IsNull()) {
            return;
        }
        throw ConfigError("Configuration root must be a mapping");
    }
    if (root["source"]) {
        load_source(root["source"], options.source);
    }
    if (root["filters"]) {
        load_filters(root["filters"], options.filters);
    }
    if (root["output"]) {
        load_output(root["output"], options.output);
    }
    read_value(root, "verbose", options.verbose);
}

} // namespace

void load_options_from_yaml(const std::string& file_path, Options& options) {
    try {
        load_root(YAML::LoadFile(file_path), options);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to load configuration " + file_path + ": " + e.what());
    }
}

void load_options_from_yaml_string(const std::string& yaml_text, Options& options) {
    try {
        load_root(YAML::Load(yaml_text), options);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Failed to parse configuration: ") + e.what());
    }
}

} // namespace config
} // namespace lcsee
