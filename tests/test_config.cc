#include "lcsee/config/options.h"
#include "lcsee/config/yaml_loader.h"
#include "lcsee/processor/builder.h"
#include <atomic>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

using namespace lcsee::config;
namespace fs = std::filesystem;

static bool rejects(const Options& options) {
    try {
        validate_options(options);
    } catch (const ConfigError&) {
        return true;
    }
    return false;
}

static bool yaml_rejects(const std::string& text) {
    Options options;
    try {
        load_options_from_yaml_string(text, options);
    } catch (const ConfigError&) {
        return true;
    }
    return false;
}

static Options file_options() {
    Options options;
    options.source.mode = SourceMode::File;
    options.source.input_path = "device.log";
    return options;
}

void test_yaml_loading() {
    std::cout << "Testing YAML loading..." << std::endl;

    Options options;
    load_options_from_yaml_string(R"(
source:
  mode: adb
  serial: emulator-5554
  buffer: radio
  format: time
  clear: true
filters:
  min_level: W
  tags: [ActivityManager, Net]
  grep: "time(out)?"
  ignore_case: true
  pid: 1234
output:
  color: false
  json: out.jsonl
  json_indent: 2
  csv: out.csv
verbose: true
)", options);

    assert(options.source.mode == SourceMode::Adb);
    assert(options.source.serial == "emulator-5554");
    assert(options.source.buffer == "radio");
    assert(options.source.format == "time");
    assert(options.source.clear);
    assert(options.source.adb_path == "adb");
    assert(options.filters.min_level == lcsee::record::Level::Warn);
    assert(options.filters.tags.size() == 2);
    assert(options.filters.tags[1] == "Net");
    assert(options.filters.grep && *options.filters.grep == "time(out)?");
    assert(!options.filters.contains);
    assert(options.filters.ignore_case);
    assert(options.filters.pid && *options.filters.pid == 1234);
    assert(!options.output.color);
    assert(options.output.json_path == "out.jsonl");
    assert(options.output.json_indent && *options.output.json_indent == 2);
    assert(options.output.csv_path == "out.csv");
    assert(options.verbose);
    validate_options(options);
    std::cout << "  ✓ All sections loaded" << std::endl;

    // Absent keys keep their current values
    Options overlay = file_options();
    overlay.source.follow = true;
    overlay.filters.contains = "boot";
    load_options_from_yaml_string("output:\n  console: true\n", overlay);
    assert(overlay.source.mode == SourceMode::File);
    assert(overlay.source.input_path == "device.log");
    assert(overlay.source.follow);
    assert(overlay.filters.contains && *overlay.filters.contains == "boot");
    assert(overlay.output.console);
    std::cout << "  ✓ Overlay keeps unset values" << std::endl;

    Options empty;
    load_options_from_yaml_string("", empty);
    assert(empty.source.mode == SourceMode::None);
    std::cout << "  ✓ Empty document accepted" << std::endl;

    fs::path path = fs::temp_directory_path() / "lcsee_test_config.yaml";
    {
        std::ofstream out(path);
        out << "source:\n  mode: file\n  input: /var/log/device.log\n  follow: true\n"
               "  poll_interval_ms: 50\n";
    }
    Options from_file;
    load_options_from_yaml(path.string(), from_file);
    assert(from_file.source.mode == SourceMode::File);
    assert(from_file.source.input_path == "/var/log/device.log");
    assert(from_file.source.follow);
    assert(from_file.source.poll_interval_ms == 50);
    fs::remove(path);
    std::cout << "  ✓ Loaded from file" << std::endl;
}

void test_yaml_errors() {
    std::cout << "Testing YAML errors..." << std::endl;

    assert(yaml_rejects("filters:\n  min_level: X\n"));
    assert(yaml_rejects("source:\n  mode: serial\n"));
    assert(yaml_rejects("filters:\n  pid: not-a-number\n"));
    assert(yaml_rejects("- just\n- a list\n"));
    assert(yaml_rejects("source: [unterminated\n"));
    assert(yaml_rejects("source:\n  follow: maybe\n"));
    assert(yaml_rejects("source:\n  poll_interval_ms: soon\n"));
    assert(yaml_rejects("output:\n  color: nope\n"));
    assert(yaml_rejects("output:\n  json_indent: wide\n"));
    assert(yaml_rejects("verbose: loud\n"));

    Options options;
    bool threw = false;
    try {
        load_options_from_yaml("/nonexistent/lcsee.yaml", options);
    } catch (const ConfigError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "  ✓ Invalid values and documents rejected" << std::endl;
}

void test_validation() {
    std::cout << "Testing option validation..." << std::endl;

    assert(rejects(Options{}));
    assert(!rejects(file_options()));

    Options bad_format = file_options();
    bad_format.source.format = "brief";
    assert(rejects(bad_format));

    Options auto_file = file_options();
    auto_file.source.format = "auto";
    assert(!rejects(auto_file));

    Options adb;
    adb.source.mode = SourceMode::Adb;
    assert(!rejects(adb));

    Options auto_adb = adb;
    auto_adb.source.format = "auto";
    assert(rejects(auto_adb));

    Options follow_adb = adb;
    follow_adb.source.follow = true;
    assert(rejects(follow_adb));

    Options no_buffer = adb;
    no_buffer.source.buffer.clear();
    assert(rejects(no_buffer));

    Options no_path = file_options();
    no_path.source.input_path.clear();
    assert(rejects(no_path));

    Options bad_poll = file_options();
    bad_poll.source.poll_interval_ms = 0;
    assert(rejects(bad_poll));

    Options bad_indent = file_options();
    bad_indent.output.json_indent = -1;
    assert(rejects(bad_indent));

    std::cout << "  ✓ Contradictory options rejected" << std::endl;
}

void test_console_selection() {
    std::cout << "Testing console selection..." << std::endl;

    OutputOptions output;
    assert(output.console_enabled());
    output.json_path = "out.jsonl";
    assert(!output.console_enabled());
    output.console = true;
    assert(output.console_enabled());

    std::cout << "  ✓ Console is the default and opt-in next to files" << std::endl;
}

void test_builder() {
    std::cout << "Testing pipeline builder..." << std::endl;

    Options options = file_options();
    auto config = lcsee::processor::make_pipeline_config(options);
    assert(!config.auto_detect);
    assert(config.format == lcsee::record::LogFormat::Threadtime);

    options.source.format = "auto";
    options.verbose = true;
    config = lcsee::processor::make_pipeline_config(options);
    assert(config.auto_detect);
    assert(config.verbose);

    options.source.format = "epoch";
    config = lcsee::processor::make_pipeline_config(options);
    assert(config.format == lcsee::record::LogFormat::Epoch);
    std::cout << "  ✓ Pipeline config derived from options" << std::endl;

    fs::path json = fs::temp_directory_path() / "lcsee_test_builder.jsonl";
    fs::path csv = fs::temp_directory_path() / "lcsee_test_builder.csv";

    Options outputs = file_options();
    outputs.output.json_path = json.string();
    outputs.output.csv_path = csv.string();
    outputs.filters.min_level = lcsee::record::Level::Info;

    std::ostringstream console;
    auto pipeline = lcsee::processor::make_pipeline(outputs, console);
    assert(!pipeline->process_line("01-01 12:00:00.000 1 2 D Tag: debug"));
    assert(pipeline->process_line("01-01 12:00:00.000 1 2 I Tag: info"));
    pipeline->close_sinks();

    assert(console.str().empty());
    assert(fs::file_size(json) > 0);
    std::ifstream in(csv);
    std::string header;
    std::getline(in, header);
    assert(header == "ts_raw,ts_iso,pid,tid,level,tag,msg\r");
    std::cout << "  ✓ File sinks only, console not attached" << std::endl;

    outputs.output.console = true;
    outputs.output.color = false;
    auto with_console = lcsee::processor::make_pipeline(outputs, console);
    assert(with_console->process_line("01-01 12:00:00.000 1 2 W Tag: warn"));
    with_console->close_sinks();
    assert(console.str().find("W Tag: warn") != std::string::npos);
    std::cout << "  ✓ Console added with file sinks" << std::endl;

    Options unwritable = file_options();
    unwritable.output.json_path = "/nonexistent/dir/out.jsonl";
    bool threw = false;
    try {
        lcsee::processor::make_pipeline(unwritable, console);
    } catch (const lcsee::sinks::SinkError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "  ✓ Unwritable output path rejected" << std::endl;

    fs::remove(json);
    fs::remove(csv);
}

void test_session_order() {
    std::cout << "Testing session startup order..." << std::endl;

    fs::path json = fs::temp_directory_path() / "lcsee_test_session.jsonl";
    {
        std::ofstream out(json);
        out << "{\"kept\":true}\n";
    }

    Options options = file_options();
    options.source.input_path = (fs::temp_directory_path() / "lcsee_missing_input.log").string();
    fs::remove(options.source.input_path);
    options.output.json_path = json.string();

    std::ostringstream console;
    bool threw = false;
    try {
        lcsee::processor::make_session(options, console);
    } catch (const lcsee::source::SourceError&) {
        threw = true;
    }
    assert(threw);
    assert(fs::file_size(json) > 0);
    std::cout << "  ✓ Missing input leaves existing output intact" << std::endl;

    fs::path input = fs::temp_directory_path() / "lcsee_test_session.log";
    {
        std::ofstream out(input);
        out << "01-01 12:00:00.000 1 2 I Tag: hello\n";
    }
    options.source.input_path = input.string();
    auto session = lcsee::processor::make_session(options, console);
    assert(session.source && session.pipeline);
    std::atomic<bool> running{true};
    auto stats = session.pipeline->run(*session.source, running);
    session.source->close();
    assert(stats.records_emitted == 1);
    assert(fs::file_size(json) > 0);
    assert(console.str().empty());
    std::cout << "  ✓ Session runs end to end" << std::endl;

    fs::remove(json);
    fs::remove(input);
}

int main() {
    std::cout << "Running Config tests..." << std::endl;
    test_yaml_loading();
    test_yaml_errors();
    test_validation();
    test_console_selection();
    test_builder();
    test_session_order();
    std::cout << "\nAll Config tests passed!" << std::endl;
    return 0;
}
