/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: lcsee.cc
 * Description: Main application for reading Android logcat output from a
 *              device (adb logcat) or from a file, filtering the records and
 *              emitting them to the console, a JSON Lines file and/or a CSV
 *              file. Options come from an optional YAML file and the command
 *              line; SIGINT/SIGTERM stop the run cleanly.
 */

#include "lcsee/config/options.h"
#include "lcsee/config/yaml_loader.h"
#include "lcsee/processor/builder.h"
#include "lcsee/processor/pipeline.h"
#include "lcsee/record/level.h"
#include <atomic>
#include <csignal>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>

static const char* kVersion = "1.0";

namespace {

std::atomic<bool> g_running{true};

void signal_handler(int) {
    g_running = false;
}

// No SA_RESTART: a blocking read returns EINTR so the source can stop
void install_signal_handlers() {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

void print_usage(std::ostream& os) {
    os << "Usage:\n"
       << "  lcsee (--adb | --input <path>) [options]\n"
       << "\n"
       << "Source:\n"
       << "  --adb                   Read from a device with adb logcat.\n"
       << "  --input <path>          Read from a log file.\n"
       << "  --serial <serial>       Device serial (adb -s).\n"
       << "  --adb-path <path>       adb executable (default adb).\n"
       << "  --buffer <name>         Log buffer: main, system, events, radio, crash, all (default main).\n"
       << "  --format <fmt>          threadtime, time, epoch; auto for files (default threadtime).\n"
       << "  --clear                 Clear the device log buffer before reading.\n"
       << "  --follow                Keep reading lines appended to the file.\n"
       << "  --poll-ms <n>           Follow poll interval in milliseconds (default 200).\n"
       << "\n"
       << "Filters:\n"
       << "  --min-level <L>         Minimum level, one of V D I W E F.\n"
       << "  --tag <tag>...          Only these tags (repeatable, or several values).\n"
       << "  --grep <regex>          Message must match the regular expression.\n"
       << "  --contains <text>       Message must contain the text.\n"
       << "  -i, --ignore-case       Case-insensitive --grep and --contains.\n"
       << "  --pid <pid>             Only this process id.\n"
       << "\n"
       << "Output:\n"
       << "  --no-color              Disable colored console output.\n"
       << "  --console               Print to the console even with --json/--csv.\n"
       << "  --json <path>           Write JSON Lines to the file.\n"
       << "  --json-indent <n>       Pretty print JSON objects with n spaces.\n"
       << "  --csv <path>            Write CSV to the file.\n"
       << "\n"
       << "  --config <file.yaml>    Load options from a YAML file (flags override it).\n"
       << "  --verbose               Log progress to stderr.\n"
       << "  --help                  Print this help.\n"
       << "  --version               Print version.\n";
}

bool parse_int(const std::string& s, long long& out) {
    try {
        size_t idx = 0;
        long long v = std::stoll(s, &idx, 10);
        if (idx != s.size()) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool is_flag(const std::string& arg) {
    return arg.size() > 1 && arg[0] == '-';
}

// Apply command line flags on top of `options`. Returns false on a usage
// error after printing it.
bool apply_arguments(int argc, char** argv, lcsee::config::Options& options) {
    using lcsee::config::SourceMode;
    auto& source = options.source;
    auto& filters = options.filters;
    auto& output = options.output;
    bool tags_from_cli = false;

    auto value = [&](int& i, const std::string& flag, std::string& out) {
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << flag << "\n";
            return false;
        }
        out = argv[++i];
        return true;
    };

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        std::string v;

        if (a == "--adb") {
            // Overrides a mode chosen by the config file
            source.mode = SourceMode::Adb;
        } else if (a == "--input") {
            if (!value(i, a, v)) return false;
            source.mode = SourceMode::File;
            source.input_path = v;
        } else if (a == "--serial") {
            if (!value(i, a, v)) return false;
            source.serial = v;
        } else if (a == "--adb-path") {
            if (!value(i, a, v)) return false;
            source.adb_path = v;
        } else if (a == "--buffer") {
            if (!value(i, a, v)) return false;
            source.buffer = v;
        } else if (a == "--format") {
            if (!value(i, a, v)) return false;
            source.format = v;
        } else if (a == "--clear") {
            source.clear = true;
        } else if (a == "--follow") {
            source.follow = true;
        } else if (a == "--poll-ms") {
            long long ms = 0;
            if (!value(i, a, v)) return false;
            if (!parse_int(v, ms)) {
                std::cerr << "Invalid --poll-ms value: " << v << "\n";
                return false;
            }
            source.poll_interval_ms = ms;
        } else if (a == "--min-level") {
            if (!value(i, a, v)) return false;
            auto level = lcsee::record::level_from_string(v);
            if (!level) {
                std::cerr << "Invalid --min-level (use one of V D I W E F): " << v << "\n";
                return false;
            }
            filters.min_level = level;
        } else if (a == "--tag") {
            if (!tags_from_cli) {
                filters.tags.clear();
                tags_from_cli = true;
            }
            size_t before = filters.tags.size();
            while (i + 1 < argc && !is_flag(argv[i + 1])) {
                filters.tags.push_back(argv[++i]);
            }
            if (filters.tags.size() == before) {
                std::cerr << "Missing value for --tag\n";
                return false;
            }
        } else if (a == "--grep") {
            if (!value(i, a, v)) return false;
            if (v.empty()) filters.grep.reset(); else filters.grep = v;
        } else if (a == "--contains") {
            if (!value(i, a, v)) return false;
            if (v.empty()) filters.contains.reset(); else filters.contains = v;
        } else if (a == "-i" || a == "--ignore-case") {
            filters.ignore_case = true;
        } else if (a == "--pid") {
            long long pid = 0;
            if (!value(i, a, v)) return false;
            if (!parse_int(v, pid) || pid < INT32_MIN || pid > INT32_MAX) {
                std::cerr << "Invalid --pid value: " << v << "\n";
                return false;
            }
            filters.pid = static_cast<int32_t>(pid);
        } else if (a == "--no-color") {
            output.color = false;
        } else if (a == "--console") {
            output.console = true;
        } else if (a == "--json") {
            if (!value(i, a, v)) return false;
            output.json_path = v;
        } else if (a == "--json-indent") {
            long long indent = 0;
            if (!value(i, a, v)) return false;
            if (!parse_int(v, indent) || indent < 0 || indent > 64) {
                std::cerr << "Invalid --json-indent value: " << v << "\n";
                return false;
            }
            output.json_indent = static_cast<int>(indent);
        } else if (a == "--csv") {
            if (!value(i, a, v)) return false;
            output.csv_path = v;
        } else if (a == "--config") {
            ++i;  // loaded before the flags
        } else if (a == "--verbose") {
            options.verbose = true;
        } else {
            std::cerr << "Unknown argument: " << a << "\n";
            print_usage(std::cerr);
            return false;
        }
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    bool adb_flag = false;
    bool input_flag = false;
    std::string config_path;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--help" || a == "-h") {
            print_usage(std::cout);
            return 0;
        }
        if (a == "--version") {
            std::cout << "lcsee v" << kVersion << "\n";
            return 0;
        }
        if (a == "--adb") adb_flag = true;
        if (a == "--input") input_flag = true;
        if (a == "--config" && i + 1 < argc) config_path = argv[i + 1];
    }

    if (adb_flag && input_flag) {
        std::cerr << "--adb and --input are mutually exclusive\n";
        return 2;
    }

    lcsee::config::Options options;
    try {
        if (!config_path.empty()) {
            lcsee::config::load_options_from_yaml(config_path, options);
        }
        if (!apply_arguments(argc, argv, options)) {
            return 2;
        }
        lcsee::config::validate_options(options);
    } catch (const lcsee::config::ConfigError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    }

    if (options.verbose) {
        if (options.source.mode == lcsee::config::SourceMode::Adb) {
            std::cerr << "Source: " << options.source.adb_path << " logcat (buffer "
                      << options.source.buffer << ")" << std::endl;
        } else {
            std::cerr << "Source: " << options.source.input_path
                      << (options.source.follow ? " (follow)" : "") << std::endl;
        }
        std::cerr << "Format: " << options.source.format << std::endl;
    }

    install_signal_handlers();

    try {
        auto session = lcsee::processor::make_session(options);
        session.pipeline->run(*session.source, g_running);
        session.source->close();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
