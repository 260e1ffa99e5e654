#include "lcsee/source/file_line_source.h"
#include "lcsee/source/process_line_source.h"
#include "lcsee/source/replay_line_source.h"
#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using lcsee::source::FileLineSource;
using lcsee::source::LineSource;
using lcsee::source::ProcessLineSource;
using lcsee::source::ReplayLineSource;
using lcsee::source::SourceError;
namespace fs = std::filesystem;

static fs::path test_dir() {
    fs::path dir = fs::temp_directory_path() / "lcsee_test_sources";
    fs::create_directories(dir);
    return dir;
}

static void write_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

static std::vector<std::string> drain(LineSource& source) {
    std::vector<std::string> lines;
    while (auto line = source.next()) {
        lines.push_back(*line);
    }
    return lines;
}

void test_file_source() {
    std::cout << "Testing FileLineSource..." << std::endl;

    fs::path path = test_dir() / "input.log";
    write_file(path, "first\nsecond\r\n\nbad \xff\xfe bytes \xc3\xa9\nlast without newline");

    FileLineSource::Config config;
    config.path = path.string();
    FileLineSource source(config);
    auto lines = drain(source);

    assert(lines.size() == 5);
    assert(lines[0] == "first");
    assert(lines[1] == "second");
    assert(lines[2] == "");
    assert(lines[3] == "bad  bytes \xc3\xa9");
    assert(lines[4] == "last without newline");
    assert(!source.next());
    std::cout << "  ✓ Terminators stripped, invalid UTF-8 dropped, final line kept" << std::endl;

    source.close();
    source.close();
    assert(!source.next());

    bool threw = false;
    try {
        FileLineSource::Config missing;
        missing.path = (test_dir() / "does_not_exist.log").string();
        FileLineSource bad(missing);
    } catch (const SourceError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        FileLineSource::Config dir;
        dir.path = test_dir().string();
        FileLineSource bad(dir);
    } catch (const SourceError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "  ✓ Unreadable input rejected at startup" << std::endl;

    std::cout << "  ✓ FileLineSource test passed" << std::endl;
}

void test_follow_mode() {
    std::cout << "Testing FileLineSource follow mode..." << std::endl;

    fs::path path = test_dir() / "follow.log";
    write_file(path, "one\n");

    FileLineSource::Config config;
    config.path = path.string();
    config.follow = true;
    config.poll_interval = std::chrono::milliseconds(20);
    FileLineSource source(config);

    std::atomic<bool> running{true};
    source.set_stop_flag(&running);

    assert(*source.next() == "one");

    std::thread writer([&path]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        std::ofstream out(path, std::ios::app);
        out << "tw" << std::flush;
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        out << "o\n" << std::flush;
    });
    // The partial "tw" is held back until its newline arrives
    auto line = source.next();
    writer.join();
    assert(line && *line == "two");
    std::cout << "  ✓ Appended lines picked up" << std::endl;

    std::thread stopper([&running]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        running = false;
    });
    auto end = source.next();
    stopper.join();
    assert(!end);
    std::cout << "  ✓ Stop request ends the sequence" << std::endl;

    std::cout << "  ✓ Follow mode test passed" << std::endl;
}

void test_replay_source() {
    std::cout << "Testing ReplayLineSource..." << std::endl;

    fs::path path = test_dir() / "replay.log";
    write_file(path, "c\nd\n");

    FileLineSource::Config config;
    config.path = path.string();
    FileLineSource inner(config);

    ReplayLineSource replay({"a", "b"}, inner);
    auto lines = drain(replay);
    assert((lines == std::vector<std::string>{"a", "b", "c", "d"}));

    std::cout << "  ✓ Replayed lines come first, none lost" << std::endl;
}

void test_process_source() {
    std::cout << "Testing ProcessLineSource..." << std::endl;

    ProcessLineSource::Config config;
    auto cmd = ProcessLineSource::build_command(config);
    assert((cmd == std::vector<std::string>{"adb", "logcat", "-v", "threadtime"}));

    config.serial = "emulator-5554";
    config.buffer = "radio";
    config.format = "time";
    cmd = ProcessLineSource::build_command(config);
    assert((cmd == std::vector<std::string>{
        "adb", "-s", "emulator-5554", "logcat", "-v", "time", "-b", "radio"}));
    std::cout << "  ✓ Argument template" << std::endl;

    // Fake reader: echoes its arguments, then two lines without a final newline
    fs::path script = test_dir() / "fake_adb.sh";
    fs::path cleared = test_dir() / "fake_adb.cleared";
    fs::remove(cleared);
    write_file(script,
               "#!/bin/sh\n"
               "case \"$*\" in *' -c') touch \"" + cleared.string() + "\"; exit 0;; esac\n"
               "echo \"args: $*\"\n"
               "printf '01-01 12:00:00.000 1 2 I T: one\\r\\n'\n"
               "printf 'tail'\n");
    fs::permissions(script, fs::perms::owner_all, fs::perm_options::replace);

    config.adb_path = script.string();
    config.clear = true;
    ProcessLineSource source(config);
    auto lines = drain(source);
    assert(lines.size() == 3);
    assert(lines[0] == "args: -s emulator-5554 logcat -v time -b radio");
    assert(lines[1] == "01-01 12:00:00.000 1 2 I T: one");
    assert(lines[2] == "tail");
    assert(fs::exists(cleared));
    source.close();
    source.close();
    std::cout << "  ✓ Output streamed line by line, clear step run first" << std::endl;

    bool threw = false;
    try {
        ProcessLineSource::Config missing;
        missing.adb_path = (test_dir() / "no_such_adb").string();
        ProcessLineSource bad(missing);
    } catch (const SourceError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "  ✓ Missing executable rejected at startup" << std::endl;

    std::cout << "  ✓ ProcessLineSource test passed" << std::endl;
}

void test_process_stop() {
    std::cout << "Testing stop while the reader is silent..." << std::endl;

    // Reader writes one line, then stays alive without output
    fs::path script = test_dir() / "silent_adb.sh";
    write_file(script,
               "#!/bin/sh\n"
               "echo 'first'\n"
               "exec sleep 30\n");
    fs::permissions(script, fs::perms::owner_all, fs::perm_options::replace);

    ProcessLineSource::Config config;
    config.adb_path = script.string();
    ProcessLineSource source(config);

    std::atomic<bool> running{true};
    source.set_stop_flag(&running);
    auto first = source.next();
    assert(first && *first == "first");

    std::thread stopper([&running]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        running = false;
    });

    auto started = std::chrono::steady_clock::now();
    auto line = source.next();
    auto waited = std::chrono::steady_clock::now() - started;
    stopper.join();

    assert(!line.has_value());
    assert(waited < std::chrono::seconds(5));
    source.close();
    std::cout << "  ✓ Stop noticed without further output" << std::endl;
}

int main() {
    std::cout << "Running Source tests..." << std::endl;
    test_file_source();
    test_follow_mode();
    test_replay_source();
    test_process_source();
    test_process_stop();
    fs::remove_all(test_dir());
    std::cout << "\nAll Source tests passed!" << std::endl;
    return 0;
}
