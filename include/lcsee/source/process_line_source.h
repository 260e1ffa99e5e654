/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: process_line_source.h
 * Description: Header for ProcessLineSource, which launches the device log
 *              reader (adb logcat) and yields its standard output line by line
 *              as the process emits it. The sequence ends when the process
 *              exits.
 */

#pragma once

#include "lcsee/source/line_source.h"
#include <string>
#include <sys/types.h>
#include <vector>

namespace lcsee {
namespace source {

class ProcessLineSource : public LineSource {
public:
    struct Config {
        std::string adb_path = "adb";
        std::string serial;              // empty: let adb pick the device
        std::string buffer = "main";
        std::string format = "threadtime";
        bool clear = false;              // run "<cmd> -c" before streaming
    };

    // Launches the reader; throws SourceError if it cannot be started
    explicit ProcessLineSource(const Config& config);
    ~ProcessLineSource() override;

    ProcessLineSource(const ProcessLineSource&) = delete;
    ProcessLineSource& operator=(const ProcessLineSource&) = delete;

    std::optional<std::string> next() override;

    // Closes the pipe, terminates and reaps the reader if still running
    void close() override;

    // <adb> [-s <serial>] logcat -v <format> [-b <buffer>]
    static std::vector<std::string> build_command(const Config& config);

private:
    Config config_;
    pid_t child_ = -1;
    int fd_ = -1;
    std::string buffer_;

    void reap(bool terminate);
};

// Fork and exec `argv`; the child's stdout goes to `stdout_fd` unless it is -1.
// Throws SourceError when the executable cannot be launched.
pid_t spawn_process(const std::vector<std::string>& argv, int stdout_fd);

} // namespace source
} // namespace lcsee
