/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: file_line_source.h
 * Description: Header for FileLineSource, which reads a log file line by line.
 *              In follow mode it keeps polling the file for appended lines
 *              instead of ending at end of file.
 */

#pragma once

#include "lcsee/source/line_source.h"
#include <chrono>
#include <fstream>
#include <string>

namespace lcsee {
namespace source {

class FileLineSource : public LineSource {
public:
    struct Config {
        std::string path;
        bool follow = false;
        std::chrono::milliseconds poll_interval = std::chrono::milliseconds(200);
    };

    // Throws SourceError if the file cannot be opened
    explicit FileLineSource(const Config& config);
    ~FileLineSource() override;

    std::optional<std::string> next() override;
    void close() override;

private:
    Config config_;
    std::ifstream file_;
    std::string pending_;  // unterminated tail held back in follow mode
};

} // namespace source
} // namespace lcsee
