/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: file_line_source.cc
 * Description: Implementation of FileLineSource. Reads complete lines from a
 *              file, yields a final unterminated line at end of file, and in
 *              follow mode sleeps for the poll interval at end of file before
 *              retrying until a stop is requested.
 */

#include "lcsee/source/file_line_source.h"
#include <filesystem>
#include <thread>

namespace fs = std::filesystem;

namespace lcsee {
namespace source {

FileLineSource::FileLineSource(const Config& config) : config_(config) {
    std::error_code ec;
    if (fs::is_directory(config_.path, ec)) {
        throw SourceError("Input path is a directory: " + config_.path);
    }
    file_.open(config_.path, std::ios::in | std::ios::binary);
    if (!file_.is_open()) {
        throw SourceError("Failed to open input file: " + config_.path);
    }
}

FileLineSource::~FileLineSource() {
    close();
}

std::optional<std::string> FileLineSource::next() {
    if (!file_.is_open()) {
        return std::nullopt;
    }

    std::string chunk;
    while (true) {
        if (std::getline(file_, chunk)) {
            if (!file_.eof()) {
                std::string line = pending_ + chunk;
                pending_.clear();
                return finish_line(std::move(line));
            }
            // Hit end of file in the middle of a line
            pending_ += chunk;
        }

        if (file_.bad()) {
            throw SourceError("Read error on input file: " + config_.path);
        }

        if (!config_.follow) {
            if (pending_.empty()) {
                return std::nullopt;
            }
            std::string line = std::move(pending_);
            pending_.clear();
            return finish_line(std::move(line));
        }

        if (stop_requested()) {
            return std::nullopt;
        }
        file_.clear();
        std::this_thread::sleep_for(config_.poll_interval);
        if (stop_requested()) {
            return std::nullopt;
        }
    }
}

void FileLineSource::close() {
    if (file_.is_open()) {
        file_.close();
    }
    pending_.clear();
}

} // namespace source
} // namespace lcsee
