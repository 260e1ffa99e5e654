/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: replay_line_source.cc
 * Description: Implementation of ReplayLineSource.
 */

#include "lcsee/source/replay_line_source.h"

namespace lcsee {
namespace source {

ReplayLineSource::ReplayLineSource(std::vector<std::string> replay, LineSource& inner)
    : replay_(std::make_move_iterator(replay.begin()), std::make_move_iterator(replay.end())),
      inner_(inner) {}

std::optional<std::string> ReplayLineSource::next() {
    if (!replay_.empty()) {
        std::string line = std::move(replay_.front());
        replay_.pop_front();
        return line;
    }
    return inner_.next();
}

void ReplayLineSource::close() {
    replay_.clear();
    inner_.close();
}

void ReplayLineSource::set_stop_flag(const std::atomic<bool>* running) {
    LineSource::set_stop_flag(running);
    inner_.set_stop_flag(running);
}

} // namespace source
} // namespace lcsee
