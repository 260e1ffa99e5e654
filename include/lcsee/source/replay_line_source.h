/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: replay_line_source.h
 * Description: Header for ReplayLineSource, which yields lines already pulled
 *              from a source (during format detection) before continuing with
 *              that source, so the full original sequence is seen downstream.
 */

#pragma once

#include "lcsee/source/line_source.h"
#include <deque>
#include <string>
#include <vector>

namespace lcsee {
namespace source {

class ReplayLineSource : public LineSource {
public:
    // `inner` is not owned and must outlive this object
    ReplayLineSource(std::vector<std::string> replay, LineSource& inner);

    std::optional<std::string> next() override;
    void close() override;
    void set_stop_flag(const std::atomic<bool>* running) override;

private:
    std::deque<std::string> replay_;
    LineSource& inner_;
};

} // namespace source
} // namespace lcsee
