/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: filter_chain.cc
 * Description: Implementation of FilterChain and the individual record
 *              criteria. Case-insensitive substring matching folds ASCII
 *              letters only.
 */

#include "lcsee/filter/filter_chain.h"
#include <algorithm>
#include <cctype>

namespace lcsee {
namespace filter {

namespace {

std::string to_lower_ascii(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// Visitor evaluating one criterion against a record
struct CriterionMatcher {
    const LogRecord& record;

    bool operator()(const MinLevelCriterion& c) const {
        auto level = record::level_from_string(record.level());
        return level && record::level_rank(*level) >= record::level_rank(c.min_level);
    }

    bool operator()(const TagSetCriterion& c) const {
        return c.tags.count(record.tag()) > 0;
    }

    bool operator()(const RegexCriterion& c) const {
        return std::regex_search(record.msg(), c.regex);
    }

    bool operator()(const SubstringCriterion& c) const {
        if (c.ignore_case) {
            return to_lower_ascii(record.msg()).find(c.needle) != std::string::npos;
        }
        return record.msg().find(c.needle) != std::string::npos;
    }

    bool operator()(const PidCriterion& c) const {
        return record.has_pid() && record.pid() == c.pid;
    }
};

} // namespace

bool matches(const Criterion& criterion, const LogRecord& record) {
    return std::visit(CriterionMatcher{record}, criterion);
}

Criterion make_regex_criterion(const std::string& pattern, bool ignore_case) {
    auto flags = std::regex::ECMAScript;
    if (ignore_case) {
        flags |= std::regex::icase;
    }
    try {
        return RegexCriterion{pattern, std::regex(pattern, flags)};
    } catch (const std::regex_error& e) {
        throw FilterError("Invalid message pattern '" + pattern + "': " + e.what());
    }
}

Criterion make_substring_criterion(const std::string& needle, bool ignore_case) {
    return SubstringCriterion{ignore_case ? to_lower_ascii(needle) : needle, ignore_case};
}

FilterChain FilterChain::from_options(const config::FilterOptions& options) {
    FilterChain chain;

    if (options.min_level) {
        chain.add(MinLevelCriterion{*options.min_level});
    }
    if (!options.tags.empty()) {
        chain.add(TagSetCriterion{
            std::unordered_set<std::string>(options.tags.begin(), options.tags.end())});
    }
    if (options.grep) {
        chain.add(make_regex_criterion(*options.grep, options.ignore_case));
    }
    if (options.contains) {
        chain.add(make_substring_criterion(*options.contains, options.ignore_case));
    }
    if (options.pid) {
        chain.add(PidCriterion{*options.pid});
    }

    return chain;
}

void FilterChain::add(Criterion criterion) {
    criteria_.push_back(std::move(criterion));
}

bool FilterChain::accepts(const LogRecord& record) const {
    for (const auto& criterion : criteria_) {
        if (!matches(criterion, record)) {
            return false;
        }
    }
    return true;
}

} // namespace filter
} // namespace lcsee
