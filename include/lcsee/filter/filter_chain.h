/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: filter_chain.h
 * Description: Header for FilterChain, a conjunction of independent record
 *              criteria (minimum level, tag set, message regex, message
 *              substring, exact pid). Criteria are plain data in a tagged
 *              union; an empty chain accepts every record.
 */

#pragma once

#include "lcsee/config/options.h"
#include "lcsee/record/level.h"
#include "log_record.pb.h"
#include <cstdint>
#include <regex>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <variant>
#include <vector>

namespace lcsee {
namespace filter {

// Raised when a criterion cannot be built (invalid pattern)
class FilterError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct MinLevelCriterion {
    record::Level min_level;
};

struct TagSetCriterion {
    std::unordered_set<std::string> tags;
};

struct RegexCriterion {
    std::string pattern;
    std::regex regex;
};

struct SubstringCriterion {
    std::string needle;      // already case-folded when ignore_case
    bool ignore_case = false;
};

struct PidCriterion {
    int32_t pid;
};

using Criterion = std::variant<MinLevelCriterion,
                               TagSetCriterion,
                               RegexCriterion,
                               SubstringCriterion,
                               PidCriterion>;

// Single criterion test, independent of every other criterion
bool matches(const Criterion& criterion, const LogRecord& record);

class FilterChain {
public:
    FilterChain() = default;

    // Build the chain for the configured filters; throws FilterError
    static FilterChain from_options(const config::FilterOptions& options);

    void add(Criterion criterion);

    // Logical AND over all criteria, stops at the first failing one
    bool accepts(const LogRecord& record) const;

    size_t size() const { return criteria_.size(); }
    bool empty() const { return criteria_.empty(); }
    const std::vector<Criterion>& criteria() const { return criteria_; }

private:
    std::vector<Criterion> criteria_;
};

// Criterion constructors
Criterion make_regex_criterion(const std::string& pattern, bool ignore_case);
Criterion make_substring_criterion(const std::string& needle, bool ignore_case);

} // namespace filter
} // namespace lcsee
