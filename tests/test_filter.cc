#include "lcsee/filter/filter_chain.h"
#include <algorithm>
#include <cassert>
#include <iostream>
#include <numeric>
#include <string>
#include <vector>

using lcsee::LogRecord;
using lcsee::config::FilterOptions;
using lcsee::filter::Criterion;
using lcsee::filter::FilterChain;
using lcsee::filter::FilterError;
using lcsee::record::Level;

static LogRecord make_record(const std::string& level, const std::string& tag,
                             const std::string& msg, bool with_pid = true, int32_t pid = 100) {
    LogRecord r;
    r.set_ts_raw("01-01 00:00:00.000");
    r.set_ts_iso("2024-01-01T00:00:00.000000");
    if (with_pid) {
        r.set_pid(pid);
        r.set_tid(pid + 1);
    }
    r.set_level(level);
    r.set_tag(tag);
    r.set_msg(msg);
    return r;
}

void test_empty_chain() {
    std::cout << "Testing empty filter chain..." << std::endl;

    FilterChain chain = FilterChain::from_options(FilterOptions{});
    assert(chain.empty());
    assert(chain.accepts(make_record("V", "any", "thing")));
    assert(chain.accepts(make_record("F", "", "", false)));

    std::cout << "  ✓ Empty chain accepts everything" << std::endl;
}

void test_min_level_ordering() {
    std::cout << "Testing minimum level ordering..." << std::endl;

    const std::vector<std::string> letters = {"V", "D", "I", "W", "E", "F"};
    for (size_t lo = 0; lo < letters.size(); ++lo) {
        for (size_t hi = 0; hi < letters.size(); ++hi) {
            if (lo == hi) continue;
            FilterChain chain;
            chain.add(lcsee::filter::MinLevelCriterion{static_cast<Level>(lo)});
            bool passes = chain.accepts(make_record(letters[hi], "T", "m"));
            assert(passes == (hi > lo));
        }
        // A level always passes its own minimum
        FilterChain same;
        same.add(lcsee::filter::MinLevelCriterion{static_cast<Level>(lo)});
        assert(same.accepts(make_record(letters[lo], "T", "m")));
    }

    std::cout << "  ✓ Higher levels pass lower minimums, never the reverse" << std::endl;
}

void test_tag_set() {
    std::cout << "Testing tag set..." << std::endl;

    FilterOptions options;
    options.tags = {"A", "Net"};
    FilterChain chain = FilterChain::from_options(options);
    assert(chain.accepts(make_record("I", "A", "m")));
    assert(chain.accepts(make_record("I", "Net", "m")));
    assert(!chain.accepts(make_record("I", "B", "m")));
    assert(!chain.accepts(make_record("I", "a", "m")));
    assert(!chain.accepts(make_record("I", "Network", "m")));

    std::cout << "  ✓ Exact tag membership" << std::endl;
}

void test_message_criteria() {
    std::cout << "Testing regex and substring..." << std::endl;

    FilterOptions options;
    options.grep = "time(out)?\\s+\\d+";
    FilterChain regex = FilterChain::from_options(options);
    assert(regex.accepts(make_record("I", "T", "socket timeout 30 ms")));
    assert(!regex.accepts(make_record("I", "T", "socket TIMEOUT 30 ms")));

    options.ignore_case = true;
    FilterChain regex_icase = FilterChain::from_options(options);
    assert(regex_icase.accepts(make_record("I", "T", "socket TIMEOUT 30 ms")));
    std::cout << "  ✓ Regex search with case toggle" << std::endl;

    FilterOptions sub;
    sub.contains = "Wifi";
    FilterChain substring = FilterChain::from_options(sub);
    assert(substring.accepts(make_record("I", "T", "Wifi on")));
    assert(!substring.accepts(make_record("I", "T", "wifi on")));

    sub.ignore_case = true;
    FilterChain substring_icase = FilterChain::from_options(sub);
    assert(substring_icase.accepts(make_record("I", "T", "WIFI on")));
    assert(!substring_icase.accepts(make_record("I", "T", "bluetooth")));
    std::cout << "  ✓ Substring with case toggle" << std::endl;

    bool threw = false;
    try {
        FilterOptions bad;
        bad.grep = "([unclosed";
        FilterChain::from_options(bad);
    } catch (const FilterError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "  ✓ Invalid pattern rejected" << std::endl;
}

void test_pid() {
    std::cout << "Testing pid criterion..." << std::endl;

    FilterOptions options;
    options.pid = 100;
    FilterChain chain = FilterChain::from_options(options);
    assert(chain.accepts(make_record("I", "T", "m", true, 100)));
    assert(!chain.accepts(make_record("I", "T", "m", true, 101)));
    assert(!chain.accepts(make_record("I", "T", "m", false)));

    std::cout << "  ✓ Record without pid never passes" << std::endl;
}

void test_order_independence() {
    std::cout << "Testing evaluation order independence..." << std::endl;

    std::vector<Criterion> criteria = {
        lcsee::filter::MinLevelCriterion{Level::Info},
        lcsee::filter::TagSetCriterion{{"A", "B"}},
        lcsee::filter::make_regex_criterion("err(or)?", true),
        lcsee::filter::make_substring_criterion("disk", false),
        lcsee::filter::PidCriterion{100},
    };

    const std::vector<LogRecord> records = {
        make_record("E", "A", "disk Error", true, 100),
        make_record("D", "A", "disk error", true, 100),
        make_record("W", "C", "disk error", true, 100),
        make_record("W", "B", "disk ok", true, 100),
        make_record("W", "B", "DISK error", true, 100),
        make_record("F", "B", "disk ERR", true, 7),
        make_record("F", "B", "disk err", false),
    };

    for (const auto& record : records) {
        std::vector<size_t> order(criteria.size());
        std::iota(order.begin(), order.end(), 0);

        FilterChain reference;
        for (size_t i : order) reference.add(criteria[i]);
        const bool expected = reference.accepts(record);

        do {
            FilterChain chain;
            for (size_t i : order) chain.add(criteria[i]);
            assert(chain.accepts(record) == expected);
        } while (std::next_permutation(order.begin(), order.end()));
    }
    assert(FilterChain().accepts(records[0]));

    // Only the first record satisfies every criterion
    FilterChain all;
    for (const auto& c : criteria) all.add(c);
    assert(all.accepts(records[0]));
    for (size_t i = 1; i < records.size(); ++i) {
        assert(!all.accepts(records[i]));
    }

    std::cout << "  ✓ All permutations agree" << std::endl;
}

int main() {
    std::cout << "Running Filter tests..." << std::endl;
    test_empty_chain();
    test_min_level_ordering();
    test_tag_set();
    test_message_criteria();
    test_pid();
    test_order_independence();
    std::cout << "\nAll Filter tests passed!" << std::endl;
    return 0;
}
