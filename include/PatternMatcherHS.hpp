#pragma once
#include <mutex>
#include <string>
#include <vector>
#include <hs/hs.h>

#include "RedactionRule.hpp"

// Multi-regex prefilter built on Hyperscan. One pattern id per rule, in
// rule-set order, so a scan tells which rules can match a given text.
class PatternMatcherHS {
public:
    PatternMatcherHS();
    ~PatternMatcherHS();

    PatternMatcherHS(const PatternMatcherHS&) = delete;
    PatternMatcherHS& operator=(const PatternMatcherHS&) = delete;

    // Build (or rebuild) from the rule patterns.
    // Returns false if Hyperscan rejects any of them.
    bool buildFromRules(const RuleSet& rules);

    // Fast boolean check: does any pattern match 'text'?
    bool matches(const std::string& text) const;

    // hits[i] != 0 when rule i matches somewhere in 'text'. Patterns are
    // compiled in UTF-8 mode, so 'text' must be valid UTF-8.
    // Returns false on scan error (hits is then unspecified).
    bool scan(const std::string& text, std::vector<char>& hits) const;

    size_t patternCount() const { return count_; }
    bool   isReady()      const { return ready_; }

private:
    hs_database_t* db_{nullptr};
    hs_scratch_t*  base_scratch_{nullptr};
    bool           ready_{false};
    size_t         count_{0};

    // base_scratch_ is used by one scan at a time; concurrent scans clone.
    mutable std::mutex scratch_mu_;

    void freeAll_() noexcept;
};
