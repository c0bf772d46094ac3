#include "PatternMatcherHS.hpp"
#include <iostream>
#include <limits>

PatternMatcherHS::PatternMatcherHS() = default;

PatternMatcherHS::~PatternMatcherHS() {
    freeAll_();
}

void PatternMatcherHS::freeAll_() noexcept {
    if (base_scratch_) { hs_free_scratch(base_scratch_); base_scratch_ = nullptr; }
    if (db_)           { hs_free_database(db_);           db_           = nullptr; }
    ready_ = false;
    count_ = 0;
}

// Desc: compile all rule patterns into one block-mode database
// In: const RuleSet& rules
// Out: bool (false if compilation or scratch allocation fails)
bool PatternMatcherHS::buildFromRules(const RuleSet& rules) {
    freeAll_();

    count_ = rules.size();
    if (rules.empty()) {
        // No patterns: treat as ready but trivially false on matches()
        ready_ = true;
        return true;
    }

    std::vector<const char*> cpat;
    std::vector<unsigned> flags;
    std::vector<unsigned> ids;
    cpat.reserve(rules.size());
    flags.reserve(rules.size());
    ids.reserve(rules.size());
    for (size_t i = 0; i < rules.size(); ++i) {
        cpat.push_back(rules[i].pattern.c_str());
        // one report per pattern is enough to know the rule fires;
        // input is validated UTF-8 and the rules use \p{..} classes
        unsigned f = HS_FLAG_SINGLEMATCH | HS_FLAG_UTF8 | HS_FLAG_UCP;
        if (rules[i].case_insensitive) f |= HS_FLAG_CASELESS;
        flags.push_back(f);
        ids.push_back(static_cast<unsigned>(i));
    }

    hs_compile_error_t* ce = nullptr;
    hs_error_t rc = hs_compile_multi(
        cpat.data(),
        flags.data(),
        ids.data(),
        static_cast<unsigned>(cpat.size()),
        HS_MODE_BLOCK,
        nullptr,
        &db_,
        &ce
    );

    if (rc != HS_SUCCESS) {
        if (ce) {
            std::cerr << "[PatternMatcherHS] compile failed";
            if (ce->expression >= 0 && static_cast<size_t>(ce->expression) < rules.size())
                std::cerr << " for " << rules[ce->expression].label;
            std::cerr << ": " << ce->message << "\n";
            hs_free_compile_error(ce);
        } else {
            std::cerr << "[PatternMatcherHS] compile failed (unknown)\n";
        }
        freeAll_();
        return false;
    }
    if (ce) hs_free_compile_error(ce);

    rc = hs_alloc_scratch(db_, &base_scratch_);
    if (rc != HS_SUCCESS) {
        std::cerr << "[PatternMatcherHS] hs_alloc_scratch failed: " << rc << "\n";
        freeAll_();
        return false;
    }

    ready_ = true;
    return true;
}

bool PatternMatcherHS::matches(const std::string& text) const {
    std::vector<char> hits;
    if (!scan(text, hits)) return false;
    for (char h : hits) if (h) return true;
    return false;
}

// Desc: run one block scan and record which pattern ids fired
// In: const std::string& text, std::vector<char>& hits
// Out: bool (false on scan error)
bool PatternMatcherHS::scan(const std::string& text, std::vector<char>& hits) const {
    hits.assign(count_, 0);
    if (!ready_) return false;
    if (count_ == 0) return true;
    if (text.size() > std::numeric_limits<unsigned int>::max()) return false;

    std::unique_lock<std::mutex> lk(scratch_mu_, std::try_to_lock);
    hs_scratch_t* scratch = nullptr;
    hs_scratch_t* tmp     = nullptr;
    if (lk.owns_lock()) {
        scratch = base_scratch_;
    } else {
        if (hs_clone_scratch(base_scratch_, &tmp) != HS_SUCCESS) {
            std::cerr << "[PatternMatcherHS] hs_clone_scratch failed\n";
            return false;
        }
        scratch = tmp;
    }

    auto on_match = [](unsigned int id, unsigned long long, unsigned long long, unsigned int, void* ctx) -> int {
        auto* h = static_cast<std::vector<char>*>(ctx);
        if (id < h->size()) (*h)[id] = 1;
        return 0; // keep scanning for the other ids
    };

    hs_error_t rc = hs_scan(
        db_,
        text.data(),
        static_cast<unsigned int>(text.size()),
        0,
        scratch,
        on_match,
        &hits
    );

    if (tmp) hs_free_scratch(tmp);

    if (rc != HS_SUCCESS) {
        std::cerr << "[PatternMatcherHS] hs_scan error: " << rc << "\n";
        return false;
    }
    return true;
}
