#include "RedactionEngine.hpp"
#include "ContentParser.hpp"
#include "PatternMatcherHS.hpp"
#include <iostream>


InvalidEncodingError::InvalidEncodingError(size_t offset)
    : std::runtime_error("invalid UTF-8 at byte offset " + std::to_string(offset)),
      offset_(offset) {}

size_t RedactionStats::total() const {
    size_t n = 0;
    for (const auto& r : per_rule) n += r.second;
    return n;
}


// Desc: is the code point at [start, start+len) a word character (\pL, \pN or '_')
// In: const std::string& text, size_t start, size_t len
// Out: bool
static bool is_word_char(const std::string& text, size_t start, size_t len) {
    static const RE2 word_re("[\\pL\\pN_]");
    return RE2::FullMatch(re2::StringPiece(text.data() + start, len), word_re);
}

// Desc: \b at byte offset pos, with Unicode word characters
// In: const std::string& text, size_t pos
// Out: bool
static bool at_word_boundary(const std::string& text, size_t pos) {
    bool before = false;
    if (pos > 0) {
        const size_t prev = ContentParser::utf8_prev_start(text, pos);
        before = is_word_char(text, prev, pos - prev);
    }
    const bool after = pos < text.size() &&
                       is_word_char(text, pos, ContentParser::utf8_char_length(text, pos));
    return before != after;
}


// Desc: validate and compile the rule set; build the Hyperscan prefilter
// In: RuleSet rules, bool use_prefilter
// Out: (ctor) throws std::invalid_argument on a bad rule
RedactionEngine::RedactionEngine(RuleSet rules, bool use_prefilter)
    : rules_(std::move(rules)) {
    compiled_.reserve(rules_.size());
    for (const auto& r : rules_) {
        if (!is_valid_label(r.label)) {
            throw std::invalid_argument("[RedactionEngine] invalid rule label: '" + r.label + "'");
        }
        RE2::Options opt;
        opt.set_log_errors(false);
        opt.set_case_sensitive(!r.case_insensitive);
        auto re = std::make_unique<RE2>(r.pattern, opt);
        if (!re->ok()) {
            throw std::invalid_argument("[RedactionEngine] invalid pattern for " + r.label + ": " + re->error());
        }
        compiled_.push_back(CompiledRule{std::move(re), placeholder_for(r.label), r.word_bounded});
    }

    if (use_prefilter && !rules_.empty()) {
        auto hs = std::make_unique<PatternMatcherHS>();
        if (hs->buildFromRules(rules_)) {
            prefilter_ = std::move(hs);
        } else {
            std::cerr << "[RedactionEngine] hyperscan prefilter unavailable, using RE2 scan only\n";
        }
    }
}

RedactionEngine::~RedactionEngine() = default;

// Desc: replace every non-overlapping match of one rule, leftmost-first
// In: const std::string& text, const CompiledRule& rule, size_t& count
// Out: std::string (rewritten text); count = number of replaced spans
std::string RedactionEngine::replace_all(const std::string& text, const CompiledRule& rule, size_t& count) {
    count = 0;
    const re2::StringPiece input(text);
    const size_t n = text.size();

    std::string out;
    size_t tail = 0; // first byte not yet copied to out
    size_t pos  = 0; // where the next search starts
    re2::StringPiece m;
    while (pos <= n) {
        if (!rule.re->Match(input, pos, n, RE2::UNANCHORED, &m, 1)) break;
        const size_t s = m.data() ? static_cast<size_t>(m.data() - text.data()) : pos;
        const size_t e = s + m.size();

        if (rule.word_bounded && !(at_word_boundary(text, s) && at_word_boundary(text, e))) {
            if (s >= n) break;
            pos = s + ContentParser::utf8_char_length(text, s);
            continue;
        }

        if (count == 0) out.reserve(n);
        out.append(text, tail, s - tail);
        out += rule.placeholder;
        ++count;
        tail = e;
        pos  = e;
        if (e == s) {
            // empty match: keep one code point and move past it
            if (e >= n) break;
            const size_t step = ContentParser::utf8_char_length(text, e);
            out.append(text, e, step);
            tail = pos = e + step;
        }
    }
    if (count == 0) return text;
    out.append(text, tail, std::string::npos);
    return out;
}

// Desc: run all rules in order over the working text
// In: const std::string& text, RedactionStats* stats (optional)
// Out: std::string; throws InvalidEncodingError on malformed UTF-8
std::string RedactionEngine::redact(const std::string& text, RedactionStats* stats) const {
    size_t bad = 0;
    if (!ContentParser::is_valid_utf8(text, bad)) {
        throw InvalidEncodingError(bad);
    }

    if (stats) {
        stats->per_rule.clear();
        stats->per_rule.reserve(rules_.size());
    }

    std::string working = text;
    std::vector<char> hits;
    bool hits_fresh = false;

    for (size_t i = 0; i < compiled_.size(); ++i) {
        size_t count = 0;

        bool may_match = true;
        if (prefilter_) {
            // rescan only after the working text changed
            if (!hits_fresh) {
                if (!prefilter_->scan(working, hits)) hits.assign(compiled_.size(), 1);
                hits_fresh = true;
            }
            may_match = hits[i] != 0;
        }

        if (may_match) {
            std::string next = replace_all(working, compiled_[i], count);
            if (count > 0) {
                working.swap(next);
                hits_fresh = false;
            }
        }

        if (stats) stats->per_rule.emplace_back(rules_[i].label, count);
    }
    return working;
}
