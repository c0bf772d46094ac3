#ifndef REDACTION_ENGINE_HPP
#define REDACTION_ENGINE_HPP

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <re2/re2.h>

#include "RedactionRule.hpp"

class PatternMatcherHS;

// Thrown by redact() when the input is not well-formed UTF-8.
class InvalidEncodingError : public std::runtime_error {
public:
    explicit InvalidEncodingError(size_t offset);
    size_t offset() const noexcept { return offset_; }

private:
    size_t offset_;
};

// Replacement counts of one redact() call, one entry per rule in order.
struct RedactionStats {
    std::vector<std::pair<std::string, size_t>> per_rule;
    size_t total() const;
};

class RedactionEngine {
public:
    // Throws std::invalid_argument on a bad label or an uncompilable pattern.
    explicit RedactionEngine(RuleSet rules = default_rule_set(), bool use_prefilter = true);
    ~RedactionEngine();

    RedactionEngine(const RedactionEngine&) = delete;
    RedactionEngine& operator=(const RedactionEngine&) = delete;

    // Apply every rule, in order, to the working text. Stateless and
    // safe to call from several threads at once.
    std::string redact(const std::string& text, RedactionStats* stats = nullptr) const;

    const RuleSet& rules() const { return rules_; }
    bool prefilterActive() const { return prefilter_ != nullptr; }

private:
    struct CompiledRule {
        std::unique_ptr<re2::RE2> re;
        std::string placeholder;
        bool        word_bounded{false};
    };

    static std::string replace_all(const std::string& text, const CompiledRule& rule, size_t& count);

    RuleSet rules_;
    std::vector<CompiledRule> compiled_;
    std::unique_ptr<PatternMatcherHS> prefilter_;
};

#endif // REDACTION_ENGINE_HPP
