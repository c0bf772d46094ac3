#pragma once
#include <string>
#include <vector>

// One detection rule: everything matching `pattern` becomes <LABEL_REDACTED>.
struct RedactionRule {
    std::string label;             // uppercase identifier, e.g. "EMAIL"
    std::string pattern;           // RE2 syntax, matched against UTF-8 text
    bool        case_insensitive{false};
    // match must start and end on a Unicode word boundary (\b with \pL\pN_ word chars)
    bool        word_bounded{false};
};

// Rules run in vector order; each one sees the output of the previous one.
using RuleSet = std::vector<RedactionRule>;

RuleSet default_rule_set();

std::string placeholder_for(const std::string& label);
bool is_valid_label(const std::string& label);
