#include "RedactionRule.hpp"

// Unicode whitespace: ASCII controls \t-\r, \x1C-\x1F, space, NEL and every Z* code point.
static const std::string kSpaceClass = R"(\t\n\x{0B}\f\r\x{1C}-\x{1F} \x{85}\p{Z})";


// Desc: built-in ordered rule table (EMAIL, IPV4, API_KEY, DB_URI)
// In: (none)
// Out: RuleSet
RuleSet default_rule_set() {
    return {
        {"EMAIL",   R"([a-zA-Z0-9._%+-]+@[a-zA-Z0-9.-]+\.[a-zA-Z]{2,})", false},
        // octets are not range checked: 999.999.999.999 matches
        {"IPV4",    R"((?:\p{Nd}{1,3}\.){3}\p{Nd}{1,3})", false, true},
        {"API_KEY", "(api[-_]?key|secret|token)[" + kSpaceClass + "]*[:=][" + kSpaceClass + "]*"
                    R"(['"]?([a-zA-Z0-9_-]{20,})['"]?)", true},
        {"DB_URI",  "(postgresql|mysql|mongodb)://[^" + kSpaceClass + "]+", false},
    };
}

// Desc: build the literal replacement for a label
// In: const std::string& label
// Out: std::string ("<LABEL_REDACTED>")
std::string placeholder_for(const std::string& label) {
    return "<" + label + "_REDACTED>";
}

// Desc: check label shape [A-Z][A-Z0-9_]*
// In: const std::string& label
// Out: bool
bool is_valid_label(const std::string& label) {
    if (label.empty()) return false;
    if (label[0] < 'A' || label[0] > 'Z') return false;
    for (char c : label) {
        bool ok = (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
        if (!ok) return false;
    }
    return true;
}
