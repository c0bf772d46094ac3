#include "ContentParser.hpp"


// Desc: validate UTF-8 (no overlongs, no surrogates, max U+10FFFF)
// In: const std::string& text, size_t& bad_offset
// Out: bool (true if the whole buffer is well-formed)
bool ContentParser::is_valid_utf8(const std::string& text, size_t& bad_offset) {
    const size_t n = text.size();
    size_t i = 0;
    while (i < n) {
        const unsigned char c = static_cast<unsigned char>(text[i]);
        if (c < 0x80) { ++i; continue; }

        size_t len = 0;
        unsigned char lo = 0x80, hi = 0xBF; // allowed range of the 2nd byte
        if (c >= 0xC2 && c <= 0xDF)      { len = 2; }
        else if (c == 0xE0)              { len = 3; lo = 0xA0; }
        else if (c == 0xED)              { len = 3; hi = 0x9F; }   // no surrogates
        else if (c >= 0xE1 && c <= 0xEF) { len = 3; }
        else if (c == 0xF0)              { len = 4; lo = 0x90; }
        else if (c >= 0xF1 && c <= 0xF3) { len = 4; }
        else if (c == 0xF4)              { len = 4; hi = 0x8F; }   // <= U+10FFFF
        else { bad_offset = i; return false; }

        if (i + len > n) { bad_offset = i; return false; }

        const unsigned char c1 = static_cast<unsigned char>(text[i + 1]);
        if (c1 < lo || c1 > hi) { bad_offset = i; return false; }
        for (size_t k = 2; k < len; ++k) {
            const unsigned char ck = static_cast<unsigned char>(text[i + k]);
            if (ck < 0x80 || ck > 0xBF) { bad_offset = i; return false; }
        }
        i += len;
    }
    return true;
}

size_t ContentParser::utf8_char_length(const std::string& text, size_t pos) {
    const unsigned char c = static_cast<unsigned char>(text[pos]);
    size_t len = 1;
    if (c >= 0xF0)      len = 4;
    else if (c >= 0xE0) len = 3;
    else if (c >= 0xC0) len = 2;
    return (pos + len <= text.size()) ? len : 1;
}

size_t ContentParser::utf8_prev_start(const std::string& text, size_t pos) {
    size_t i = pos - 1;
    // step back over continuation bytes, at most 3
    for (int k = 0; k < 3 && i > 0 && (static_cast<unsigned char>(text[i]) & 0xC0) == 0x80; ++k) --i;
    return i;
}

// Desc: fold CRLF and CR line endings into LF
// In: const std::string& raw_content
// Out: std::string
std::string ContentParser::normalize_newlines(const std::string& raw_content) {
    if (raw_content.find('\r') == std::string::npos) return raw_content;

    std::string out;
    out.reserve(raw_content.size());
    for (size_t i = 0; i < raw_content.size(); ++i) {
        char c = raw_content[i];
        if (c == '\r') {
            out.push_back('\n');
            if (i + 1 < raw_content.size() && raw_content[i + 1] == '\n') ++i;
        } else {
            out.push_back(c);
        }
    }
    return out;
}
