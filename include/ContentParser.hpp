#pragma once
#include <cstddef>
#include <string>

class ContentParser {
public:
    // Strict UTF-8 check. On failure bad_offset is the byte offset of the
    // first invalid or truncated sequence.
    static bool is_valid_utf8(const std::string& text, size_t& bad_offset);

    // Byte length of the UTF-8 sequence starting at pos (1 for a stray byte).
    static size_t utf8_char_length(const std::string& text, size_t pos);

    // Start offset of the code point ending just before pos (pos > 0).
    static size_t utf8_prev_start(const std::string& text, size_t pos);

    // Text-mode read: "\r\n" and lone '\r' become '\n'.
    static std::string normalize_newlines(const std::string& raw_content);
};
