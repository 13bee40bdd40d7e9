#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace textutil {

// ASCII lowercase; bytes >= 0x80 are left untouched
std::string to_lower_ascii(const std::string& s);

// lowercase for ASCII, Latin-1 Supplement and Latin Extended-A letters;
// other code points and malformed bytes are copied through
std::string to_lower_utf8(const std::string& s);

// split on ASCII whitespace, no empty tokens
std::vector<std::string> split_whitespace(const std::string& s);

// lowercase (to_lower_utf8) word tokens: runs of ASCII letters/digits/underscore and any non-ASCII bytes.
// everything else separates words.
std::vector<std::string> word_tokens(const std::string& s);

// number of Unicode code points in a UTF-8 string (invalid bytes count as one each)
size_t utf8_length(const std::string& s);

// first max_chars code points of s
std::string utf8_prefix(const std::string& s, size_t max_chars);

// keep s if it fits in max_chars code points, otherwise cut it and append marker
// so that the result (marker included) is max_chars code points long
std::string utf8_truncate(const std::string& s, size_t max_chars, const std::string& marker = "...");

}
