#include "text/TextUtil.hpp"
#include <cctype>

namespace textutil {

static bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

std::string to_lower_ascii(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char ch : s) {
        if (ch < 0x80) out.push_back(static_cast<char>(std::tolower(ch)));
        else out.push_back(static_cast<char>(ch));
    }
    return out;
}

static unsigned fold_code_point(unsigned cp) {
    if (cp >= 0xC0 && cp <= 0xDE && cp != 0xD7) return cp + 0x20;
    if (cp == 0x130) return 'i';
    if (cp == 0x178) return 0xFF;

    // Latin Extended-A pairs upper/lower case on adjacent code points
    const bool even_upper = (cp >= 0x100 && cp <= 0x137) || (cp >= 0x14A && cp <= 0x177);
    const bool odd_upper = (cp >= 0x139 && cp <= 0x148) || (cp >= 0x179 && cp <= 0x17E);
    if (even_upper && cp % 2 == 0) return cp + 1;
    if (odd_upper && cp % 2 == 1) return cp + 1;
    return cp;
}

std::string to_lower_utf8(const std::string& s) {
    std::string out;
    out.reserve(s.size());

    size_t i = 0;
    while (i < s.size()) {
        const unsigned char c = static_cast<unsigned char>(s[i]);

        if (c < 0x80) {
            out.push_back(static_cast<char>(std::tolower(c)));
            ++i;
            continue;
        }

        // every folded range lives in two-byte sequences (U+0080..U+07FF)
        if ((c & 0xE0) == 0xC0 && i + 1 < s.size() &&
            is_continuation(static_cast<unsigned char>(s[i + 1]))) {
            const unsigned cp = ((c & 0x1Fu) << 6) | (static_cast<unsigned char>(s[i + 1]) & 0x3Fu);
            const unsigned lower = fold_code_point(cp);
            if (lower < 0x80) {
                out.push_back(static_cast<char>(lower));
            } else {
                out.push_back(static_cast<char>(0xC0 | (lower >> 6)));
                out.push_back(static_cast<char>(0x80 | (lower & 0x3F)));
            }
            i += 2;
            continue;
        }

        out.push_back(static_cast<char>(c));
        ++i;
    }
    return out;
}

std::vector<std::string> split_whitespace(const std::string& s) {
    std::vector<std::string> tokens;
    std::string cur;

    for (unsigned char c : s) {
        if (std::isspace(c)) {
            if (!cur.empty()) {
                tokens.push_back(cur);
                cur.clear();
            }
        } else {
            cur.push_back(static_cast<char>(c));
        }
    }
    if (!cur.empty()) tokens.push_back(cur);
    return tokens;
}

std::vector<std::string> word_tokens(const std::string& s) {
    std::vector<std::string> tokens;
    std::string cur;

    for (unsigned char ch : to_lower_utf8(s)) {
        const bool keep =
            (ch >= 0x80) ||                   // umlauts, accents, sharp s
            (ch >= 'a' && ch <= 'z') ||
            (ch >= 'A' && ch <= 'Z') ||
            (ch >= '0' && ch <= '9') ||
            (ch == '_');

        if (keep) {
            cur.push_back(static_cast<char>(ch));
        } else if (!cur.empty()) {
            tokens.push_back(cur);
            cur.clear();
        }
    }
    if (!cur.empty()) tokens.push_back(cur);
    return tokens;
}

size_t utf8_length(const std::string& s) {
    size_t n = 0;
    for (unsigned char c : s) {
        if (!is_continuation(c)) ++n;
    }
    return n;
}

std::string utf8_prefix(const std::string& s, size_t max_chars) {
    size_t count = 0;
    size_t i = 0;
    while (i < s.size()) {
        if (!is_continuation(static_cast<unsigned char>(s[i]))) {
            if (count == max_chars) break;
            ++count;
        }
        ++i;
    }
    return s.substr(0, i);
}

std::string utf8_truncate(const std::string& s, size_t max_chars, const std::string& marker) {
    if (utf8_length(s) <= max_chars) return s;

    const size_t marker_len = utf8_length(marker);
    if (max_chars <= marker_len) return utf8_prefix(s, max_chars);

    return utf8_prefix(s, max_chars - marker_len) + marker;
}

}
