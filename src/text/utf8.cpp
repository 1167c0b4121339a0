// utf8.cpp
#include "text/utf8.hpp"

namespace eventposter { namespace text {

namespace {

bool isContinuation(unsigned char c) { return (c & 0xC0) == 0x80; }

bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

} // namespace

uint32_t decodeUtf8(const std::string& s, size_t pos, uint32_t& byte_len) {
    const size_t n = s.size();
    if (pos >= n) {
        byte_len = 0;
        return 0;
    }

    const unsigned char c0 = static_cast<unsigned char>(s[pos]);
    if ((c0 & 0x80) == 0) {
        byte_len = 1;
        return c0;
    }

    // Overlong forms, surrogates and values past U+10FFFF are rejected
    if ((c0 & 0xE0) == 0xC0 && pos + 1 < n) {
        const unsigned char c1 = static_cast<unsigned char>(s[pos + 1]);
        if (isContinuation(c1)) {
            const uint32_t cp = ((c0 & 0x1F) << 6) | (c1 & 0x3F);
            if (cp >= 0x80) {
                byte_len = 2;
                return cp;
            }
        }
    } else if ((c0 & 0xF0) == 0xE0 && pos + 2 < n) {
        const unsigned char c1 = static_cast<unsigned char>(s[pos + 1]);
        const unsigned char c2 = static_cast<unsigned char>(s[pos + 2]);
        if (isContinuation(c1) && isContinuation(c2)) {
            const uint32_t cp = ((c0 & 0x0F) << 12) | ((c1 & 0x3F) << 6) | (c2 & 0x3F);
            if (cp >= 0x800 && (cp < 0xD800 || cp > 0xDFFF)) {
                byte_len = 3;
                return cp;
            }
        }
    } else if ((c0 & 0xF8) == 0xF0 && pos + 3 < n) {
        const unsigned char c1 = static_cast<unsigned char>(s[pos + 1]);
        const unsigned char c2 = static_cast<unsigned char>(s[pos + 2]);
        const unsigned char c3 = static_cast<unsigned char>(s[pos + 3]);
        if (isContinuation(c1) && isContinuation(c2) && isContinuation(c3)) {
            const uint32_t cp = ((c0 & 0x07) << 18) | ((c1 & 0x3F) << 12) | ((c2 & 0x3F) << 6) | (c3 & 0x3F);
            if (cp >= 0x10000 && cp <= 0x10FFFF) {
                byte_len = 4;
                return cp;
            }
        }
    }

    byte_len = 1;
    return 0xFFFD;
}

void appendUtf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

std::vector<uint32_t> toCodepoints(const std::string& s) {
    std::vector<uint32_t> cps;
    cps.reserve(s.size());
    size_t pos = 0;
    while (pos < s.size()) {
        uint32_t len = 0;
        cps.push_back(decodeUtf8(s, pos, len));
        pos += len;
    }
    return cps;
}

uint32_t toUpper(uint32_t cp) {
    // ASCII
    if (cp >= 'a' && cp <= 'z') return cp - 0x20;
    if (cp < 0x80) return cp;

    // Latin-1 supplement (skip U+00F7 division sign)
    if (cp >= 0xE0 && cp <= 0xFE && cp != 0xF7) return cp - 0x20;
    if (cp == 0xFF) return 0x178;
    if (cp == 0xB5) return 0x39C;

    // Latin Extended-A: alternating upper/lower pairs, except the
    // dotless i and the long s which map back to ASCII
    if (cp == 0x131) return 'I';
    if (cp == 0x17F) return 'S';
    if (cp >= 0x100 && cp <= 0x137) return (cp & 1) ? cp - 1 : cp;
    if (cp >= 0x139 && cp <= 0x148) return (cp & 1) ? cp : cp - 1;
    if (cp >= 0x14A && cp <= 0x177) return (cp & 1) ? cp - 1 : cp;
    if (cp == 0x17A || cp == 0x17C || cp == 0x17E) return cp - 1;

    // Greek
    if (cp == 0x3AC) return 0x386;
    if (cp >= 0x3AD && cp <= 0x3AF) return cp - 0x25;
    if (cp == 0x3C2) return 0x3A3;
    if (cp >= 0x3B1 && cp <= 0x3CB) return cp - 0x20;
    if (cp == 0x3CC) return 0x38C;
    if (cp == 0x3CD || cp == 0x3CE) return cp - 0x3F;

    // Cyrillic
    if (cp >= 0x430 && cp <= 0x44F) return cp - 0x20;
    if (cp >= 0x450 && cp <= 0x45F) return cp - 0x50;

    return cp;
}

std::string toUpperUtf8(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    size_t pos = 0;
    while (pos < s.size()) {
        uint32_t len = 0;
        uint32_t cp = decodeUtf8(s, pos, len);
        appendUtf8(out, toUpper(cp));
        pos += len;
    }
    return out;
}

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && isSpace(s[begin])) ++begin;
    while (end > begin && isSpace(s[end - 1])) --end;
    return s.substr(begin, end - begin);
}

std::vector<std::string> splitWords(const std::string& s) {
    std::vector<std::string> words;
    std::string current;
    for (char c : s) {
        if (isSpace(c)) {
            if (!current.empty()) {
                words.push_back(current);
                current.clear();
            }
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) words.push_back(current);
    return words;
}

}} // namespace eventposter::text
