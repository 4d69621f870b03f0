#include "utf8-text.h"

#include <algorithm>
#include <cctype>
#include <cstdint>

namespace dialogue_tts {

static const char32_t k_replacement_char = 0xFFFD;

std::u32string utf8_to_u32(const std::string & s) {
    std::u32string out;
    out.reserve(s.size());

    const unsigned char * p = reinterpret_cast<const unsigned char *>(s.data());
    const unsigned char * end = p + s.size();

    while (p < end) {
        uint32_t cp = 0;
        const unsigned char c0 = *p++;

        if (c0 < 0x80) {
            cp = c0;
        } else if ((c0 >> 5) == 0x6) {
            if (p >= end) {
                out.push_back(k_replacement_char);
                break;
            }
            const unsigned char c1 = *p++;
            if ((c1 & 0xC0) != 0x80) {
                out.push_back(k_replacement_char);
                continue;
            }
            cp = ((c0 & 0x1F) << 6) | (c1 & 0x3F);
            if (cp < 0x80) {
                out.push_back(k_replacement_char);
                continue;
            }
        } else if ((c0 >> 4) == 0xE) {
            if (p + 1 >= end) {
                out.push_back(k_replacement_char);
                break;
            }
            const unsigned char c1 = *p++;
            const unsigned char c2 = *p++;
            if ((c1 & 0xC0) != 0x80 || (c2 & 0xC0) != 0x80) {
                out.push_back(k_replacement_char);
                continue;
            }
            cp = ((c0 & 0x0F) << 12) | ((c1 & 0x3F) << 6) | (c2 & 0x3F);
            // overlong forms and UTF-16 surrogate halves
            if (cp < 0x800 || (cp >= 0xD800 && cp <= 0xDFFF)) {
                out.push_back(k_replacement_char);
                continue;
            }
        } else if ((c0 >> 3) == 0x1E) {
            if (p + 2 >= end) {
                out.push_back(k_replacement_char);
                break;
            }
            const unsigned char c1 = *p++;
            const unsigned char c2 = *p++;
            const unsigned char c3 = *p++;
            if ((c1 & 0xC0) != 0x80 || (c2 & 0xC0) != 0x80 || (c3 & 0xC0) != 0x80) {
                out.push_back(k_replacement_char);
                continue;
            }
            cp = ((c0 & 0x07) << 18) | ((c1 & 0x3F) << 12) | ((c2 & 0x3F) << 6) | (c3 & 0x3F);
            if (cp < 0x10000 || cp > 0x10FFFF) {
                out.push_back(k_replacement_char);
                continue;
            }
        } else {
            out.push_back(k_replacement_char);
            continue;
        }

        out.push_back((char32_t) cp);
    }

    return out;
}

std::string u32_to_utf8(const std::u32string & s) {
    std::string out;
    out.reserve(s.size());

    for (char32_t ch : s) {
        const uint32_t cp = (uint32_t) ch;
        if (cp <= 0x7F) {
            out.push_back((char) cp);
        } else if (cp <= 0x7FF) {
            out.push_back((char) (0xC0 | ((cp >> 6) & 0x1F)));
            out.push_back((char) (0x80 | (cp & 0x3F)));
        } else if (cp <= 0xFFFF) {
            out.push_back((char) (0xE0 | ((cp >> 12) & 0x0F)));
            out.push_back((char) (0x80 | ((cp >> 6) & 0x3F)));
            out.push_back((char) (0x80 | (cp & 0x3F)));
        } else {
            out.push_back((char) (0xF0 | ((cp >> 18) & 0x07)));
            out.push_back((char) (0x80 | ((cp >> 12) & 0x3F)));
            out.push_back((char) (0x80 | ((cp >> 6) & 0x3F)));
            out.push_back((char) (0x80 | (cp & 0x3F)));
        }
    }

    return out;
}

size_t utf8_length(const std::string & s) {
    return utf8_to_u32(s).size();
}

bool is_space_cp(char32_t c) {
    switch (c) {
        case U' ':
        case U'\t':
        case U'\n':
        case U'\r':
        case U'\v':
        case U'\f':
        case 0x00A0:
        case 0x3000:
            return true;
        default:
            return false;
    }
}

std::u32string trim_u32(const std::u32string & s) {
    size_t b = 0;
    while (b < s.size() && is_space_cp(s[b])) {
        ++b;
    }
    size_t e = s.size();
    while (e > b && is_space_cp(s[e - 1])) {
        --e;
    }
    return s.substr(b, e - b);
}

std::string trim_copy(const std::string & s) {
    size_t b = 0;
    while (b < s.size() && std::isspace((unsigned char) s[b])) {
        ++b;
    }
    size_t e = s.size();
    while (e > b && std::isspace((unsigned char) s[e - 1])) {
        --e;
    }
    return s.substr(b, e - b);
}

std::u32string normalize_whitespace_u32(const std::u32string & s) {
    std::u32string out;
    out.reserve(s.size());
    bool pending_space = false;
    for (char32_t c : s) {
        if (is_space_cp(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(U' ');
            pending_space = false;
        }
        out.push_back(c);
    }
    return out;
}

std::string normalize_whitespace(const std::string & s) {
    return u32_to_utf8(normalize_whitespace_u32(utf8_to_u32(s)));
}

std::string ascii_lower(const std::string & s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return (char) std::tolower(c);
    });
    return out;
}

} // namespace dialogue_tts
