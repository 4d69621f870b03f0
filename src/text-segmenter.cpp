#include "text-segmenter.h"

#include "utf8-text.h"

#include <algorithm>

namespace dialogue_tts {

namespace {

struct text_piece {
    std::u32string text;
    bool space_before = false;
};

static bool is_closing_mark(char32_t c) {
    switch (c) {
        case U'"':
        case U'\'':
        case U')':
        case 0x201D: // ”
        case 0x2019: // ’
        case 0x300D: // 」
        case 0x300F: // 』
        case 0xFF09: // ）
            return true;
        default:
            return false;
    }
}

// Cuts after every separator run (plus trailing closing quotes), keeping the
// punctuation on the left-hand piece.
static std::vector<text_piece> split_after(const std::u32string & s, bool (*is_sep)(char32_t)) {
    std::vector<text_piece> out;
    std::u32string cur;

    auto flush = [&]() {
        const bool lead = !cur.empty() && is_space_cp(cur.front());
        std::u32string t = trim_u32(cur);
        if (!t.empty()) {
            out.push_back({std::move(t), lead});
        }
        cur.clear();
    };

    size_t i = 0;
    while (i < s.size()) {
        cur.push_back(s[i]);
        if (is_sep(s[i])) {
            ++i;
            while (i < s.size() && (is_sep(s[i]) || is_closing_mark(s[i]))) {
                cur.push_back(s[i]);
                ++i;
            }
            flush();
            continue;
        }
        ++i;
    }
    flush();
    return out;
}

static void slice_fixed(const std::u32string & s, size_t max_len, std::vector<std::u32string> & out) {
    for (size_t pos = 0; pos < s.size(); pos += max_len) {
        std::u32string part = trim_u32(s.substr(pos, max_len));
        if (!part.empty()) {
            out.push_back(std::move(part));
        }
    }
}

static void pack_pieces(const std::vector<text_piece> & pieces, size_t max_len, bool clause_level,
        std::vector<std::u32string> & out) {
    std::u32string cur;

    auto flush = [&]() {
        if (!cur.empty()) {
            out.push_back(cur);
            cur.clear();
        }
    };

    for (const auto & p : pieces) {
        if (!cur.empty()) {
            const size_t sep = p.space_before ? 1 : 0;
            if (cur.size() + sep + p.text.size() <= max_len) {
                if (sep) {
                    cur.push_back(U' ');
                }
                cur += p.text;
                continue;
            }
            flush();
        }

        if (p.text.size() <= max_len) {
            cur = p.text;
            continue;
        }

        if (clause_level) {
            slice_fixed(p.text, max_len, out);
        } else {
            pack_pieces(split_after(p.text, is_clause_separator), max_len, true, out);
        }
    }
    flush();
}

} // namespace

bool is_sentence_terminator(char32_t c) {
    switch (c) {
        case U'.':
        case U'!':
        case U'?':
        case 0x3002: // 。
        case 0xFF01: // ！
        case 0xFF1F: // ？
            return true;
        default:
            return false;
    }
}

bool is_clause_separator(char32_t c) {
    switch (c) {
        case U',':
        case U';':
        case 0xFF0C: // ，
        case 0xFF1B: // ；
            return true;
        default:
            return false;
    }
}

std::vector<std::string> segment_text(const std::string & text, int32_t max_length) {
    const size_t max_len = (size_t) std::max<int32_t>(1, max_length);

    const std::u32string norm = normalize_whitespace_u32(utf8_to_u32(text));
    if (norm.empty()) {
        return {};
    }

    std::vector<std::u32string> chunks;
    pack_pieces(split_after(norm, is_sentence_terminator), max_len, false, chunks);

    std::vector<std::string> out;
    out.reserve(chunks.size());
    for (const auto & c : chunks) {
        out.push_back(u32_to_utf8(c));
    }
    return out;
}

} // namespace dialogue_tts
