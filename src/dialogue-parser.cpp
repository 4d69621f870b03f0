#include "dialogue-parser.h"

#include "dtts-log.h"
#include "utf8-text.h"

#include <algorithm>

namespace dialogue_tts {

namespace {

struct label_token {
    size_t begin = 0;      // first code point of the label
    size_t text_begin = 0; // first code point after the colon
    std::u32string label;
};

static bool is_colon(char32_t c) {
    return c == U':' || c == 0xFF1A; // ：
}

// Only the wide terminators may directly precede a label on the same line;
// ASCII '.' also shows up in abbreviations ("Dr. Smith", "7 a.m.").
static bool is_wide_terminator(char32_t c) {
    return c == 0x3002 || c == 0xFF01 || c == 0xFF1F; // 。！？
}

// ASCII '.' is allowed inside a label, '!' and '?' end the search.
static bool ends_label_search(char32_t c) {
    return c == U'\n' || c == U'\r' || c == U'!' || c == U'?' || is_wide_terminator(c);
}

static bool is_inline_space(char32_t c) {
    return c == U' ' || c == U'\t' || c == 0x3000;
}

static bool all_digits(const std::u32string & s) {
    for (char32_t c : s) {
        if (c < U'0' || c > U'9') {
            return false;
        }
    }
    return true;
}

static bool match_label_at(const std::u32string & s, size_t pos, size_t max_label, label_token & out) {
    while (pos < s.size() && is_inline_space(s[pos])) {
        ++pos;
    }

    size_t q = pos;
    while (q < s.size() && q - pos <= max_label) {
        const char32_t c = s[q];
        if (is_colon(c)) {
            break;
        }
        if (ends_label_search(c)) {
            return false;
        }
        ++q;
    }
    if (q >= s.size() || !is_colon(s[q]) || q - pos > max_label) {
        return false;
    }

    const std::u32string label = trim_u32(s.substr(pos, q - pos));
    if (label.empty() || all_digits(label)) {
        return false;
    }

    out.begin = pos;
    out.text_begin = q + 1;
    out.label = label;
    return true;
}

static std::vector<label_token> find_label_tokens(const std::u32string & s, size_t max_label) {
    std::vector<label_token> tokens;
    bool boundary = true;

    size_t i = 0;
    while (i < s.size()) {
        if (boundary) {
            boundary = false;
            label_token tok;
            if (match_label_at(s, i, max_label, tok)) {
                tokens.push_back(tok);
                i = tok.text_begin;
                continue;
            }
        }

        const char32_t c = s[i];
        ++i;
        if (c == U'\n') {
            boundary = true;
        } else if (is_wide_terminator(c)) {
            while (i < s.size() && is_wide_terminator(s[i])) {
                ++i;
            }
            boundary = true;
        }
    }
    return tokens;
}

} // namespace

std::vector<dialogue_segment> parse_dialogue(const std::string & script, const dialogue_parse_params & params) {
    const std::u32string s = utf8_to_u32(script);
    const size_t max_label = (size_t) std::max<int32_t>(1, params.max_label_length);
    const std::vector<label_token> tokens = find_label_tokens(s, max_label);

    std::vector<dialogue_segment> segments;
    if (tokens.empty()) {
        return segments;
    }

    auto emit = [&](const std::u32string & speaker, size_t begin, size_t end) {
        const std::u32string text = normalize_whitespace_u32(s.substr(begin, end - begin));
        if (text.empty()) {
            return;
        }
        dialogue_segment seg;
        seg.index = (int32_t) segments.size();
        seg.speaker = u32_to_utf8(speaker);
        seg.text = u32_to_utf8(text);
        DTTS_LOG_DBG("parsed segment %d: %s -> %.60s", seg.index, seg.speaker.c_str(), seg.text.c_str());
        segments.push_back(std::move(seg));
    };

    if (tokens.front().begin > 0) {
        emit(utf8_to_u32(params.narrator_label), 0, tokens.front().begin);
    }

    for (size_t k = 0; k < tokens.size(); ++k) {
        const size_t end = k + 1 < tokens.size() ? tokens[k + 1].begin : s.size();
        emit(tokens[k].label, tokens[k].text_begin, end);
    }

    return segments;
}

} // namespace dialogue_tts
