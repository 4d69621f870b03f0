#pragma once

#include <cstddef>
#include <string>

namespace dialogue_tts {

// Invalid sequences decode to U+FFFD.
std::u32string utf8_to_u32(const std::string & s);
std::string u32_to_utf8(const std::u32string & s);

// Length in code points.
size_t utf8_length(const std::string & s);

bool is_space_cp(char32_t c);

std::u32string trim_u32(const std::u32string & s);
std::string trim_copy(const std::string & s);

// Collapse every whitespace run (ASCII, NBSP, ideographic space) to one
// ASCII space and trim both ends.
std::u32string normalize_whitespace_u32(const std::u32string & s);
std::string normalize_whitespace(const std::string & s);

// ASCII-only lowering; CJK text passes through unchanged.
std::string ascii_lower(const std::string & s);

} // namespace dialogue_tts
