#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace dialogue_tts {

// Splits `text` into chunks of at most `max_length` code points. Sentences
// are packed greedily; an over-long sentence falls back to clause
// punctuation and then to fixed-width slices. Whitespace is normalized,
// empty input yields no chunks.
std::vector<std::string> segment_text(const std::string & text, int32_t max_length);

bool is_sentence_terminator(char32_t c);
bool is_clause_separator(char32_t c);

} // namespace dialogue_tts
