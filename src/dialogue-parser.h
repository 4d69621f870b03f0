#pragma once

#include "audio-fragment.h"
#include "voice-registry.h"

#include <cstdint>
#include <string>
#include <vector>

namespace dialogue_tts {

struct dialogue_segment {
    int32_t index = 0;   // reassembly key, contiguous from 0
    std::string speaker; // label as written in the script
    std::string text;

    voice_profile voice;
    bool voice_bound = false;

    audio_fragment audio;
};

struct dialogue_parse_params {
    int32_t max_label_length = 32;
    std::string narrator_label = "Narrator";
};

// A unit starts at `label:` (or `label：`) at the start of a line or right
// after a sentence terminator, and runs until the next label or the end of
// the script. Text before the first label becomes a narrator segment. No
// label anywhere yields an empty result.
std::vector<dialogue_segment> parse_dialogue(
        const std::string & script,
        const dialogue_parse_params & params = dialogue_parse_params());

} // namespace dialogue_tts
