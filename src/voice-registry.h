#pragma once

#include "dtts-common.h"

#include <cstdint>
#include <string>
#include <vector>

namespace dialogue_tts {

struct voice_profile {
    std::string am  = "fastspeech2_aishell3";
    std::string voc = "hifigan_aishell3";
    int32_t spk_id  = 0;
    std::string reference_key;
    std::string gender = "unknown";
    std::string description;
};

struct character {
    std::string name;
    std::vector<std::string> aliases;
    std::string gender = "unknown";
    voice_profile voice;
    std::string description;

    // Case-insensitive match against the name or any alias.
    bool matches(const std::string & label) const;
};

enum voice_match {
    VOICE_MATCH_EXACT = 0,
    VOICE_MATCH_PARTIAL,
    VOICE_MATCH_NARRATOR,
    VOICE_MATCH_FIRST_CHARACTER,
};

const char * voice_match_name(voice_match m);

struct voice_resolution {
    voice_profile voice;
    voice_match match = VOICE_MATCH_EXACT;
    std::string character_name;
};

class voice_registry {
public:
    // Fails on an empty or duplicate name.
    bool add_character(const character & c, error & err);
    void set_narrator(const character & narrator);

    // Exact name/alias match first, then substring containment over aliases
    // in registration order. A short alias can match inside an unrelated
    // label; the first registered hit wins.
    const character * find_character(const std::string & label) const;

    // find_character, then the narrator, then the first character.
    bool resolve(const std::string & label, voice_resolution & out, error & err) const;

    const std::vector<character> & characters() const { return characters_; }
    const character * narrator() const { return has_narrator_ ? &narrator_ : nullptr; }

    std::string format_listing() const;

private:
    std::vector<character> characters_;
    character narrator_;
    bool has_narrator_ = false;
};

character make_default_narrator(const voice_profile & voice, const std::string & gender);

} // namespace dialogue_tts
