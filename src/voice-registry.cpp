#include "voice-registry.h"

#include "utf8-text.h"

#include <cstdio>

namespace dialogue_tts {

bool character::matches(const std::string & label) const {
    const std::string l = ascii_lower(label);
    if (ascii_lower(name) == l) {
        return true;
    }
    for (const auto & alias : aliases) {
        if (ascii_lower(alias) == l) {
            return true;
        }
    }
    return false;
}

const char * voice_match_name(voice_match m) {
    switch (m) {
        case VOICE_MATCH_EXACT:           return "exact";
        case VOICE_MATCH_PARTIAL:         return "partial";
        case VOICE_MATCH_NARRATOR:        return "narrator";
        case VOICE_MATCH_FIRST_CHARACTER: return "first-character";
    }
    return "unknown";
}

bool voice_registry::add_character(const character & c, error & err) {
    const std::string name = trim_copy(c.name);
    if (name.empty()) {
        err.set(ERROR_CONFIGURATION, "character name is empty");
        return false;
    }
    for (const auto & existing : characters_) {
        if (existing.name == name) {
            err.set(ERROR_CONFIGURATION, "duplicate character name: " + name);
            return false;
        }
    }
    characters_.push_back(c);
    characters_.back().name = name;
    return true;
}

void voice_registry::set_narrator(const character & narrator) {
    narrator_ = narrator;
    has_narrator_ = true;
}

const character * voice_registry::find_character(const std::string & label) const {
    for (const auto & c : characters_) {
        if (c.matches(label)) {
            return &c;
        }
    }

    const std::string l = ascii_lower(label);
    if (l.empty()) {
        return nullptr;
    }
    for (const auto & c : characters_) {
        for (const auto & alias : c.aliases) {
            const std::string a = ascii_lower(alias);
            if (a.empty()) {
                continue;
            }
            if (a.find(l) != std::string::npos || l.find(a) != std::string::npos) {
                return &c;
            }
        }
    }
    return nullptr;
}

bool voice_registry::resolve(const std::string & label, voice_resolution & out, error & err) const {
    const character * c = find_character(label);
    if (c != nullptr) {
        out.voice = c->voice;
        out.match = c->matches(label) ? VOICE_MATCH_EXACT : VOICE_MATCH_PARTIAL;
        out.character_name = c->name;
        return true;
    }

    if (has_narrator_) {
        out.voice = narrator_.voice;
        out.match = VOICE_MATCH_NARRATOR;
        out.character_name = narrator_.name;
        return true;
    }

    if (!characters_.empty()) {
        out.voice = characters_.front().voice;
        out.match = VOICE_MATCH_FIRST_CHARACTER;
        out.character_name = characters_.front().name;
        return true;
    }

    err.set(ERROR_CONFIGURATION, "no character or narrator configured to voice '" + label + "'");
    return false;
}

std::string voice_registry::format_listing() const {
    std::string out;
    const std::string rule(80, '=');
    char line[512];

    out += rule + "\nCHARACTER VOICE CONFIGURATION\n" + rule + "\n";
    for (const auto & c : characters_) {
        std::string aliases;
        for (size_t i = 0; i < c.aliases.size(); ++i) {
            if (i > 0) {
                aliases += ", ";
            }
            aliases += c.aliases[i];
        }
        std::snprintf(line, sizeof(line), "Name: %-20s | Gender: %-6s | Speaker ID: %3d | Aliases: %s\n",
                c.name.c_str(), c.gender.c_str(), c.voice.spk_id, aliases.c_str());
        out += line;
    }
    if (has_narrator_) {
        std::snprintf(line, sizeof(line), "\nDefault Narrator: %s | Gender: %s | Speaker ID: %d\n",
                narrator_.name.c_str(), narrator_.gender.c_str(), narrator_.voice.spk_id);
        out += line;
    }
    out += rule + "\n";
    return out;
}

character make_default_narrator(const voice_profile & voice, const std::string & gender) {
    character n;
    n.name = "Narrator";
    n.aliases = {"Narrator", "旁白"};
    n.gender = gender;
    n.voice = voice;
    n.voice.gender = gender;
    n.voice.description = "Default Narrator";
    n.description = "Default narrator for unassigned text";
    return n;
}

} // namespace dialogue_tts
