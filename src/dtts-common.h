#pragma once

#include <string>

namespace dialogue_tts {

enum error_kind {
    ERROR_NONE = 0,
    ERROR_CONFIGURATION,
    ERROR_PARSE,
    ERROR_SYNTHESIS,
    ERROR_TIMEOUT,
    ERROR_FORMAT_MISMATCH,
    ERROR_IO,
};

struct error {
    error_kind kind = ERROR_NONE;
    std::string message;

    void set(error_kind k, const std::string & msg) {
        kind = k;
        message = msg;
    }

    void clear() {
        kind = ERROR_NONE;
        message.clear();
    }

    bool ok() const {
        return kind == ERROR_NONE;
    }
};

const char * error_kind_name(error_kind kind);

// Configuration, IO and format errors stop a run; the rest are per segment.
bool error_kind_is_fatal(error_kind kind);

} // namespace dialogue_tts
