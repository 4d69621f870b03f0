#include "dtts-common.h"

namespace dialogue_tts {

const char * error_kind_name(error_kind kind) {
    switch (kind) {
        case ERROR_NONE:            return "none";
        case ERROR_CONFIGURATION:   return "configuration";
        case ERROR_PARSE:           return "parse";
        case ERROR_SYNTHESIS:       return "synthesis";
        case ERROR_TIMEOUT:         return "timeout";
        case ERROR_FORMAT_MISMATCH: return "format-mismatch";
        case ERROR_IO:              return "io";
    }
    return "unknown";
}

bool error_kind_is_fatal(error_kind kind) {
    return kind == ERROR_CONFIGURATION ||
           kind == ERROR_FORMAT_MISMATCH ||
           kind == ERROR_IO;
}

} // namespace dialogue_tts
