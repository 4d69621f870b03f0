#include "dtts-log.h"

#include <cstdio>
#include <string>
#include <vector>

namespace dialogue_tts {

static void log_callback_default(log_level level, const char * text, void * /* user_data */) {
    // Keep default output concise; debug lines need an explicit sink.
    if (level >= LOG_LEVEL_INFO) {
        std::fputs(text, stderr);
    }
}

static log_callback g_log_callback = log_callback_default;
static void *       g_log_user_data = nullptr;

void log_set(log_callback callback, void * user_data) {
    g_log_callback  = callback != nullptr ? callback : log_callback_default;
    g_log_user_data = callback != nullptr ? user_data : nullptr;
}

void log_vprintf(log_level level, const char * fmt, va_list args) {
    char buf[512];
    va_list args_copy;
    va_copy(args_copy, args);
    const int n = std::vsnprintf(buf, sizeof(buf), fmt, args);
    if (n < 0) {
        va_end(args_copy);
        return;
    }

    std::string line;
    if ((size_t) n < sizeof(buf)) {
        line.assign(buf, (size_t) n);
    } else {
        std::vector<char> big((size_t) n + 1);
        std::vsnprintf(big.data(), big.size(), fmt, args_copy);
        line.assign(big.data(), (size_t) n);
    }
    va_end(args_copy);

    if (line.empty() || line.back() != '\n') {
        line.push_back('\n');
    }
    g_log_callback(level, line.c_str(), g_log_user_data);
}

void log_printf(log_level level, const char * fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_vprintf(level, fmt, args);
    va_end(args);
}

const char * log_level_name(log_level level) {
    switch (level) {
        case LOG_LEVEL_DEBUG: return "debug";
        case LOG_LEVEL_INFO:  return "info";
        case LOG_LEVEL_WARN:  return "warning";
        case LOG_LEVEL_ERROR: return "error";
    }
    return "unknown";
}

} // namespace dialogue_tts
