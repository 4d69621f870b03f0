#pragma once

#include <cstdarg>

namespace dialogue_tts {

enum log_level {
    LOG_LEVEL_DEBUG = 0,
    LOG_LEVEL_INFO  = 1,
    LOG_LEVEL_WARN  = 2,
    LOG_LEVEL_ERROR = 3,
};

// `text` is a complete, newline-terminated line.
typedef void (*log_callback)(log_level level, const char * text, void * user_data);

// Install the sink once, before any worker thread starts. Passing nullptr
// restores the default stderr sink (info and above).
void log_set(log_callback callback, void * user_data);

void log_printf(log_level level, const char * fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

void log_vprintf(log_level level, const char * fmt, va_list args);

const char * log_level_name(log_level level);

} // namespace dialogue_tts

#define DTTS_LOG_DBG(...) ::dialogue_tts::log_printf(::dialogue_tts::LOG_LEVEL_DEBUG, __VA_ARGS__)
#define DTTS_LOG_INF(...) ::dialogue_tts::log_printf(::dialogue_tts::LOG_LEVEL_INFO,  __VA_ARGS__)
#define DTTS_LOG_WRN(...) ::dialogue_tts::log_printf(::dialogue_tts::LOG_LEVEL_WARN,  __VA_ARGS__)
#define DTTS_LOG_ERR(...) ::dialogue_tts::log_printf(::dialogue_tts::LOG_LEVEL_ERROR, __VA_ARGS__)
