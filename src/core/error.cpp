#include "smud/error.h"
#include "smud/log.h"
#include <SDL3/SDL.h>
#include <stdio.h>
#include <string.h>

#if defined(_MSC_VER)
    #define SMUD_THREAD_LOCAL __declspec(thread)
#else
    #define SMUD_THREAD_LOCAL thread_local
#endif

/* One pending message per thread; overwritten by the next failure */
static SMUD_THREAD_LOCAL struct {
    char message[SMUD_ERROR_MESSAGE_SIZE];
} t_error = { {0} };

void smud_set_error(const char *fmt, ...) {
    va_list args;
    va_start(args, fmt);
    smud_set_error_v(fmt, args);
    va_end(args);
}

void smud_set_error_v(const char *fmt, va_list args) {
    if (!fmt) {
        smud_clear_error();
        return;
    }
    vsnprintf(t_error.message, sizeof(t_error.message), fmt, args);
}

void smud_set_error_from_sdl(const char *prefix) {
    const char *reason = SDL_GetError();
    if (!reason || !*reason) reason = "Unknown SDL error";

    if (prefix && *prefix) {
        smud_set_error("%s: %s", prefix, reason);
    } else {
        smud_set_error("%s", reason);
    }
}

const char *smud_get_last_error(void) {
    return t_error.message;
}

bool smud_has_error(void) {
    return t_error.message[0] != '\0';
}

void smud_clear_error(void) {
    t_error.message[0] = '\0';
}

void smud_log_and_clear_error(const char *subsystem) {
    if (!smud_has_error()) return;
    smud_log_error(subsystem ? subsystem : SMUD_LOG_CORE, "%s", t_error.message);
    smud_clear_error();
}
