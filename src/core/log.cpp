#include "smud/log.h"
#include <SDL3/SDL.h>
#include <stdio.h>
#include <string.h>
#include <time.h>

#if defined(_WIN32)
    #define SMUD_DEFAULT_LOG_PATH "smud.log"
#else
    #define SMUD_DEFAULT_LOG_PATH "/tmp/smud.log"
#endif

#define SMUD_MAX_LOG_CALLBACKS 8
#define SMUD_LOG_MESSAGE_SIZE 1024

typedef struct LogListener {
    Smud_LogCallback callback;
    void *userdata;
    uint32_t handle;    /* 0 = free slot */
} LogListener;

/* All logger state lives here; reset by smud_log_shutdown() */
static struct {
    FILE *file;
    char path[512];
    Smud_LogLevel level;
    bool console;
    bool initialized;
    LogListener listeners[SMUD_MAX_LOG_CALLBACKS];
    uint32_t next_handle;
} s_log = { NULL, {0}, SMUD_LOG_LEVEL_INFO, true, false, {}, 1 };

/* Padded to 7 chars for alignment */
static const char *level_label(Smud_LogLevel level) {
    switch (level) {
        case SMUD_LOG_LEVEL_ERROR:   return "ERROR  ";
        case SMUD_LOG_LEVEL_WARNING: return "WARNING";
        case SMUD_LOG_LEVEL_INFO:    return "INFO   ";
        case SMUD_LOG_LEVEL_DEBUG:   return "DEBUG  ";
    }
    return "?      ";
}

static void format_timestamp(char *buf, size_t size) {
    time_t now = time(NULL);
    struct tm *tm_info = localtime(&now);
    if (!tm_info) {
        snprintf(buf, size, "----------  --:--:--");
        return;
    }
    strftime(buf, size, "%Y-%m-%d %H:%M:%S", tm_info);
}

static void write_marker(const char *label) {
    if (!s_log.file) return;

    char timestamp[32];
    format_timestamp(timestamp, sizeof(timestamp));

    fprintf(s_log.file,
            "==================== %s: %s ====================\n",
            label, timestamp);
    fflush(s_log.file);
}

static void emit_console(Smud_LogLevel level, const char *subsystem, const char *message) {
    switch (level) {
        case SMUD_LOG_LEVEL_ERROR:
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "[%s] %s", subsystem, message);
            break;
        case SMUD_LOG_LEVEL_WARNING:
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "[%s] %s", subsystem, message);
            break;
        case SMUD_LOG_LEVEL_INFO:
            SDL_LogInfo(SDL_LOG_CATEGORY_APPLICATION, "[%s] %s", subsystem, message);
            break;
        case SMUD_LOG_LEVEL_DEBUG:
            SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "[%s] %s", subsystem, message);
            break;
    }
}

/* ============================================================================
 * Lifecycle
 * ============================================================================ */

bool smud_log_init(void) {
    return smud_log_init_with_path(NULL);
}

bool smud_log_init_with_path(const char *path) {
    if (s_log.initialized) return true;

    snprintf(s_log.path, sizeof(s_log.path), "%s", path ? path : SMUD_DEFAULT_LOG_PATH);

    s_log.file = fopen(s_log.path, "a");
    if (!s_log.file) {
        SDL_Log("Smud: failed to open log file %s", s_log.path);
        s_log.path[0] = '\0';
        return false;
    }

    s_log.initialized = true;
    write_marker("Smud session start");
    return true;
}

void smud_log_shutdown(void) {
    if (!s_log.initialized) return;

    write_marker("Smud session end");
    fclose(s_log.file);
    s_log.file = NULL;
    s_log.path[0] = '\0';
    s_log.initialized = false;
}

bool smud_log_is_initialized(void) {
    return s_log.initialized;
}

void smud_log_set_level(Smud_LogLevel level) {
    s_log.level = level;
}

Smud_LogLevel smud_log_get_level(void) {
    return s_log.level;
}

void smud_log_set_console_output(bool enabled) {
    s_log.console = enabled;
}

void smud_log_flush(void) {
    if (s_log.file) fflush(s_log.file);
}

const char *smud_log_get_path(void) {
    return s_log.initialized ? s_log.path : NULL;
}

/* ============================================================================
 * Message Output
 * ============================================================================ */

void smud_log_v(Smud_LogLevel level, const char *subsystem, const char *fmt, va_list args) {
    if (level != SMUD_LOG_LEVEL_ERROR && level > s_log.level) return;

    char message[SMUD_LOG_MESSAGE_SIZE];
    vsnprintf(message, sizeof(message), fmt ? fmt : "", args);

    char tag[11];
    snprintf(tag, sizeof(tag), "%-10s", subsystem ? subsystem : "Unknown");

    if (s_log.file) {
        char timestamp[32];
        format_timestamp(timestamp, sizeof(timestamp));
        fprintf(s_log.file, "[%s] [%s] [%s] %s\n", timestamp, level_label(level), tag, message);
        if (level == SMUD_LOG_LEVEL_ERROR) fflush(s_log.file);
    }

    if (s_log.console) {
        emit_console(level, tag, message);
    }

    for (int i = 0; i < SMUD_MAX_LOG_CALLBACKS; i++) {
        const LogListener *l = &s_log.listeners[i];
        if (l->handle != 0) {
            l->callback(level, tag, message, l->userdata);
        }
    }
}

void smud_log_error(const char *subsystem, const char *fmt, ...) {
    va_list args;
    va_start(args, fmt);
    smud_log_v(SMUD_LOG_LEVEL_ERROR, subsystem, fmt, args);
    va_end(args);
}

void smud_log_warning(const char *subsystem, const char *fmt, ...) {
    va_list args;
    va_start(args, fmt);
    smud_log_v(SMUD_LOG_LEVEL_WARNING, subsystem, fmt, args);
    va_end(args);
}

void smud_log_info(const char *subsystem, const char *fmt, ...) {
    va_list args;
    va_start(args, fmt);
    smud_log_v(SMUD_LOG_LEVEL_INFO, subsystem, fmt, args);
    va_end(args);
}

void smud_log_debug(const char *subsystem, const char *fmt, ...) {
    va_list args;
    va_start(args, fmt);
    smud_log_v(SMUD_LOG_LEVEL_DEBUG, subsystem, fmt, args);
    va_end(args);
}

/* ============================================================================
 * Listeners
 * ============================================================================ */

uint32_t smud_log_add_callback(Smud_LogCallback callback, void *userdata) {
    if (!callback) return 0;

    for (int i = 0; i < SMUD_MAX_LOG_CALLBACKS; i++) {
        LogListener *l = &s_log.listeners[i];
        if (l->handle == 0) {
            l->callback = callback;
            l->userdata = userdata;
            l->handle = s_log.next_handle++;
            return l->handle;
        }
    }
    return 0;
}

void smud_log_remove_callback(uint32_t handle) {
    if (handle == 0) return;

    for (int i = 0; i < SMUD_MAX_LOG_CALLBACKS; i++) {
        LogListener *l = &s_log.listeners[i];
        if (l->handle == handle) {
            l->callback = NULL;
            l->userdata = NULL;
            l->handle = 0;
            return;
        }
    }
}
