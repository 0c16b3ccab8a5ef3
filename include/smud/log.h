#ifndef SMUD_LOG_H
#define SMUD_LOG_H

#include <stdbool.h>
#include <stdarg.h>
#include <stdint.h>

/**
 * Smud Logging
 *
 * File-based logging with subsystem tags and log levels. Messages are also
 * echoed to the console through SDL_Log and forwarded to any registered
 * callbacks, so a host can route plugin diagnostics into its own console.
 *
 * Usage:
 *   smud_log_init();                  // default: /tmp/smud.log
 *   smud_log_info(SMUD_LOG_RENDER, "Pipeline %u ready", handle.value);
 *   smud_log_shutdown();
 *
 * Logging before smud_log_init() only reaches the console and callbacks.
 *
 * Output format:
 *   [2024-01-15 14:30:22] [WARNING] [Render    ] Shader pair not loaded
 */

typedef enum {
    SMUD_LOG_LEVEL_ERROR = 0,    /**< Always logged, auto-flush */
    SMUD_LOG_LEVEL_WARNING = 1,
    SMUD_LOG_LEVEL_INFO = 2,
    SMUD_LOG_LEVEL_DEBUG = 3
} Smud_LogLevel;

/* Subsystem identifiers */
#define SMUD_LOG_CORE       "Core"
#define SMUD_LOG_ECS        "ECS"
#define SMUD_LOG_RENDER     "Render"
#define SMUD_LOG_PICKING    "Picking"

/**
 * Callback invoked for every message that passes the level filter.
 *
 * @param level     Message level
 * @param subsystem Padded subsystem name
 * @param message   Formatted message (no timestamp)
 * @param userdata  Pointer passed at registration
 */
typedef void (*Smud_LogCallback)(Smud_LogLevel level, const char *subsystem,
                                 const char *message, void *userdata);

/**
 * Initialize the logging system with the default log file path.
 *
 * @return true on success, false if the file could not be opened
 */
bool smud_log_init(void);

/**
 * Initialize the logging system with a custom log file path.
 *
 * @param path Path to the log file (NULL uses default)
 * @return true on success
 */
bool smud_log_init_with_path(const char *path);

/** Write the session end marker and close the log file. */
void smud_log_shutdown(void);

bool smud_log_is_initialized(void);

/**
 * Set the level filter. Messages above this level are dropped.
 * Errors always pass.
 */
void smud_log_set_level(Smud_LogLevel level);
Smud_LogLevel smud_log_get_level(void);

/** Enable or disable the SDL_Log console echo (enabled by default). */
void smud_log_set_console_output(bool enabled);

void smud_log_error(const char *subsystem, const char *fmt, ...);
void smud_log_warning(const char *subsystem, const char *fmt, ...);
void smud_log_info(const char *subsystem, const char *fmt, ...);
void smud_log_debug(const char *subsystem, const char *fmt, ...);

/**
 * Log with explicit level.
 *
 * @param level     Log level
 * @param subsystem Subsystem identifier
 * @param fmt       Printf-style format string
 * @param args      Format arguments
 */
void smud_log_v(Smud_LogLevel level, const char *subsystem, const char *fmt, va_list args);

/** Flush the log file to disk. */
void smud_log_flush(void);

/**
 * Get the path of the current log file.
 *
 * @return Path, or NULL if not initialized
 */
const char *smud_log_get_path(void);

/**
 * Register a log listener. At most 8 listeners can be active.
 *
 * @return Non-zero handle, or 0 if callback is NULL or all slots are taken
 */
uint32_t smud_log_add_callback(Smud_LogCallback callback, void *userdata);

/** Remove a listener by handle. Unknown handles are ignored. */
void smud_log_remove_callback(uint32_t handle);

#endif /* SMUD_LOG_H */
