#ifndef SMUD_ERROR_H
#define SMUD_ERROR_H

#include <stdbool.h>
#include <stdarg.h>

/**
 * Smud Error Handling
 *
 * Functions that can fail return NULL or false and leave a message in a
 * thread-local slot. Only allocation and GPU failures are reported here.
 * Unready pipelines, degenerate transforms and empty result sets are
 * normal frame outcomes and never set an error.
 *
 * Usage:
 *   Smud_ShapeRenderer *r = smud_renderer_create(gpu, &spec, NULL);
 *   if (!r) {
 *       SDL_Log("renderer: %s", smud_get_last_error());
 *   }
 *
 * Per-frame code that must keep going logs the failure instead:
 *   if (smud_batcher_prepare_view(...) < 0) smud_log_and_clear_error(SMUD_LOG_RENDER);
 */

/** Messages longer than this are truncated */
#define SMUD_ERROR_MESSAGE_SIZE 1024

/** Replace the pending error with a printf-style message. */
void smud_set_error(const char *fmt, ...);
void smud_set_error_v(const char *fmt, va_list args);

/**
 * Set the pending error from SDL_GetError().
 *
 * @param prefix Prepended as "prefix: reason" (can be NULL)
 */
void smud_set_error_from_sdl(const char *prefix);

/**
 * @return Pending message, or "" when none (thread-local, do not free)
 */
const char *smud_get_last_error(void);

bool smud_has_error(void);
void smud_clear_error(void);

/**
 * Report the pending error through the logger at ERROR level, then clear it.
 * Does nothing when no error is pending.
 *
 * @param subsystem Log subsystem tag, or NULL for SMUD_LOG_CORE
 */
void smud_log_and_clear_error(const char *subsystem);

#endif /* SMUD_ERROR_H */
