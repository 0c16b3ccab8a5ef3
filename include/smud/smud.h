#ifndef SMUD_H
#define SMUD_H

#include <SDL3/SDL.h>
#include <stdbool.h>
#include <stdint.h>
#include <stdlib.h>

#define SMUD_ALLOC(type) (type*)calloc(1, sizeof(type))
#define SMUD_ALLOC_ARRAY(type, count) (type*)calloc((count), sizeof(type))
#define SMUD_REALLOC(ptr, type, count) (type*)realloc((ptr), (count) * sizeof(type))

// Version info
#define SMUD_VERSION_MAJOR 0
#define SMUD_VERSION_MINOR 4
#define SMUD_VERSION_PATCH 0

/*============================================================================
 * Memory Ownership Conventions
 *============================================================================
 *
 * 1. CREATE/DESTROY PAIRS:
 *    Functions named `smud_*_create()` or `smud_*_init()` that return
 *    pointers allocate memory. The caller OWNS the returned pointer and
 *    MUST call the matching `smud_*_destroy()` or `smud_*_shutdown()`.
 *
 *      Smud_ShapeRenderer *r = smud_renderer_create(gpu, &spec, NULL);
 *      smud_renderer_destroy(r);
 *
 * 2. GET FUNCTIONS:
 *    Functions named `smud_*_get_*()` return pointers to internally-owned
 *    data. They stay valid until the owner is destroyed or, for per-frame
 *    data (batches, vertices, hit events), until the next prepare/update.
 *
 * 3. NULL ON FAILURE:
 *    Allocating functions return NULL on failure. Use smud_get_last_error()
 *    for details.
 *
 * 4. FRAME STATE:
 *    Extraction snapshots, packed vertices, draw batches and hit events are
 *    cleared and rebuilt every frame. The pipeline cache is the only state
 *    that persists across frames.
 *
 *============================================================================*/

#include "smud/error.h"
#include "smud/log.h"
#include "smud/ecs.h"
#include "smud/transform.h"
#include "smud/shape.h"
#include "smud/sdf.h"
#include "smud/extract.h"
#include "smud/pipeline.h"
#include "smud/batch.h"
#include "smud/renderer.h"
#include "smud/picking.h"

#endif // SMUD_H
