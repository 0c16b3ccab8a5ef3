/**
 * Smud Extraction
 *
 * Copies the live shapes of a world into a flat per-frame snapshot. The
 * snapshot is what batching sorts and packs; it is cleared and refilled
 * on every call, never patched.
 *
 * An entity is extracted when it has C_SmudShape and a C_GlobalTransform
 * that is finite, and neither C_Visibility nor C_ViewVisibility marks it
 * hidden. Anything else is skipped silently.
 */

#ifndef SMUD_EXTRACT_H
#define SMUD_EXTRACT_H

#include "smud/shape.h"
#include "flecs.h"
#include <cglm/cglm.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef struct Smud_ExtractedShape {
    ecs_entity_t entity;
    mat4 transform;             /* World affine */
    float z;                    /* World translation z, the depth sort key */
    Smud_Color color;
    Smud_ShaderId sdf;
    Smud_ShaderId fill;
    Smud_BlendMode blend_mode;
    Smud_Frame frame;
    float params[4];
} Smud_ExtractedShape;

/**
 * Growable snapshot. Zero-initialize before first use and release with
 * smud_extracted_shapes_free().
 */
typedef struct Smud_ExtractedShapes {
    Smud_ExtractedShape *items;
    size_t count;
    size_t capacity;
} Smud_ExtractedShapes;

/** Drop all entries, keep the allocation. */
void smud_extracted_shapes_clear(Smud_ExtractedShapes *shapes);

/**
 * Append one entry.
 *
 * @return false on allocation failure (error set)
 */
bool smud_extracted_shapes_push(Smud_ExtractedShapes *shapes, const Smud_ExtractedShape *shape);

void smud_extracted_shapes_free(Smud_ExtractedShapes *shapes);

/**
 * Fill a snapshot entry from a shape and its world transform.
 *
 * @return false if the transform is not finite
 */
bool smud_extract_shape(ecs_entity_t entity, const C_SmudShape *shape,
                        const mat4 transform, Smud_ExtractedShape *out);

/**
 * Clear out and refill it from every visible shape in the world.
 * Entry order is unspecified.
 *
 * @return Number of extracted shapes
 */
size_t smud_extract_shapes(ecs_world_t *world, Smud_ExtractedShapes *out);

#ifdef __cplusplus
}
#endif

#endif /* SMUD_EXTRACT_H */
