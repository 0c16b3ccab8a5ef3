#include "smud/smud.h"
#include "smud/extract.h"
#include <string.h>

#define EXTRACT_INITIAL_CAPACITY 64

/* ============================================================================
 * Snapshot Storage
 * ============================================================================ */

void smud_extracted_shapes_clear(Smud_ExtractedShapes *shapes) {
    if (shapes) shapes->count = 0;
}

static bool ensure_capacity(Smud_ExtractedShapes *shapes, size_t needed) {
    if (needed <= shapes->capacity) return true;

    size_t new_capacity = shapes->capacity ? shapes->capacity : EXTRACT_INITIAL_CAPACITY;
    while (new_capacity < needed) {
        new_capacity *= 2;
    }

    Smud_ExtractedShape *items = SMUD_REALLOC(shapes->items, Smud_ExtractedShape, new_capacity);
    if (!items) {
        smud_set_error("extract: failed to grow snapshot to %zu entries", new_capacity);
        return false;
    }

    shapes->items = items;
    shapes->capacity = new_capacity;
    return true;
}

bool smud_extracted_shapes_push(Smud_ExtractedShapes *shapes, const Smud_ExtractedShape *shape) {
    if (!shapes || !shape) return false;
    if (!ensure_capacity(shapes, shapes->count + 1)) return false;

    shapes->items[shapes->count++] = *shape;
    return true;
}

void smud_extracted_shapes_free(Smud_ExtractedShapes *shapes) {
    if (!shapes) return;
    free(shapes->items);
    shapes->items = NULL;
    shapes->count = 0;
    shapes->capacity = 0;
}

/* ============================================================================
 * Extraction
 * ============================================================================ */

bool smud_extract_shape(ecs_entity_t entity, const C_SmudShape *shape,
                        const mat4 transform, Smud_ExtractedShape *out) {
    if (!shape || !out) return false;
    if (!smud_affine_is_finite(transform)) return false;

    out->entity = entity;
    memcpy(out->transform, transform, sizeof(mat4));
    out->z = transform[3][2];
    out->color = shape->color;
    out->sdf = shape->sdf;
    out->fill = shape->fill;
    out->blend_mode = shape->blend_mode;
    out->frame = shape->frame;
    memcpy(out->params, shape->params, sizeof(out->params));
    return true;
}

size_t smud_extract_shapes(ecs_world_t *world, Smud_ExtractedShapes *out) {
    if (!out) return 0;
    smud_extracted_shapes_clear(out);

    if (!world || ecs_id(C_SmudShape) == 0 || ecs_id(C_GlobalTransform) == 0) return 0;

    ecs_iter_t it = ecs_each(world, C_SmudShape);
    while (ecs_each_next(&it)) {
        const C_SmudShape *shapes = ecs_field(&it, C_SmudShape, 0);

        for (int i = 0; i < it.count; i++) {
            ecs_entity_t e = it.entities[i];
            if (!smud_ecs_is_visible(world, e)) continue;

            const C_GlobalTransform *gt = ecs_get(world, e, C_GlobalTransform);
            if (!gt) continue;

            Smud_ExtractedShape snapshot;
            if (!smud_extract_shape(e, &shapes[i], gt->matrix, &snapshot)) continue;

            if (!smud_extracted_shapes_push(out, &snapshot)) {
                /* Out of memory; render what we have */
                smud_log_and_clear_error(SMUD_LOG_RENDER);
                ecs_iter_fini(&it);
                return out->count;
            }
        }
    }

    return out->count;
}
