/**
 * Smud Transform Hierarchy
 *
 * Local transforms (C_Transform) are composed down the Flecs EcsChildOf
 * hierarchy into world-space affine matrices (C_GlobalTransform) by a
 * system on EcsPostUpdate. Shapes live in the XY plane of their world
 * matrix; local_z places that plane along the view axis and drives draw
 * order and picking depth.
 *
 * Usage:
 *   smud_transform_register(world);
 *
 *   ecs_entity_t e = ecs_new(world);
 *   C_Transform tf = C_TRANSFORM_DEFAULT;
 *   tf.local_x = 100.0f;
 *   tf.local_z = 2.0f;
 *   ecs_set_ptr(world, e, C_Transform, &tf);
 *
 *   ecs_progress(world, dt);   // fills C_GlobalTransform
 *
 * The affine helpers operate on cglm matrices (column-major, m[col][row]).
 */

#ifndef SMUD_TRANSFORM_H
#define SMUD_TRANSFORM_H

#include "flecs.h"
#include <cglm/cglm.h>
#include <stdbool.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef struct Smud_World Smud_World;

/* ============================================================================
 * Components
 * ============================================================================ */

/**
 * Local transform relative to the parent (or world for roots).
 * Applied as translate * rotate_z * scale.
 */
typedef struct C_Transform {
    float local_x;
    float local_y;
    float local_z;      /* Depth; larger is closer to a camera looking down -Z */
    float rotation;     /* Radians around Z */
    float scale_x;
    float scale_y;
} C_Transform;

/**
 * World-space affine transform.
 * Written by the propagation system; may also be set directly by hosts
 * that run their own transform propagation.
 */
typedef struct C_GlobalTransform {
    mat4 matrix;
} C_GlobalTransform;

#define C_TRANSFORM_DEFAULT { 0.0f, 0.0f, 0.0f, 0.0f, 1.0f, 1.0f }

extern ECS_COMPONENT_DECLARE(C_Transform);
extern ECS_COMPONENT_DECLARE(C_GlobalTransform);

/* ============================================================================
 * Registration
 * ============================================================================ */

/**
 * Register transform components and the propagation system.
 *
 * @param world Flecs world
 */
void smud_transform_register(ecs_world_t *world);

/** Same as smud_transform_register() for a Smud_World. */
void smud_transform_register_world(Smud_World *world);

/* ============================================================================
 * Hierarchy
 * ============================================================================ */

/**
 * Make child a child of parent. The child gets default C_Transform and
 * C_GlobalTransform if it has none. A parent of 0 detaches.
 */
void smud_transform_set_parent(ecs_world_t *world, ecs_entity_t child, ecs_entity_t parent);

ecs_entity_t smud_transform_get_parent(ecs_world_t *world, ecs_entity_t entity);
bool smud_transform_has_parent(ecs_world_t *world, ecs_entity_t entity);
int smud_transform_get_child_count(ecs_world_t *world, ecs_entity_t parent);
void smud_transform_remove_parent(ecs_world_t *world, ecs_entity_t entity);

/* ============================================================================
 * Local Manipulation
 * ============================================================================ */

void smud_transform_set_local_position(ecs_world_t *world, ecs_entity_t entity,
                                       float x, float y, float z);
void smud_transform_set_local_rotation(ecs_world_t *world, ecs_entity_t entity,
                                       float radians);
void smud_transform_set_local_scale(ecs_world_t *world, ecs_entity_t entity,
                                    float scale_x, float scale_y);

/**
 * Read the world-space translation.
 *
 * @param out_position Receives x, y, z
 * @return false if the entity has no C_GlobalTransform
 */
bool smud_transform_get_world_position(ecs_world_t *world, ecs_entity_t entity,
                                       vec3 out_position);

/**
 * Recompute the world transform of one entity and its descendants without
 * running the pipeline.
 */
void smud_transform_update(ecs_world_t *world, ecs_entity_t entity);

/** Recompute every root hierarchy. */
void smud_transform_update_all(ecs_world_t *world);

/* ============================================================================
 * Affine Helpers
 * ============================================================================ */

/** Build translate * rotate_z * scale from a local transform. */
void smud_transform_compose(const C_Transform *local, mat4 out);

/** true if every element of the matrix is finite. */
bool smud_affine_is_finite(const mat4 m);

/**
 * Invert an affine matrix.
 *
 * @return false if the matrix is non-finite, singular, or too close to
 *         singular for a finite float inverse; out is left untouched
 */
bool smud_affine_inverse(const mat4 m, mat4 out);

void smud_affine_translation(const mat4 m, vec3 out);

/**
 * Derive the packed 2D rotation and the scale magnitude of a matrix.
 * The local +X axis is mapped through the linear part; scale is the
 * length of its XY image and rotation its normalized direction.
 * Only exact for uniform scale.
 *
 * @param out_rotation Receives (cos, sin); (1, 0) when scale is zero
 * @param out_scale    Receives the scale magnitude
 */
void smud_affine_rotation_scale(const mat4 m, float out_rotation[2], float *out_scale);

/** Normalized local +Z axis in world space; (0, 0, 1) if degenerate. */
void smud_affine_back(const mat4 m, vec3 out);

/** Transform a point (w = 1). */
void smud_affine_transform_point(const mat4 m, const vec3 p, vec3 out);

#ifdef __cplusplus
}
#endif

#endif /* SMUD_TRANSFORM_H */
