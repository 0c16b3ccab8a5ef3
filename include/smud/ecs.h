/**
 * Smud ECS glue
 *
 * A thin wrapper around Flecs (https://www.flecs.dev/) that owns the world
 * the shape, transform and picking modules register into, plus the two
 * visibility components extraction and picking filter on.
 *
 * Usage:
 *   Smud_World *world = smud_ecs_init();
 *   smud_transform_register_world(world);
 *   smud_shape_register_world(world);
 *
 *   ecs_entity_t e = smud_ecs_entity_new(world);
 *   SMUD_ECS_SET(world, e, C_Visibility, { .visible = false });
 *
 *   smud_ecs_progress(world, dt);
 *   smud_ecs_shutdown(world);
 *
 * Hosts that already own a flecs world use the ecs_world_t variants of the
 * registration functions and never create a Smud_World.
 */
#ifndef SMUD_ECS_H
#define SMUD_ECS_H

#include "flecs.h"
#include <stdbool.h>

/* Opaque ECS world wrapper */
typedef struct Smud_World Smud_World;

/* ============================================================================
 * Visibility Components
 *
 * A missing component counts as visible.
 * ============================================================================ */

/**
 * Explicit visibility flag set by scene code.
 */
typedef struct {
    bool visible;
} C_Visibility;

/**
 * Per-frame visibility computed by the host's culling pass.
 */
typedef struct {
    bool visible;
} C_ViewVisibility;

extern ECS_COMPONENT_DECLARE(C_Visibility);
extern ECS_COMPONENT_DECLARE(C_ViewVisibility);

/* ============================================================================
 * Lifecycle Functions
 * ============================================================================ */

/**
 * Create an ECS world with the visibility components registered.
 * Caller OWNS the returned pointer and MUST call smud_ecs_shutdown().
 *
 * @return New world, or NULL on failure
 */
Smud_World *smud_ecs_init(void);

/**
 * Destroy the world and every entity in it. Safe to call with NULL.
 */
void smud_ecs_shutdown(Smud_World *world);

/**
 * Get the underlying Flecs world.
 *
 * @return Flecs world pointer (borrowed, do not free)
 */
ecs_world_t *smud_ecs_get_world(Smud_World *world);

/**
 * Run all systems once.
 *
 * @return true if the world should continue running
 */
bool smud_ecs_progress(Smud_World *world, float delta_time);

/* ============================================================================
 * Entity Functions
 * ============================================================================ */

ecs_entity_t smud_ecs_entity_new(Smud_World *world);
ecs_entity_t smud_ecs_entity_new_named(Smud_World *world, const char *name);
void smud_ecs_entity_delete(Smud_World *world, ecs_entity_t entity);
bool smud_ecs_entity_is_alive(Smud_World *world, ecs_entity_t entity);

/**
 * Register C_Visibility and C_ViewVisibility.
 * Called by smud_ecs_init(); hosts with their own world call this directly.
 */
void smud_ecs_register_components(ecs_world_t *world);

/**
 * Combined visibility test used by extraction and picking.
 *
 * @return false if either visibility component says hidden
 */
bool smud_ecs_is_visible(const ecs_world_t *world, ecs_entity_t entity);

/* ============================================================================
 * Convenience Macros
 * ============================================================================ */

#define SMUD_ECS_SET(world, entity, T, ...) \
    ecs_set(smud_ecs_get_world(world), entity, T, __VA_ARGS__)

#define SMUD_ECS_GET(world, entity, T) \
    ecs_get(smud_ecs_get_world(world), entity, T)

#define SMUD_ECS_ADD(world, entity, T) \
    ecs_add(smud_ecs_get_world(world), entity, T)

#define SMUD_ECS_REMOVE(world, entity, T) \
    ecs_remove(smud_ecs_get_world(world), entity, T)

#define SMUD_ECS_HAS(world, entity, T) \
    ecs_has(smud_ecs_get_world(world), entity, T)

#endif // SMUD_ECS_H
