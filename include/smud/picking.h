/**
 * Smud Picking Backend
 *
 * Hit-tests pointer rays against shapes in world space and reports, per
 * ray, the shapes under the pointer ordered nearest first.
 *
 * Each shape lies in the XY plane of its C_GlobalTransform. A ray is
 * intersected with that plane, the intersection is brought into the
 * shape's local space, and the local point is tested against the shape's
 * frame. Attach C_SmudPickingShape to test against an exact distance
 * function instead.
 *
 * Shapes are visited from largest world z to smallest. A hit on a shape
 * that blocks lower shapes (the default) ends the walk for that ray.
 *
 * Usage:
 *   smud_picking_register(world);
 *   Smud_PickingBackend *picking = smud_picking_create(NULL);
 *
 *   ecs_entity_t cam = ecs_new(world);
 *   C_SmudCamera camera = C_SMUD_CAMERA_DEFAULT;
 *   ecs_set_ptr(world, cam, C_SmudCamera, &camera);
 *
 *   Smud_RayMapEntry ray = { { cam, SMUD_POINTER_MOUSE }, { { x, y, 100 }, { 0, 0, -1 } } };
 *   int n = smud_picking_update(picking, world, &ray, 1);
 *   const Smud_PointerHits *events = smud_picking_get_events(picking, NULL);
 */

#ifndef SMUD_PICKING_H
#define SMUD_PICKING_H

#include "smud/shape.h"
#include "flecs.h"
#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/* ============================================================================
 * Components
 * ============================================================================ */

/**
 * Camera that pointer rays are cast from. Needs a C_GlobalTransform;
 * the camera looks down its local -Z.
 */
typedef struct C_SmudCamera {
    bool is_active;
    int order;          /* Copied into events so hosts can merge backends */
} C_SmudCamera;

#define C_SMUD_CAMERA_DEFAULT { .is_active = true, .order = 0 }

/**
 * Per-entity picking behavior. Without it a shape is hoverable and blocks
 * everything below it. Required on shapes in markers mode.
 */
typedef struct C_Pickable {
    bool should_block_lower;
    bool is_hoverable;
} C_Pickable;

#define C_PICKABLE_DEFAULT { .should_block_lower = true, .is_hoverable = true }

/** Local-space signed distance; <= 0 is inside. */
typedef float (*Smud_DistanceFn)(float x, float y, const float params[4]);

/**
 * Exact hit region. Replaces the frame test for the entity it is on.
 */
typedef struct C_SmudPickingShape {
    Smud_DistanceFn distance_fn;
    float params[4];
} C_SmudPickingShape;

C_SmudPickingShape smud_picking_shape_circle(float radius);
C_SmudPickingShape smud_picking_shape_box(float half_width, float half_height);
C_SmudPickingShape smud_picking_shape_rounded_box(float half_width, float half_height, float radius);

extern ECS_COMPONENT_DECLARE(C_SmudCamera);
extern ECS_COMPONENT_DECLARE(C_Pickable);
extern ECS_COMPONENT_DECLARE(C_SmudPickingShape);

/* Camera opt-in for markers mode */
extern ECS_TAG_DECLARE(SmudPickingCamera);

/* ============================================================================
 * Rays & Hits
 * ============================================================================ */

#define SMUD_POINTER_MOUSE 0ull

typedef struct Smud_Ray {
    float origin[3];
    float direction[3];
} Smud_Ray;

typedef struct Smud_RayId {
    ecs_entity_t camera;
    uint64_t pointer;
} Smud_RayId;

typedef struct Smud_RayMapEntry {
    Smud_RayId id;
    Smud_Ray ray;
} Smud_RayMapEntry;

/**
 * Singleton holding this frame's rays, for the registered system.
 * entries is borrowed from the host and must stay valid until the
 * PreUpdate phase has run.
 */
typedef struct C_SmudRayMap {
    const Smud_RayMapEntry *entries;
    size_t count;
} C_SmudRayMap;

extern ECS_COMPONENT_DECLARE(C_SmudRayMap);

typedef struct Smud_HitData {
    ecs_entity_t entity;
    ecs_entity_t camera;
    float depth;            /* Distance in front of the camera */
    float position[3];      /* World-space hit point */
    float normal[3];        /* Shape back vector */
} Smud_HitData;

/** Hits of one ray, nearest first. */
typedef struct Smud_PointerHits {
    uint64_t pointer;
    const Smud_HitData *hits;
    size_t hit_count;
    float order;            /* Camera order */
} Smud_PointerHits;

/* ============================================================================
 * Backend
 * ============================================================================ */

typedef struct Smud_PickingBackend Smud_PickingBackend;

typedef struct Smud_PickingSettings {
    /* Only C_Pickable shapes and SmudPickingCamera cameras take part */
    bool require_markers;
} Smud_PickingSettings;

#define SMUD_PICKING_SETTINGS_DEFAULT { .require_markers = false }

/** Called once per event at the end of smud_picking_update(). */
typedef void (*Smud_PickingListener)(const Smud_PointerHits *event, void *userdata);

/**
 * @param settings Settings, or NULL for defaults
 * @return New backend, or NULL on failure (error set)
 */
Smud_PickingBackend *smud_picking_create(const Smud_PickingSettings *settings);
void smud_picking_destroy(Smud_PickingBackend *backend);

void smud_picking_set_settings(Smud_PickingBackend *backend, const Smud_PickingSettings *settings);
Smud_PickingSettings smud_picking_get_settings(const Smud_PickingBackend *backend);

void smud_picking_set_listener(Smud_PickingBackend *backend,
                               Smud_PickingListener listener, void *userdata);

/**
 * Hit-test every ray against the world's shapes. Replaces the previous
 * frame's events.
 *
 * @return Number of events (rays with at least one hit)
 */
int smud_picking_update(Smud_PickingBackend *backend, ecs_world_t *world,
                        const Smud_RayMapEntry *rays, size_t ray_count);

/**
 * Events of the last update. Valid until the next update.
 */
const Smud_PointerHits *smud_picking_get_events(const Smud_PickingBackend *backend, size_t *out_count);

/* ============================================================================
 * Registration
 * ============================================================================ */

/** Register the picking components, the ray map singleton and the camera tag. */
void smud_picking_register(ecs_world_t *world);

/**
 * Add a system on EcsPreUpdate that runs smud_picking_update() with the
 * C_SmudRayMap singleton. The backend must outlive the world.
 */
ecs_entity_t smud_picking_register_system(ecs_world_t *world, Smud_PickingBackend *backend);

#ifdef __cplusplus
}
#endif

#endif /* SMUD_PICKING_H */
