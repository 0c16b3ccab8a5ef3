#include "smud/smud.h"
#include "smud/picking.h"
#include <float.h>
#include <math.h>
#include <string.h>

ECS_COMPONENT_DECLARE(C_SmudCamera);
ECS_COMPONENT_DECLARE(C_Pickable);
ECS_COMPONENT_DECLARE(C_SmudPickingShape);
ECS_COMPONENT_DECLARE(C_SmudRayMap);
ECS_TAG_DECLARE(SmudPickingCamera);

#define PICKING_INITIAL_CANDIDATES 64
#define PICKING_INITIAL_HITS 16
#define PICKING_INITIAL_EVENTS 4

/* Shape that survived filtering, with its inverse ready */
typedef struct PickCandidate {
    ecs_entity_t entity;
    mat4 transform;
    mat4 inverse;
    float z;
    Smud_Frame frame;
    bool has_pickable;
    C_Pickable pickable;
    bool has_exact_shape;
    C_SmudPickingShape exact_shape;
} PickCandidate;

/* Event under construction; hits are an index range until the frame ends */
typedef struct PendingEvent {
    uint64_t pointer;
    size_t first_hit;
    size_t hit_count;
    float order;
} PendingEvent;

struct Smud_PickingBackend {
    Smud_PickingSettings settings;

    PickCandidate *candidates;
    size_t candidate_count;
    size_t candidate_capacity;

    Smud_HitData *hits;
    size_t hit_count;
    size_t hit_capacity;

    PendingEvent *pending;
    size_t event_count;
    size_t pending_capacity;

    Smud_PointerHits *events;
    size_t events_capacity;

    Smud_PickingListener listener;
    void *listener_userdata;
};

/* ============================================================================
 * Exact Shapes
 * ============================================================================ */

static float pick_circle(float x, float y, const float p[4]) {
    return smud_sdf_circle(x, y, p[0]);
}

static float pick_box(float x, float y, const float p[4]) {
    return smud_sdf_box(x, y, p[0], p[1]);
}

static float pick_rounded_box(float x, float y, const float p[4]) {
    return smud_sdf_rounded_box(x, y, p[0], p[1], p[2]);
}

C_SmudPickingShape smud_picking_shape_circle(float radius) {
    C_SmudPickingShape s = { pick_circle, { radius, 0.0f, 0.0f, 0.0f } };
    return s;
}

C_SmudPickingShape smud_picking_shape_box(float half_width, float half_height) {
    C_SmudPickingShape s = { pick_box, { half_width, half_height, 0.0f, 0.0f } };
    return s;
}

C_SmudPickingShape smud_picking_shape_rounded_box(float half_width, float half_height, float radius) {
    C_SmudPickingShape s = { pick_rounded_box, { half_width, half_height, radius, 0.0f } };
    return s;
}

/* ============================================================================
 * Storage
 * ============================================================================ */

template <typename T>
static bool reserve(T **items, size_t *capacity, size_t needed, size_t initial) {
    if (needed <= *capacity) return true;

    size_t new_capacity = *capacity ? *capacity : initial;
    while (new_capacity < needed) {
        new_capacity *= 2;
    }

    T *grown = SMUD_REALLOC(*items, T, new_capacity);
    if (!grown) {
        smud_set_error("picking: out of memory (%zu entries)", new_capacity);
        return false;
    }

    *items = grown;
    *capacity = new_capacity;
    return true;
}

/* ============================================================================
 * Candidates
 * ============================================================================ */

static int candidate_compare(const void *a, const void *b) {
    const PickCandidate *ca = (const PickCandidate *)a;
    const PickCandidate *cb = (const PickCandidate *)b;

    /* Nearest (largest z) first */
    if (ca->z > cb->z) return -1;
    if (ca->z < cb->z) return 1;

    if (ca->entity < cb->entity) return -1;
    if (ca->entity > cb->entity) return 1;
    return 0;
}

static bool collect_candidates(Smud_PickingBackend *b, ecs_world_t *world) {
    b->candidate_count = 0;

    ecs_iter_t it = ecs_each(world, C_SmudShape);
    while (ecs_each_next(&it)) {
        const C_SmudShape *shapes = ecs_field(&it, C_SmudShape, 0);

        for (int i = 0; i < it.count; i++) {
            ecs_entity_t e = it.entities[i];
            if (!smud_ecs_is_visible(world, e)) continue;

            const C_GlobalTransform *gt = ecs_get(world, e, C_GlobalTransform);
            if (!gt) continue;

            const C_Pickable *pickable = ecs_get(world, e, C_Pickable);
            if (b->settings.require_markers && !pickable) continue;
            if (pickable && !pickable->is_hoverable) continue;

            mat4 inverse;
            if (!smud_affine_inverse(gt->matrix, inverse)) continue;

            if (!reserve(&b->candidates, &b->candidate_capacity, b->candidate_count + 1,
                         PICKING_INITIAL_CANDIDATES)) {
                ecs_iter_fini(&it);
                return false;
            }

            PickCandidate *c = &b->candidates[b->candidate_count++];
            memset(c, 0, sizeof(*c));
            c->entity = e;
            memcpy(c->transform, gt->matrix, sizeof(mat4));
            memcpy(c->inverse, inverse, sizeof(mat4));
            c->z = gt->matrix[3][2];
            c->frame = shapes[i].frame;

            if (pickable) {
                c->has_pickable = true;
                c->pickable = *pickable;
            }

            const C_SmudPickingShape *exact = ecs_get(world, e, C_SmudPickingShape);
            if (exact && exact->distance_fn) {
                c->has_exact_shape = true;
                c->exact_shape = *exact;
            }
        }
    }

    if (b->candidate_count > 1) {
        qsort(b->candidates, b->candidate_count, sizeof(PickCandidate), candidate_compare);
    }
    return true;
}

/* ============================================================================
 * Ray Casting
 * ============================================================================ */

static bool camera_eligible(const Smud_PickingBackend *b, ecs_world_t *world,
                            ecs_entity_t camera, const C_SmudCamera **out_camera,
                            mat4 out_view) {
    if (camera == 0 || !ecs_is_alive(world, camera)) return false;

    const C_SmudCamera *cam = ecs_get(world, camera, C_SmudCamera);
    if (!cam || !cam->is_active) return false;

    if (b->settings.require_markers && !ecs_has_id(world, camera, SmudPickingCamera)) return false;

    const C_GlobalTransform *gt = ecs_get(world, camera, C_GlobalTransform);
    if (!gt) return false;

    if (!smud_affine_inverse(gt->matrix, out_view)) return false;

    *out_camera = cam;
    return true;
}

static bool candidate_hit_test(const PickCandidate *c, const vec3 local) {
    if (c->has_exact_shape) {
        return c->exact_shape.distance_fn(local[0], local[1], c->exact_shape.params) <= 0.0f;
    }
    return smud_frame_contains(c->frame, local[0], local[1]);
}

static bool cast_ray(Smud_PickingBackend *b, const Smud_RayMapEntry *entry,
                     const C_SmudCamera *camera, const mat4 view) {
    const Smud_Ray *ray = &entry->ray;
    size_t first_hit = b->hit_count;
    bool blocked = false;

    for (size_t i = 0; i < b->candidate_count && !blocked; i++) {
        const PickCandidate *c = &b->candidates[i];

        /* Parallel to the shape plane */
        if (fabsf(ray->direction[2]) < FLT_EPSILON) continue;

        float t = (c->z - ray->origin[2]) / ray->direction[2];
        vec3 world_point = {
            ray->origin[0] + ray->direction[0] * t,
            ray->origin[1] + ray->direction[1] * t,
            c->z
        };

        vec3 local;
        smud_affine_transform_point(c->inverse, world_point, local);
        if (!candidate_hit_test(c, local)) continue;

        if (!reserve(&b->hits, &b->hit_capacity, b->hit_count + 1, PICKING_INITIAL_HITS)) {
            return false;
        }

        vec3 camera_point;
        smud_affine_transform_point(view, world_point, camera_point);

        Smud_HitData *hit = &b->hits[b->hit_count++];
        hit->entity = c->entity;
        hit->camera = entry->id.camera;
        hit->depth = -camera_point[2];
        memcpy(hit->position, world_point, sizeof(hit->position));
        smud_affine_back(c->transform, hit->normal);

        blocked = c->has_pickable ? c->pickable.should_block_lower : true;
    }

    size_t hit_count = b->hit_count - first_hit;
    if (hit_count == 0) return true;

    if (!reserve(&b->pending, &b->pending_capacity, b->event_count + 1, PICKING_INITIAL_EVENTS)) {
        return false;
    }

    PendingEvent *ev = &b->pending[b->event_count++];
    ev->pointer = entry->id.pointer;
    ev->first_hit = first_hit;
    ev->hit_count = hit_count;
    ev->order = (float)camera->order;
    return true;
}

/* ============================================================================
 * Backend
 * ============================================================================ */

Smud_PickingBackend *smud_picking_create(const Smud_PickingSettings *settings) {
    Smud_PickingBackend *b = SMUD_ALLOC(Smud_PickingBackend);
    if (!b) {
        smud_set_error("picking: out of memory");
        return NULL;
    }

    Smud_PickingSettings defaults = SMUD_PICKING_SETTINGS_DEFAULT;
    b->settings = settings ? *settings : defaults;
    return b;
}

void smud_picking_destroy(Smud_PickingBackend *backend) {
    if (!backend) return;
    free(backend->candidates);
    free(backend->hits);
    free(backend->pending);
    free(backend->events);
    free(backend);
}

void smud_picking_set_settings(Smud_PickingBackend *backend, const Smud_PickingSettings *settings) {
    if (!backend || !settings) return;
    backend->settings = *settings;
}

Smud_PickingSettings smud_picking_get_settings(const Smud_PickingBackend *backend) {
    Smud_PickingSettings defaults = SMUD_PICKING_SETTINGS_DEFAULT;
    return backend ? backend->settings : defaults;
}

void smud_picking_set_listener(Smud_PickingBackend *backend,
                               Smud_PickingListener listener, void *userdata) {
    if (!backend) return;
    backend->listener = listener;
    backend->listener_userdata = userdata;
}

int smud_picking_update(Smud_PickingBackend *backend, ecs_world_t *world,
                        const Smud_RayMapEntry *rays, size_t ray_count) {
    if (!backend) return 0;

    backend->hit_count = 0;
    backend->event_count = 0;

    if (!world || !rays || ray_count == 0) return 0;
    if (ecs_id(C_SmudShape) == 0 || ecs_id(C_SmudCamera) == 0 || ecs_id(C_GlobalTransform) == 0) {
        return 0;
    }

    if (!collect_candidates(backend, world)) {
        smud_log_and_clear_error(SMUD_LOG_PICKING);
        return 0;
    }
    if (backend->candidate_count == 0) return 0;

    for (size_t r = 0; r < ray_count; r++) {
        const C_SmudCamera *camera = NULL;
        mat4 view;
        if (!camera_eligible(backend, world, rays[r].id.camera, &camera, view)) continue;

        if (!cast_ray(backend, &rays[r], camera, view)) {
            /* Keep the events already built */
            smud_log_and_clear_error(SMUD_LOG_PICKING);
            break;
        }
    }

    /* hits may have moved while growing; resolve ranges now */
    if (!reserve(&backend->events, &backend->events_capacity, backend->event_count,
                 PICKING_INITIAL_EVENTS)) {
        smud_log_and_clear_error(SMUD_LOG_PICKING);
        backend->event_count = 0;
        return 0;
    }

    for (size_t i = 0; i < backend->event_count; i++) {
        const PendingEvent *p = &backend->pending[i];
        Smud_PointerHits *ev = &backend->events[i];
        ev->pointer = p->pointer;
        ev->hits = &backend->hits[p->first_hit];
        ev->hit_count = p->hit_count;
        ev->order = p->order;
    }

    if (backend->listener) {
        for (size_t i = 0; i < backend->event_count; i++) {
            backend->listener(&backend->events[i], backend->listener_userdata);
        }
    }

    if (backend->event_count > 0) {
        smud_log_debug(SMUD_LOG_PICKING, "%zu pointer event(s), %zu hit(s)",
                       backend->event_count, backend->hit_count);
    }
    return (int)backend->event_count;
}

const Smud_PointerHits *smud_picking_get_events(const Smud_PickingBackend *backend, size_t *out_count) {
    if (out_count) *out_count = backend ? backend->event_count : 0;
    return backend ? backend->events : NULL;
}

/* ============================================================================
 * Registration
 * ============================================================================ */

static void PickingSystem(ecs_iter_t *it) {
    Smud_PickingBackend *backend = (Smud_PickingBackend *)it->ctx;
    const C_SmudRayMap *map = ecs_singleton_get(it->world, C_SmudRayMap);

    if (!map) {
        smud_picking_update(backend, it->world, NULL, 0);
        return;
    }
    smud_picking_update(backend, it->world, map->entries, map->count);
}

void smud_picking_register(ecs_world_t *world) {
    if (!world) return;

    ECS_COMPONENT_DEFINE(world, C_SmudCamera);
    ECS_COMPONENT_DEFINE(world, C_Pickable);
    ECS_COMPONENT_DEFINE(world, C_SmudPickingShape);
    ECS_COMPONENT_DEFINE(world, C_SmudRayMap);
    ECS_TAG_DEFINE(world, SmudPickingCamera);
}

ecs_entity_t smud_picking_register_system(ecs_world_t *world, Smud_PickingBackend *backend) {
    if (!world || !backend) return 0;

    ecs_entity_desc_t entity_desc = {};
    entity_desc.name = "SmudPickingSystem";

    /* No terms: runs once per frame */
    ecs_system_desc_t sys_desc = {};
    sys_desc.entity = ecs_entity_init(world, &entity_desc);
    sys_desc.callback = PickingSystem;
    sys_desc.ctx = backend;

    ecs_entity_t system = ecs_system_init(world, &sys_desc);
    ecs_add_pair(world, system, EcsDependsOn, EcsPreUpdate);
    ecs_add_id(world, system, EcsPreUpdate);

    smud_log_info(SMUD_LOG_PICKING, "Picking system registered");
    return system;
}
