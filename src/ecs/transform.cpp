/**
 * Smud - Transform Hierarchy Implementation
 *
 * Composes local transforms into world matrices along Flecs EcsChildOf.
 */

#include "smud/transform.h"
#include "smud/ecs.h"
#include "flecs.h"
#include <math.h>
#include <string.h>

ECS_COMPONENT_DECLARE(C_Transform);
ECS_COMPONENT_DECLARE(C_GlobalTransform);

/* ============================================================================
 * Affine Helpers
 * ============================================================================ */

/* cglm takes non-const matrices; work on a local copy */
static void copy_matrix(const mat4 src, mat4 dst) {
    memcpy(dst, src, sizeof(mat4));
}

void smud_transform_compose(const C_Transform *local, mat4 out) {
    glm_mat4_identity(out);
    if (!local) return;

    vec3 translation = { local->local_x, local->local_y, local->local_z };
    vec3 scale = { local->scale_x, local->scale_y, 1.0f };

    glm_translate(out, translation);
    glm_rotate_z(out, local->rotation, out);
    glm_scale(out, scale);
}

bool smud_affine_is_finite(const mat4 m) {
    for (int c = 0; c < 4; c++) {
        for (int r = 0; r < 4; r++) {
            if (!isfinite(m[c][r])) return false;
        }
    }
    return true;
}

bool smud_affine_inverse(const mat4 m, mat4 out) {
    if (!smud_affine_is_finite(m)) return false;

    mat4 tmp;
    copy_matrix(m, tmp);

    float det = glm_mat4_det(tmp);
    if (!isfinite(det) || det == 0.0f) return false;

    /* A subnormal determinant can still overflow the inverse */
    mat4 inv;
    glm_mat4_inv(tmp, inv);
    if (!smud_affine_is_finite(inv)) return false;

    copy_matrix(inv, out);
    return true;
}

void smud_affine_translation(const mat4 m, vec3 out) {
    out[0] = m[3][0];
    out[1] = m[3][1];
    out[2] = m[3][2];
}

void smud_affine_rotation_scale(const mat4 m, float out_rotation[2], float *out_scale) {
    /* First column is the image of the local +X axis */
    float x = m[0][0];
    float y = m[0][1];
    float scale = sqrtf(x * x + y * y);

    if (out_scale) *out_scale = scale;
    if (!out_rotation) return;

    if (scale > 0.0f) {
        out_rotation[0] = x / scale;
        out_rotation[1] = y / scale;
    } else {
        out_rotation[0] = 1.0f;
        out_rotation[1] = 0.0f;
    }
}

void smud_affine_back(const mat4 m, vec3 out) {
    vec3 axis = { m[2][0], m[2][1], m[2][2] };
    float len = glm_vec3_norm(axis);
    if (len > 0.0f && isfinite(len)) {
        glm_vec3_scale(axis, 1.0f / len, out);
    } else {
        out[0] = 0.0f;
        out[1] = 0.0f;
        out[2] = 1.0f;
    }
}

void smud_affine_transform_point(const mat4 m, const vec3 p, vec3 out) {
    mat4 tmp;
    copy_matrix(m, tmp);

    vec4 in = { p[0], p[1], p[2], 1.0f };
    vec4 res;
    glm_mat4_mulv(tmp, in, res);

    out[0] = res[0];
    out[1] = res[1];
    out[2] = res[2];
}

/* ============================================================================
 * Propagation
 * ============================================================================ */

static void update_entity_transform(ecs_world_t *world,
                                    ecs_entity_t entity,
                                    const C_GlobalTransform *parent_global) {
    const C_Transform *local = ecs_get(world, entity, C_Transform);
    if (!local) return;

    C_GlobalTransform global;
    mat4 local_m;
    smud_transform_compose(local, local_m);

    if (parent_global) {
        mat4 parent_m;
        copy_matrix(parent_global->matrix, parent_m);
        glm_mat4_mul(parent_m, local_m, global.matrix);
    } else {
        copy_matrix(local_m, global.matrix);
    }

    ecs_set_ptr(world, entity, C_GlobalTransform, &global);

    ecs_iter_t it = ecs_children(world, entity);
    while (ecs_children_next(&it)) {
        for (int i = 0; i < it.count; i++) {
            update_entity_transform(world, it.entities[i], &global);
        }
    }
}

/**
 * Roots only; children are reached through recursion so a child is never
 * composed against a stale parent matrix.
 */
static void TransformPropagationSystem(ecs_iter_t *it) {
    for (int i = 0; i < it->count; i++) {
        ecs_entity_t entity = it->entities[i];
        if (ecs_get_parent(it->world, entity) != 0) continue;

        update_entity_transform(it->world, entity, NULL);
    }
}

/* ============================================================================
 * Registration
 * ============================================================================ */

void smud_transform_register(ecs_world_t *world) {
    if (!world) return;

    ECS_COMPONENT_DEFINE(world, C_Transform);
    ECS_COMPONENT_DEFINE(world, C_GlobalTransform);

    ecs_entity_desc_t entity_desc = {};
    entity_desc.name = "SmudTransformPropagationSystem";

    ecs_system_desc_t sys_desc = {};
    sys_desc.entity = ecs_entity_init(world, &entity_desc);
    sys_desc.query.terms[0].id = ecs_id(C_Transform);
    sys_desc.callback = TransformPropagationSystem;

    ecs_entity_t system = ecs_system_init(world, &sys_desc);
    ecs_add_pair(world, system, EcsDependsOn, EcsPostUpdate);
    ecs_add_id(world, system, EcsPostUpdate);
}

void smud_transform_register_world(Smud_World *world) {
    if (!world) return;
    smud_transform_register(smud_ecs_get_world(world));
}

/* ============================================================================
 * Hierarchy
 * ============================================================================ */

void smud_transform_set_parent(ecs_world_t *world, ecs_entity_t child, ecs_entity_t parent) {
    if (!world || !child) return;

    if (!ecs_has(world, child, C_Transform)) {
        C_Transform default_tf = C_TRANSFORM_DEFAULT;
        ecs_set_ptr(world, child, C_Transform, &default_tf);
    }

    if (!ecs_has(world, child, C_GlobalTransform)) {
        C_GlobalTransform identity;
        glm_mat4_identity(identity.matrix);
        ecs_set_ptr(world, child, C_GlobalTransform, &identity);
    }

    ecs_entity_t old_parent = ecs_get_parent(world, child);
    if (old_parent != 0) {
        ecs_remove_pair(world, child, EcsChildOf, old_parent);
    }

    if (parent != 0) {
        ecs_add_pair(world, child, EcsChildOf, parent);
    }
}

ecs_entity_t smud_transform_get_parent(ecs_world_t *world, ecs_entity_t entity) {
    if (!world || !entity) return 0;
    return ecs_get_parent(world, entity);
}

bool smud_transform_has_parent(ecs_world_t *world, ecs_entity_t entity) {
    return smud_transform_get_parent(world, entity) != 0;
}

int smud_transform_get_child_count(ecs_world_t *world, ecs_entity_t parent) {
    if (!world || !parent) return 0;

    int count = 0;
    ecs_iter_t it = ecs_children(world, parent);
    while (ecs_children_next(&it)) {
        count += it.count;
    }
    return count;
}

void smud_transform_remove_parent(ecs_world_t *world, ecs_entity_t entity) {
    smud_transform_set_parent(world, entity, (ecs_entity_t)0);
}

/* ============================================================================
 * Local Manipulation
 * ============================================================================ */

static C_Transform *get_or_create_transform(ecs_world_t *world, ecs_entity_t entity) {
    if (!ecs_has(world, entity, C_Transform)) {
        C_Transform default_tf = C_TRANSFORM_DEFAULT;
        ecs_set_ptr(world, entity, C_Transform, &default_tf);
    }
    return ecs_get_mut(world, entity, C_Transform);
}

void smud_transform_set_local_position(ecs_world_t *world, ecs_entity_t entity,
                                       float x, float y, float z) {
    if (!world || !entity) return;

    C_Transform *t = get_or_create_transform(world, entity);
    if (t) {
        t->local_x = x;
        t->local_y = y;
        t->local_z = z;
        ecs_modified(world, entity, C_Transform);
    }
}

void smud_transform_set_local_rotation(ecs_world_t *world, ecs_entity_t entity,
                                       float radians) {
    if (!world || !entity) return;

    C_Transform *t = get_or_create_transform(world, entity);
    if (t) {
        t->rotation = radians;
        ecs_modified(world, entity, C_Transform);
    }
}

void smud_transform_set_local_scale(ecs_world_t *world, ecs_entity_t entity,
                                    float scale_x, float scale_y) {
    if (!world || !entity) return;

    C_Transform *t = get_or_create_transform(world, entity);
    if (t) {
        t->scale_x = scale_x;
        t->scale_y = scale_y;
        ecs_modified(world, entity, C_Transform);
    }
}

bool smud_transform_get_world_position(ecs_world_t *world, ecs_entity_t entity,
                                       vec3 out_position) {
    if (!world || !entity || !out_position) return false;

    const C_GlobalTransform *gt = ecs_get(world, entity, C_GlobalTransform);
    if (!gt) return false;

    smud_affine_translation(gt->matrix, out_position);
    return true;
}

/* ============================================================================
 * Manual Update
 * ============================================================================ */

void smud_transform_update(ecs_world_t *world, ecs_entity_t entity) {
    if (!world || !entity) return;

    const C_GlobalTransform *parent_global = NULL;
    ecs_entity_t parent = ecs_get_parent(world, entity);
    if (parent != 0) {
        parent_global = ecs_get(world, parent, C_GlobalTransform);
    }

    /* ecs_set_ptr on the child may move the parent's storage; copy first */
    C_GlobalTransform parent_copy;
    if (parent_global) parent_copy = *parent_global;

    ecs_defer_begin(world);
    update_entity_transform(world, entity, parent_global ? &parent_copy : NULL);
    ecs_defer_end(world);
}

void smud_transform_update_all(ecs_world_t *world) {
    if (!world) return;

    ecs_query_desc_t query_desc = {};
    query_desc.terms[0].id = ecs_id(C_Transform);

    ecs_query_t *q = ecs_query_init(world, &query_desc);
    if (!q) return;

    /* Adding C_GlobalTransform changes tables; defer while iterating */
    ecs_defer_begin(world);
    ecs_iter_t it = ecs_query_iter(world, q);
    while (ecs_query_next(&it)) {
        for (int i = 0; i < it.count; i++) {
            ecs_entity_t entity = it.entities[i];
            if (ecs_get_parent(world, entity) != 0) continue;

            update_entity_transform(world, entity, NULL);
        }
    }
    ecs_defer_end(world);

    ecs_query_fini(q);
}
