#include "smud/smud.h"
#include "smud/ecs.h"
#include <stdlib.h>

struct Smud_World {
    ecs_world_t *world;
};

ECS_COMPONENT_DECLARE(C_Visibility);
ECS_COMPONENT_DECLARE(C_ViewVisibility);

Smud_World *smud_ecs_init(void) {
    Smud_World *sworld = SMUD_ALLOC(Smud_World);
    if (!sworld) {
        smud_set_error("ecs: failed to allocate world wrapper");
        return NULL;
    }

    sworld->world = ecs_init();
    if (!sworld->world) {
        smud_set_error("ecs: ecs_init failed");
        free(sworld);
        return NULL;
    }

    smud_ecs_register_components(sworld->world);

    smud_log_debug(SMUD_LOG_ECS, "World created (Flecs v%d.%d.%d)",
                   FLECS_VERSION_MAJOR, FLECS_VERSION_MINOR, FLECS_VERSION_PATCH);
    return sworld;
}

void smud_ecs_shutdown(Smud_World *world) {
    if (!world) return;

    if (world->world) {
        /* Flush pending deferred operations */
        while (ecs_is_deferred(world->world)) {
            ecs_defer_end(world->world);
        }
        ecs_fini(world->world);
    }

    free(world);
}

ecs_world_t *smud_ecs_get_world(Smud_World *world) {
    return world ? world->world : NULL;
}

bool smud_ecs_progress(Smud_World *world, float delta_time) {
    if (!world || !world->world) return false;
    return ecs_progress(world->world, delta_time);
}

ecs_entity_t smud_ecs_entity_new(Smud_World *world) {
    if (!world || !world->world) return 0;
    return ecs_new(world->world);
}

ecs_entity_t smud_ecs_entity_new_named(Smud_World *world, const char *name) {
    if (!world || !world->world) return 0;
    ecs_entity_desc_t desc = {};
    desc.name = name;
    return ecs_entity_init(world->world, &desc);
}

void smud_ecs_entity_delete(Smud_World *world, ecs_entity_t entity) {
    if (!world || !world->world) return;
    ecs_delete(world->world, entity);
}

bool smud_ecs_entity_is_alive(Smud_World *world, ecs_entity_t entity) {
    if (!world || !world->world) return false;
    return ecs_is_alive(world->world, entity);
}

void smud_ecs_register_components(ecs_world_t *world) {
    if (!world) return;

    ECS_COMPONENT_DEFINE(world, C_Visibility);
    ECS_COMPONENT_DEFINE(world, C_ViewVisibility);
}

bool smud_ecs_is_visible(const ecs_world_t *world, ecs_entity_t entity) {
    if (!world || !entity) return false;

    if (ecs_id(C_Visibility) != 0) {
        const C_Visibility *vis = ecs_get(world, entity, C_Visibility);
        if (vis && !vis->visible) return false;
    }

    if (ecs_id(C_ViewVisibility) != 0) {
        const C_ViewVisibility *view = ecs_get(world, entity, C_ViewVisibility);
        if (view && !view->visible) return false;
    }

    return true;
}
