/*
 * Smud - Picking Backend Tests
 *
 * Camera at z = 100 looking down -Z; shapes in planes z = 0..2.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "smud/smud.h"
#include <cmath>
#include <vector>

using Catch::Approx;

/* ============================================================================
 * Test Fixtures
 * ============================================================================ */

class PickingFixture {
public:
    Smud_World *sworld = nullptr;
    ecs_world_t *world = nullptr;
    Smud_PickingBackend *picking = nullptr;
    ecs_entity_t camera = 0;

    PickingFixture() {
        sworld = smud_ecs_init();
        world = smud_ecs_get_world(sworld);
        smud_transform_register(world);
        smud_shape_register(world);
        smud_picking_register(world);

        picking = smud_picking_create(nullptr);
        camera = spawn_camera(0);
    }

    ~PickingFixture() {
        smud_picking_destroy(picking);
        smud_ecs_shutdown(sworld);
    }

    ecs_entity_t spawn_camera(int order) {
        ecs_entity_t e = ecs_new(world);
        C_Transform tf = C_TRANSFORM_DEFAULT;
        tf.local_z = 100.0f;
        ecs_set_ptr(world, e, C_Transform, &tf);

        C_SmudCamera cam = C_SMUD_CAMERA_DEFAULT;
        cam.order = order;
        ecs_set_ptr(world, e, C_SmudCamera, &cam);
        return e;
    }

    ecs_entity_t spawn_shape(float x, float y, float z, float half_size = 10.0f,
                             float rotation = 0.0f, float scale = 1.0f) {
        ecs_entity_t e = ecs_new(world);
        C_Transform tf = { x, y, z, rotation, scale, scale };
        ecs_set_ptr(world, e, C_Transform, &tf);

        C_SmudShape shape = smud_shape_create(SMUD_SHADER_RECTANGLE_SDF, half_size);
        ecs_set_ptr(world, e, C_SmudShape, &shape);
        return e;
    }

    void set_pickable(ecs_entity_t e, bool blocks, bool hoverable = true) {
        C_Pickable p = { blocks, hoverable };
        ecs_set_ptr(world, e, C_Pickable, &p);
    }

    Smud_RayMapEntry ray_at(float x, float y, uint64_t pointer = SMUD_POINTER_MOUSE) const {
        Smud_RayMapEntry entry = {};
        entry.id.camera = camera;
        entry.id.pointer = pointer;
        entry.ray.origin[0] = x;
        entry.ray.origin[1] = y;
        entry.ray.origin[2] = 100.0f;
        entry.ray.direction[2] = -1.0f;
        return entry;
    }

    int pick(float x, float y) {
        ecs_progress(world, 0.016f);
        Smud_RayMapEntry ray = ray_at(x, y);
        return smud_picking_update(picking, world, &ray, 1);
    }

    std::vector<Smud_HitData> hits() const {
        size_t count = 0;
        const Smud_PointerHits *events = smud_picking_get_events(picking, &count);
        if (count == 0) return {};
        return std::vector<Smud_HitData>(events[0].hits, events[0].hits + events[0].hit_count);
    }
};

/* ============================================================================
 * Basic Hits
 * ============================================================================ */

TEST_CASE_METHOD(PickingFixture, "Ray hits a shape under the pointer", "[picking]") {
    ecs_entity_t e = spawn_shape(50.0f, 50.0f, 2.0f);

    REQUIRE(pick(55.0f, 45.0f) == 1);

    auto h = hits();
    REQUIRE(h.size() == 1);
    REQUIRE(h[0].entity == e);
    REQUIRE(h[0].camera == camera);
    REQUIRE(h[0].depth == Approx(98.0f));
    REQUIRE(h[0].position[0] == Approx(55.0f));
    REQUIRE(h[0].position[1] == Approx(45.0f));
    REQUIRE(h[0].position[2] == Approx(2.0f));
    REQUIRE(h[0].normal[0] == Approx(0.0f));
    REQUIRE(h[0].normal[1] == Approx(0.0f));
    REQUIRE(h[0].normal[2] == Approx(1.0f));

    size_t count = 0;
    const Smud_PointerHits *events = smud_picking_get_events(picking, &count);
    REQUIRE(events[0].pointer == SMUD_POINTER_MOUSE);
    REQUIRE(events[0].order == 0.0f);
}

TEST_CASE_METHOD(PickingFixture, "Frame edge is the hit boundary", "[picking]") {
    spawn_shape(0.0f, 0.0f, 0.0f, 10.0f);

    REQUIRE(pick(0.0f, 0.0f) == 1);
    REQUIRE(pick(10.0f, 0.0f) == 1);

    for (float eps : { 1e-3f, 0.1f, 5.0f }) {
        REQUIRE(pick(10.0f + eps, 0.0f) == 0);
        REQUIRE(pick(0.0f, -10.0f - eps) == 0);
    }
}

TEST_CASE_METHOD(PickingFixture, "Hit test happens in local space", "[picking]") {
    /* Rotated by 45 degrees the corner reaches past x = 10 */
    spawn_shape(0.0f, 0.0f, 0.0f, 10.0f, GLM_PI_4f);
    REQUIRE(pick(13.0f, 0.0f) == 1);
    REQUIRE(pick(9.0f, 9.0f) == 0);

    SECTION("Scale grows the frame") {
        ecs_entity_t big = spawn_shape(100.0f, 0.0f, 0.0f, 10.0f, 0.0f, 3.0f);
        REQUIRE(pick(125.0f, 0.0f) == 1);
        REQUIRE(hits()[0].entity == big);
    }
}

TEST_CASE_METHOD(PickingFixture, "Miss produces no event", "[picking]") {
    spawn_shape(0.0f, 0.0f, 0.0f);
    REQUIRE(pick(500.0f, 500.0f) == 0);
    REQUIRE(hits().empty());
}

/* ============================================================================
 * Occlusion
 * ============================================================================ */

TEST_CASE_METHOD(PickingFixture, "Nearest blocking shape hides the rest", "[picking][occlusion]") {
    spawn_shape(0.0f, 0.0f, 0.0f);
    spawn_shape(0.0f, 0.0f, 1.0f);
    ecs_entity_t top = spawn_shape(0.0f, 0.0f, 2.0f);

    REQUIRE(pick(0.0f, 0.0f) == 1);
    auto h = hits();
    REQUIRE(h.size() == 1);
    REQUIRE(h[0].entity == top);
}

TEST_CASE_METHOD(PickingFixture, "Non-blocking shapes report everything below", "[picking][occlusion]") {
    ecs_entity_t bottom = spawn_shape(0.0f, 0.0f, 0.0f);
    ecs_entity_t middle = spawn_shape(0.0f, 0.0f, 1.0f);
    ecs_entity_t top = spawn_shape(0.0f, 0.0f, 2.0f);

    SECTION("None block") {
        set_pickable(bottom, false);
        set_pickable(middle, false);
        set_pickable(top, false);

        REQUIRE(pick(0.0f, 0.0f) == 1);
        auto h = hits();
        REQUIRE(h.size() == 3);
        REQUIRE(h[0].entity == top);
        REQUIRE(h[1].entity == middle);
        REQUIRE(h[2].entity == bottom);
        REQUIRE(h[0].depth < h[1].depth);
        REQUIRE(h[1].depth < h[2].depth);
    }

    SECTION("Middle blocks") {
        set_pickable(top, false);
        set_pickable(middle, true);

        pick(0.0f, 0.0f);
        auto h = hits();
        REQUIRE(h.size() == 2);
        REQUIRE(h[0].entity == top);
        REQUIRE(h[1].entity == middle);
    }

    SECTION("A miss above does not block") {
        ecs_entity_t offset = spawn_shape(100.0f, 0.0f, 5.0f);
        (void)offset;
        pick(0.0f, 0.0f);
        auto h = hits();
        REQUIRE(h.size() == 1);
        REQUIRE(h[0].entity == top);
    }
}

TEST_CASE_METHOD(PickingFixture, "Equal depth ties go to the lower entity id", "[picking][occlusion]") {
    ecs_entity_t first = spawn_shape(0.0f, 0.0f, 1.0f);
    spawn_shape(0.0f, 0.0f, 1.0f);

    pick(0.0f, 0.0f);
    REQUIRE(hits()[0].entity == first);
}

/* ============================================================================
 * Filtering
 * ============================================================================ */

TEST_CASE_METHOD(PickingFixture, "Hidden and degenerate shapes are ignored", "[picking][filter]") {
    ecs_entity_t below = spawn_shape(0.0f, 0.0f, 0.0f);
    ecs_entity_t above = spawn_shape(0.0f, 0.0f, 1.0f);

    SECTION("Invisible") {
        C_Visibility off = { false };
        ecs_set_ptr(world, above, C_Visibility, &off);
    }

    SECTION("Zero scale") {
        smud_transform_set_local_scale(world, above, 0.0f, 0.0f);
    }

    SECTION("Not hoverable") {
        set_pickable(above, true, false);
    }

    REQUIRE(pick(0.0f, 0.0f) == 1);
    REQUIRE(hits()[0].entity == below);
}

TEST_CASE_METHOD(PickingFixture, "Non-finite world transform is ignored", "[picking][filter]") {
    ecs_entity_t e = ecs_new(world);
    C_SmudShape shape = smud_shape_create(SMUD_SHADER_RECTANGLE_SDF, 10.0f);
    ecs_set_ptr(world, e, C_SmudShape, &shape);

    C_GlobalTransform broken;
    glm_mat4_identity(broken.matrix);
    broken.matrix[3][0] = NAN;
    ecs_set_ptr(world, e, C_GlobalTransform, &broken);

    REQUIRE(pick(0.0f, 0.0f) == 0);
}

TEST_CASE_METHOD(PickingFixture, "Parallel rays never hit", "[picking][filter]") {
    spawn_shape(0.0f, 0.0f, 0.0f, 1000.0f);
    ecs_progress(world, 0.016f);

    Smud_RayMapEntry ray = ray_at(0.0f, 0.0f);
    ray.ray.direction[0] = 1.0f;
    ray.ray.direction[2] = 0.0f;

    REQUIRE(smud_picking_update(picking, world, &ray, 1) == 0);
}

/* ============================================================================
 * Cameras
 * ============================================================================ */

TEST_CASE_METHOD(PickingFixture, "Camera eligibility", "[picking][camera]") {
    spawn_shape(0.0f, 0.0f, 0.0f);

    SECTION("Inactive camera") {
        C_SmudCamera off = { false, 0 };
        ecs_set_ptr(world, camera, C_SmudCamera, &off);
        REQUIRE(pick(0.0f, 0.0f) == 0);
    }

    SECTION("Entity without a camera") {
        ecs_remove(world, camera, C_SmudCamera);
        REQUIRE(pick(0.0f, 0.0f) == 0);
    }

    SECTION("Deleted camera") {
        ecs_delete(world, camera);
        REQUIRE(pick(0.0f, 0.0f) == 0);
    }

    SECTION("Camera order is reported") {
        C_SmudCamera ordered = { true, 3 };
        ecs_set_ptr(world, camera, C_SmudCamera, &ordered);
        REQUIRE(pick(0.0f, 0.0f) == 1);

        const Smud_PointerHits *events = smud_picking_get_events(picking, nullptr);
        REQUIRE(events[0].order == 3.0f);
    }
}

TEST_CASE_METHOD(PickingFixture, "No rays or no shapes", "[picking]") {
    REQUIRE(smud_picking_update(picking, world, nullptr, 0) == 0);

    ecs_progress(world, 0.016f);
    Smud_RayMapEntry ray = ray_at(0.0f, 0.0f);
    REQUIRE(smud_picking_update(picking, world, &ray, 1) == 0);
}

TEST_CASE_METHOD(PickingFixture, "One event per pointer", "[picking]") {
    ecs_entity_t left = spawn_shape(-50.0f, 0.0f, 0.0f);
    ecs_entity_t right = spawn_shape(50.0f, 0.0f, 0.0f);
    ecs_progress(world, 0.016f);

    Smud_RayMapEntry rays[3] = {
        ray_at(-50.0f, 0.0f, 1),
        ray_at(50.0f, 0.0f, 2),
        ray_at(0.0f, 300.0f, 3)
    };
    REQUIRE(smud_picking_update(picking, world, rays, 3) == 2);

    size_t count = 0;
    const Smud_PointerHits *events = smud_picking_get_events(picking, &count);
    REQUIRE(count == 2);
    REQUIRE(events[0].pointer == 1);
    REQUIRE(events[0].hits[0].entity == left);
    REQUIRE(events[1].pointer == 2);
    REQUIRE(events[1].hits[0].entity == right);
}

/* ============================================================================
 * Markers Mode
 * ============================================================================ */

TEST_CASE_METHOD(PickingFixture, "Markers mode requires opt-in on both sides", "[picking][markers]") {
    Smud_PickingSettings settings = SMUD_PICKING_SETTINGS_DEFAULT;
    settings.require_markers = true;
    smud_picking_set_settings(picking, &settings);
    REQUIRE(smud_picking_get_settings(picking).require_markers);

    ecs_entity_t plain = spawn_shape(0.0f, 0.0f, 1.0f);
    ecs_entity_t marked = spawn_shape(0.0f, 0.0f, 0.0f);
    set_pickable(marked, true);

    SECTION("Camera without the tag") {
        REQUIRE(pick(0.0f, 0.0f) == 0);
    }

    SECTION("Only marked shapes") {
        ecs_add_id(world, camera, SmudPickingCamera);
        REQUIRE(pick(0.0f, 0.0f) == 1);
        auto h = hits();
        REQUIRE(h.size() == 1);
        REQUIRE(h[0].entity == marked);
        (void)plain;
    }
}

/* ============================================================================
 * Exact Shapes
 * ============================================================================ */

TEST_CASE_METHOD(PickingFixture, "Distance function replaces the frame test", "[picking][sdf]") {
    ecs_entity_t e = spawn_shape(0.0f, 0.0f, 0.0f, 10.0f);

    /* Corner of the frame, outside the inscribed circle */
    REQUIRE(pick(9.0f, 9.0f) == 1);

    C_SmudPickingShape circle = smud_picking_shape_circle(10.0f);
    ecs_set_ptr(world, e, C_SmudPickingShape, &circle);
    REQUIRE(pick(9.0f, 9.0f) == 0);
    REQUIRE(pick(6.0f, 6.0f) == 1);

    SECTION("Box and rounded box") {
        C_SmudPickingShape box = smud_picking_shape_box(20.0f, 2.0f);
        ecs_set_ptr(world, e, C_SmudPickingShape, &box);
        REQUIRE(pick(15.0f, 0.0f) == 1);
        REQUIRE(pick(0.0f, 5.0f) == 0);

        C_SmudPickingShape rounded = smud_picking_shape_rounded_box(10.0f, 10.0f, 5.0f);
        ecs_set_ptr(world, e, C_SmudPickingShape, &rounded);
        REQUIRE(pick(9.5f, 9.5f) == 0);
        REQUIRE(pick(9.5f, 0.0f) == 1);
    }
}

/* ============================================================================
 * Listener & System
 * ============================================================================ */

static void record_event(const Smud_PointerHits *event, void *userdata) {
    auto *seen = static_cast<std::vector<uint64_t> *>(userdata);
    seen->push_back(event->pointer);
}

TEST_CASE_METHOD(PickingFixture, "Listener sees every event", "[picking][listener]") {
    spawn_shape(0.0f, 0.0f, 0.0f);
    std::vector<uint64_t> seen;
    smud_picking_set_listener(picking, record_event, &seen);

    pick(0.0f, 0.0f);
    pick(500.0f, 0.0f);

    REQUIRE(seen.size() == 1);
    REQUIRE(seen[0] == SMUD_POINTER_MOUSE);
}

TEST_CASE_METHOD(PickingFixture, "Picking system reads the ray map", "[picking][system]") {
    ecs_entity_t e = spawn_shape(0.0f, 0.0f, 0.0f);
    REQUIRE(smud_picking_register_system(world, picking) != 0);

    /* Transforms settle on the first frame */
    ecs_progress(world, 0.016f);

    Smud_RayMapEntry ray = ray_at(0.0f, 0.0f, 7);
    C_SmudRayMap map = { &ray, 1 };
    ecs_set_ptr(world, ecs_id(C_SmudRayMap), C_SmudRayMap, &map);

    ecs_progress(world, 0.016f);

    size_t count = 0;
    const Smud_PointerHits *events = smud_picking_get_events(picking, &count);
    REQUIRE(count == 1);
    REQUIRE(events[0].pointer == 7);
    REQUIRE(events[0].hits[0].entity == e);
}

TEST_CASE("Picking NULL safety", "[picking]") {
    smud_picking_destroy(nullptr);
    smud_picking_set_settings(nullptr, nullptr);
    smud_picking_set_listener(nullptr, nullptr, nullptr);
    REQUIRE(smud_picking_update(nullptr, nullptr, nullptr, 0) == 0);
    REQUIRE(smud_picking_get_events(nullptr, nullptr) == nullptr);
    REQUIRE_FALSE(smud_picking_get_settings(nullptr).require_markers);
    REQUIRE(smud_picking_register_system(nullptr, nullptr) == 0);
}
