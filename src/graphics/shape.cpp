#include "smud/shape.h"
#include "smud/ecs.h"
#include <atomic>
#include <math.h>

ECS_COMPONENT_DECLARE(C_SmudShape);

const Smud_ShaderId SMUD_SHADER_DEFAULT_FILL  = { 1 };
const Smud_ShaderId SMUD_SHADER_SIMPLE_FILL   = { 2 };
const Smud_ShaderId SMUD_SHADER_RECTANGLE_SDF = { 3 };

/* Generated ids live in the upper half of the range, name hashes below it */
#define SHADER_ID_GENERATED_BIT 0x8000000000000000ull

static std::atomic<uint64_t> s_generated_counter{0};

/* ============================================================================
 * Shader Identity
 * ============================================================================ */

/* FNV-1a, 64-bit */
static uint64_t hash_name(const char *str) {
    uint64_t hash = 14695981039346656037ull;
    while (*str) {
        hash ^= (uint8_t)*str++;
        hash *= 1099511628211ull;
    }
    return hash;
}

Smud_ShaderId smud_shader_id_from_name(const char *name) {
    Smud_ShaderId id = SMUD_SHADER_ID_NONE;
    if (!name || !name[0]) return id;

    uint64_t hash = hash_name(name) & ~SHADER_ID_GENERATED_BIT;
    if (hash < SMUD_SHADER_ID_FIRST_USER) {
        hash += SMUD_SHADER_ID_FIRST_USER;
    }
    id.value = hash;
    return id;
}

Smud_ShaderId smud_shader_id_generate(void) {
    Smud_ShaderId id;
    id.value = SHADER_ID_GENERATED_BIT | (s_generated_counter.fetch_add(1) + 1);
    return id;
}

bool smud_shader_id_equals(Smud_ShaderId a, Smud_ShaderId b) {
    return a.value == b.value;
}

bool smud_shader_id_is_none(Smud_ShaderId id) {
    return id.value == 0;
}

int smud_shader_id_compare(Smud_ShaderId a, Smud_ShaderId b) {
    if (a.value < b.value) return -1;
    if (a.value > b.value) return 1;
    return 0;
}

int smud_shader_pair_compare(Smud_ShaderId sdf_a, Smud_ShaderId fill_a,
                             Smud_ShaderId sdf_b, Smud_ShaderId fill_b) {
    int c = smud_shader_id_compare(sdf_a, sdf_b);
    if (c != 0) return c;
    return smud_shader_id_compare(fill_a, fill_b);
}

/* ============================================================================
 * Color
 * ============================================================================ */

Smud_Color smud_color_rgb(float r, float g, float b) {
    return smud_color_rgba(r, g, b, 1.0f);
}

Smud_Color smud_color_rgba(float r, float g, float b, float a) {
    Smud_Color c;
    c.r = r;
    c.g = g;
    c.b = b;
    c.a = a;
    return c;
}

static float srgb_to_linear(float c) {
    if (c <= 0.04045f) return c / 12.92f;
    return powf((c + 0.055f) / 1.055f, 2.4f);
}

void smud_color_to_linear(Smud_Color color, float out[4]) {
    if (!out) return;
    out[0] = srgb_to_linear(color.r);
    out[1] = srgb_to_linear(color.g);
    out[2] = srgb_to_linear(color.b);
    out[3] = color.a;
}

/* ============================================================================
 * Frame
 * ============================================================================ */

Smud_Frame smud_frame_quad(float half_size) {
    Smud_Frame frame;
    frame.kind = SMUD_FRAME_QUAD;
    frame.quad.half_size = half_size;
    return frame;
}

float smud_frame_half_extent(Smud_Frame frame) {
    switch (frame.kind) {
        case SMUD_FRAME_QUAD:
            return frame.quad.half_size;
    }
    return 0.0f;
}

bool smud_frame_contains(Smud_Frame frame, float x, float y) {
    switch (frame.kind) {
        case SMUD_FRAME_QUAD:
            return fabsf(x) <= frame.quad.half_size &&
                   fabsf(y) <= frame.quad.half_size;
    }
    return false;
}

/* ============================================================================
 * Shape Component
 * ============================================================================ */

C_SmudShape smud_shape_create(Smud_ShaderId sdf, float half_size) {
    C_SmudShape shape = {};
    Smud_Color pink = SMUD_COLOR_PINK;
    shape.color = pink;
    shape.sdf = sdf;
    shape.fill = SMUD_SHADER_DEFAULT_FILL;
    shape.frame = smud_frame_quad(half_size);
    shape.blend_mode = SMUD_BLEND_ALPHA;
    return shape;
}

void smud_shape_with_color(C_SmudShape *shape, Smud_Color color) {
    if (shape) shape->color = color;
}

void smud_shape_with_fill(C_SmudShape *shape, Smud_ShaderId fill) {
    if (shape) shape->fill = fill;
}

void smud_shape_with_frame(C_SmudShape *shape, Smud_Frame frame) {
    if (shape) shape->frame = frame;
}

void smud_shape_with_params(C_SmudShape *shape, float p0, float p1, float p2, float p3) {
    if (!shape) return;
    shape->params[0] = p0;
    shape->params[1] = p1;
    shape->params[2] = p2;
    shape->params[3] = p3;
}

void smud_shape_with_blend_mode(C_SmudShape *shape, Smud_BlendMode mode) {
    if (shape) shape->blend_mode = mode;
}

void smud_shape_register(ecs_world_t *world) {
    if (!world) return;
    ECS_COMPONENT_DEFINE(world, C_SmudShape);
}

void smud_shape_register_world(Smud_World *world) {
    if (!world) return;
    smud_shape_register(smud_ecs_get_world(world));
}
