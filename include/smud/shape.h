/**
 * Smud Shape Record
 *
 * C_SmudShape is the per-entity data the renderer and the picking backend
 * consume. A shape is drawn as one instanced quad whose extent is the frame;
 * the pixels inside are produced by a pair of shaders: the SDF shader
 * computes a signed distance from the local position and params, and the
 * fill shader turns that distance into a color.
 *
 * Shader identities are opaque 64-bit values. Batching and the pipeline
 * cache only ever compare them; shader contents are never inspected.
 *
 * Usage:
 *   Smud_ShaderId star = smud_shader_id_from_name("shapes/star.wgsl");
 *
 *   C_SmudShape shape = smud_shape_create(star, 50.0f);
 *   smud_shape_with_color(&shape, smud_color_rgb(0.36f, 0.41f, 0.97f));
 *   smud_shape_with_params(&shape, 5.0f, 0.4f, 0.0f, 0.0f);
 *   ecs_set_ptr(world, e, C_SmudShape, &shape);
 */

#ifndef SMUD_SHAPE_H
#define SMUD_SHAPE_H

#include "flecs.h"
#include <stdbool.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef struct Smud_World Smud_World;

/* ============================================================================
 * Shader Identity
 * ============================================================================ */

/**
 * Opaque shader identity. 0 = none.
 * Values below SMUD_SHADER_ID_FIRST_USER are reserved for built-in shaders.
 */
typedef struct Smud_ShaderId {
    uint64_t value;
} Smud_ShaderId;

#define SMUD_SHADER_ID_NONE        { 0 }
#define SMUD_SHADER_ID_FIRST_USER  0x100ull

/* Built-in shaders */
extern const Smud_ShaderId SMUD_SHADER_DEFAULT_FILL;   /* Antialiased edge with cubic falloff glow */
extern const Smud_ShaderId SMUD_SHADER_SIMPLE_FILL;    /* Flat antialiased fill */
extern const Smud_ShaderId SMUD_SHADER_RECTANGLE_SDF;  /* Box of half-size params.xy */

/**
 * Derive a stable identity from a shader name or path (64-bit FNV-1a).
 * The same name always yields the same id within and across runs.
 */
Smud_ShaderId smud_shader_id_from_name(const char *name);

/**
 * Generate an identity that no other call returns during this process.
 * Used for shaders built from inline source that have no stable name.
 */
Smud_ShaderId smud_shader_id_generate(void);

bool smud_shader_id_equals(Smud_ShaderId a, Smud_ShaderId b);
bool smud_shader_id_is_none(Smud_ShaderId id);

/** Total order: negative, zero or positive like strcmp. */
int smud_shader_id_compare(Smud_ShaderId a, Smud_ShaderId b);

/**
 * Lexicographic order over (sdf, fill) pairs.
 */
int smud_shader_pair_compare(Smud_ShaderId sdf_a, Smud_ShaderId fill_a,
                             Smud_ShaderId sdf_b, Smud_ShaderId fill_b);

/* ============================================================================
 * Color
 * ============================================================================ */

/**
 * RGBA in sRGB space, components 0.0-1.0.
 * Converted to linear when packed for the GPU.
 */
typedef struct Smud_Color {
    float r, g, b, a;
} Smud_Color;

#define SMUD_COLOR_PINK  { 1.0f, 0.752941f, 0.796078f, 1.0f }
#define SMUD_COLOR_WHITE { 1.0f, 1.0f, 1.0f, 1.0f }

Smud_Color smud_color_rgb(float r, float g, float b);
Smud_Color smud_color_rgba(float r, float g, float b, float a);

/**
 * Convert to linear RGB (alpha is passed through).
 *
 * @param out Receives r, g, b, a
 */
void smud_color_to_linear(Smud_Color color, float out[4]);

/* ============================================================================
 * Frame
 * ============================================================================ */

typedef enum Smud_FrameKind {
    SMUD_FRAME_QUAD = 0     /* Axis-aligned square, +-half_size on both axes */
} Smud_FrameKind;

/**
 * Local bounding geometry. Sizes the drawn quad and is the default picking
 * hit region.
 */
typedef struct Smud_Frame {
    Smud_FrameKind kind;
    union {
        struct {
            float half_size;
        } quad;
    };
} Smud_Frame;

Smud_Frame smud_frame_quad(float half_size);

/** Largest distance from the origin to the frame edge along an axis. */
float smud_frame_half_extent(Smud_Frame frame);

/**
 * Test a local-space point against the frame. Edges are inside.
 */
bool smud_frame_contains(Smud_Frame frame, float x, float y);

/* ============================================================================
 * Blend Mode
 * ============================================================================ */

typedef enum Smud_BlendMode {
    SMUD_BLEND_ALPHA = 0,     /* Straight alpha over the target */
    SMUD_BLEND_ADDITIVE = 1   /* Color added to the target; for glows */
} Smud_BlendMode;

/* ============================================================================
 * Shape Component
 * ============================================================================ */

typedef struct C_SmudShape {
    Smud_Color color;
    Smud_ShaderId sdf;
    Smud_ShaderId fill;
    Smud_Frame frame;
    float params[4];            /* Passed to both shaders uninterpreted */
    Smud_BlendMode blend_mode;
} C_SmudShape;

extern ECS_COMPONENT_DECLARE(C_SmudShape);

/**
 * Build a shape with the defaults: pink, default fill, zero params,
 * alpha blending.
 */
C_SmudShape smud_shape_create(Smud_ShaderId sdf, float half_size);

void smud_shape_with_color(C_SmudShape *shape, Smud_Color color);
void smud_shape_with_fill(C_SmudShape *shape, Smud_ShaderId fill);
void smud_shape_with_frame(C_SmudShape *shape, Smud_Frame frame);
void smud_shape_with_params(C_SmudShape *shape, float p0, float p1, float p2, float p3);
void smud_shape_with_blend_mode(C_SmudShape *shape, Smud_BlendMode mode);

/** Register C_SmudShape. */
void smud_shape_register(ecs_world_t *world);
void smud_shape_register_world(Smud_World *world);

#ifdef __cplusplus
}
#endif

#endif /* SMUD_SHAPE_H */
