/**
 * Smud CPU Signed Distance Functions
 *
 * CPU versions of the distance functions the SDF shaders use, for exact
 * hit testing (see C_SmudPickingShape) and tooling. Every function takes a
 * point in the shape's local space and returns the signed distance to the
 * boundary: negative inside, zero on the edge, positive outside.
 *
 * Formulas follow the usual closed-form 2D distance functions; shapes are
 * centered on the origin unless stated otherwise.
 */

#ifndef SMUD_SDF_H
#define SMUD_SDF_H

#ifdef __cplusplus
extern "C" {
#endif

/* ============================================================================
 * Primitives
 * ============================================================================ */

float smud_sdf_circle(float x, float y, float radius);

/** Axis-aligned box with half-extents (hx, hy). */
float smud_sdf_box(float x, float y, float hx, float hy);

/** Box with all corners rounded by radius. The outer extent stays (hx, hy). */
float smud_sdf_rounded_box(float x, float y, float hx, float hy, float radius);

/** Line segment from (ax, ay) to (bx, by); unsigned. */
float smud_sdf_segment(float x, float y, float ax, float ay, float bx, float by);

/** Rhombus with half-diagonals (hx, hy). */
float smud_sdf_rhombus(float x, float y, float hx, float hy);

/** Equilateral triangle pointing up with half side length r. */
float smud_sdf_equilateral_triangle(float x, float y, float r);

/** Regular polygons with inradius r, flat side at the top. */
float smud_sdf_pentagon(float x, float y, float r);
float smud_sdf_hexagon(float x, float y, float r);
float smud_sdf_octagon(float x, float y, float r);

/**
 * Five-pointed star.
 *
 * @param r  Outer radius
 * @param rf Inner ratio (0.0-1.0); 0.4 gives a classic star
 */
float smud_sdf_star5(float x, float y, float r, float rf);

/**
 * Pie slice around +Y.
 *
 * @param aperture Half-angle in radians
 * @param r        Radius
 */
float smud_sdf_pie(float x, float y, float aperture, float r);

/**
 * Circular arc around +Y.
 *
 * @param aperture  Half-angle in radians
 * @param radius    Arc radius
 * @param thickness Half-thickness of the stroke
 */
float smud_sdf_arc(float x, float y, float aperture, float radius, float thickness);

/** Intersection of two circles of radius r whose centers are 2d apart. */
float smud_sdf_vesica(float x, float y, float r, float d);

/** Egg with bottom radius ra and top radius rb. */
float smud_sdf_egg(float x, float y, float ra, float rb);

/** Heart whose bottom tip is at the origin, height about 'size'. */
float smud_sdf_heart(float x, float y, float size);

/**
 * Plus-shaped cross.
 *
 * @param hx, hy Arm half-length and half-width
 * @param r      Corner rounding (negative rounds inward)
 */
float smud_sdf_cross(float x, float y, float hx, float hy, float r);

/** Rounded X with arm length w and stroke radius r. */
float smud_sdf_rounded_x(float x, float y, float w, float r);

/* ============================================================================
 * Operators
 * ============================================================================ */

float smud_sdf_union(float a, float b);

/** a with b cut out. */
float smud_sdf_subtract(float a, float b);

float smud_sdf_intersect(float a, float b);

/** Union blended over distance k. */
float smud_sdf_smooth_union(float a, float b, float k);

/** Grow the shape by r (rounds convex corners). */
float smud_sdf_round(float d, float r);

/** Turn the shape into a ring of half-thickness r around its edge. */
float smud_sdf_annular(float d, float r);

#ifdef __cplusplus
}
#endif

#endif /* SMUD_SDF_H */
