#include "smud/sdf.h"
#include <math.h>

/* ============================================================================
 * Helpers
 * ============================================================================ */

static float clampf(float v, float lo, float hi) {
    return v < lo ? lo : (v > hi ? hi : v);
}

static float signf(float v) {
    return (v > 0.0f) ? 1.0f : ((v < 0.0f) ? -1.0f : 0.0f);
}

static float length2(float x, float y) {
    return sqrtf(x * x + y * y);
}

static float dot2(float ax, float ay, float bx, float by) {
    return ax * bx + ay * by;
}

/* Reflect p across the line through the origin with normal (kx, ky) when on
 * the negative side. */
static void fold_min(float *px, float *py, float kx, float ky) {
    float d = 2.0f * fminf(dot2(kx, ky, *px, *py), 0.0f);
    *px -= d * kx;
    *py -= d * ky;
}

/* ============================================================================
 * Primitives
 * ============================================================================ */

float smud_sdf_circle(float x, float y, float radius) {
    return length2(x, y) - radius;
}

float smud_sdf_box(float x, float y, float hx, float hy) {
    float dx = fabsf(x) - hx;
    float dy = fabsf(y) - hy;
    float outside = length2(fmaxf(dx, 0.0f), fmaxf(dy, 0.0f));
    float inside = fminf(fmaxf(dx, dy), 0.0f);
    return outside + inside;
}

float smud_sdf_rounded_box(float x, float y, float hx, float hy, float radius) {
    return smud_sdf_box(x, y, hx - radius, hy - radius) - radius;
}

float smud_sdf_segment(float x, float y, float ax, float ay, float bx, float by) {
    float pax = x - ax, pay = y - ay;
    float bax = bx - ax, bay = by - ay;
    float len_sq = dot2(bax, bay, bax, bay);
    if (len_sq <= 0.0f) return length2(pax, pay);

    float h = clampf(dot2(pax, pay, bax, bay) / len_sq, 0.0f, 1.0f);
    return length2(pax - bax * h, pay - bay * h);
}

float smud_sdf_rhombus(float x, float y, float hx, float hy) {
    float px = fabsf(x), py = fabsf(y);
    float qx = hx - 2.0f * px;
    float qy = hy - 2.0f * py;
    float h = clampf((qx * hx - qy * hy) / dot2(hx, hy, hx, hy), -1.0f, 1.0f);
    float d = length2(px - 0.5f * hx * (1.0f - h), py - 0.5f * hy * (1.0f + h));
    return d * signf(px * hy + py * hx - hx * hy);
}

float smud_sdf_equilateral_triangle(float x, float y, float r) {
    const float k = sqrtf(3.0f);
    float px = fabsf(x) - r;
    float py = y + r / k;
    if (px + k * py > 0.0f) {
        float nx = (px - k * py) * 0.5f;
        float ny = (-k * px - py) * 0.5f;
        px = nx;
        py = ny;
    }
    px -= clampf(px, -2.0f * r, 0.0f);
    return -length2(px, py) * signf(py);
}

float smud_sdf_pentagon(float x, float y, float r) {
    const float kx = 0.809016994f, ky = 0.587785252f, kz = 0.726542528f;
    float px = fabsf(x), py = y;
    fold_min(&px, &py, -kx, ky);
    fold_min(&px, &py, kx, ky);
    px -= clampf(px, -r * kz, r * kz);
    py -= r;
    return length2(px, py) * signf(py);
}

float smud_sdf_hexagon(float x, float y, float r) {
    const float kx = -0.866025404f, ky = 0.5f, kz = 0.577350269f;
    float px = fabsf(x), py = fabsf(y);
    fold_min(&px, &py, kx, ky);
    px -= clampf(px, -kz * r, kz * r);
    py -= r;
    return length2(px, py) * signf(py);
}

float smud_sdf_octagon(float x, float y, float r) {
    const float kx = -0.9238795325f, ky = 0.3826834323f, kz = 0.4142135623f;
    float px = fabsf(x), py = fabsf(y);
    fold_min(&px, &py, kx, ky);
    fold_min(&px, &py, -kx, ky);
    px -= clampf(px, -kz * r, kz * r);
    py -= r;
    return length2(px, py) * signf(py);
}

float smud_sdf_star5(float x, float y, float r, float rf) {
    const float k1x = 0.809016994375f, k1y = -0.587785252292f;
    const float k2x = -k1x, k2y = k1y;
    float px = fabsf(x), py = y;

    float d1 = 2.0f * fmaxf(dot2(k1x, k1y, px, py), 0.0f);
    px -= d1 * k1x;
    py -= d1 * k1y;
    float d2 = 2.0f * fmaxf(dot2(k2x, k2y, px, py), 0.0f);
    px -= d2 * k2x;
    py -= d2 * k2y;

    px = fabsf(px);
    py -= r;

    float bax = rf * -k1y;
    float bay = rf * k1x - 1.0f;
    float h = clampf(dot2(px, py, bax, bay) / dot2(bax, bay, bax, bay), 0.0f, r);
    return length2(px - bax * h, py - bay * h) * signf(py * bax - px * bay);
}

float smud_sdf_pie(float x, float y, float aperture, float r) {
    float cx = sinf(aperture), cy = cosf(aperture);
    float px = fabsf(x), py = y;
    float l = length2(px, py) - r;
    float t = clampf(dot2(px, py, cx, cy), 0.0f, r);
    float m = length2(px - cx * t, py - cy * t);
    return fmaxf(l, m * signf(cy * px - cx * py));
}

float smud_sdf_arc(float x, float y, float aperture, float radius, float thickness) {
    float sx = sinf(aperture), sy = cosf(aperture);
    float px = fabsf(x), py = y;
    float d = (sy * px > sx * py)
        ? length2(px - sx * radius, py - sy * radius)
        : fabsf(length2(px, py) - radius);
    return d - thickness;
}

float smud_sdf_vesica(float x, float y, float r, float d) {
    float px = fabsf(x), py = fabsf(y);
    float b = sqrtf(fmaxf(r * r - d * d, 0.0f));
    if ((py - b) * d > px * b) {
        return length2(px, py - b);
    }
    return length2(px + d, py) - r;
}

float smud_sdf_egg(float x, float y, float ra, float rb) {
    const float k = sqrtf(3.0f);
    float px = fabsf(x), py = y;
    float r = ra - rb;
    float d;
    if (py < 0.0f) {
        d = length2(px, py) - r;
    } else if (k * (px + r) < py) {
        d = length2(px, py - k * r);
    } else {
        d = length2(px + r, py) - 2.0f * r;
    }
    return d - rb;
}

float smud_sdf_heart(float x, float y, float size) {
    if (size <= 0.0f) return length2(x, y);

    float px = fabsf(x) / size;
    float py = y / size;
    float d;
    if (py + px > 1.0f) {
        d = length2(px - 0.25f, py - 0.75f) - sqrtf(2.0f) / 4.0f;
    } else {
        float m = 0.5f * fmaxf(px + py, 0.0f);
        float a = dot2(px, py - 1.0f, px, py - 1.0f);
        float b = dot2(px - m, py - m, px - m, py - m);
        d = sqrtf(fminf(a, b)) * signf(px - py);
    }
    return d * size;
}

float smud_sdf_cross(float x, float y, float hx, float hy, float r) {
    float px = fabsf(x), py = fabsf(y);
    if (py > px) {
        float t = px;
        px = py;
        py = t;
    }
    float qx = px - hx, qy = py - hy;
    float k = fmaxf(qy, qx);
    float wx, wy;
    if (k > 0.0f) {
        wx = qx;
        wy = qy;
    } else {
        wx = hy - px;
        wy = -k;
    }
    return signf(k) * length2(fmaxf(wx, 0.0f), fmaxf(wy, 0.0f)) + r;
}

float smud_sdf_rounded_x(float x, float y, float w, float r) {
    float px = fabsf(x), py = fabsf(y);
    float s = fminf(px + py, w) * 0.5f;
    return length2(px - s, py - s) - r;
}

/* ============================================================================
 * Operators
 * ============================================================================ */

float smud_sdf_union(float a, float b) {
    return fminf(a, b);
}

float smud_sdf_subtract(float a, float b) {
    return fmaxf(a, -b);
}

float smud_sdf_intersect(float a, float b) {
    return fmaxf(a, b);
}

float smud_sdf_smooth_union(float a, float b, float k) {
    if (k <= 0.0f) return fminf(a, b);
    float h = clampf(0.5f + 0.5f * (b - a) / k, 0.0f, 1.0f);
    return b + (a - b) * h - k * h * (1.0f - h);
}

float smud_sdf_round(float d, float r) {
    return d - r;
}

float smud_sdf_annular(float d, float r) {
    return fabsf(d) - r;
}
