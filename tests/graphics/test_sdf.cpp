/*
 * Smud - CPU Signed Distance Function Tests
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "smud/sdf.h"
#include <cmath>

using Catch::Approx;

/* ============================================================================
 * Primitives
 * ============================================================================ */

TEST_CASE("Circle distance", "[sdf]") {
    REQUIRE(smud_sdf_circle(0.0f, 0.0f, 1.0f) == Approx(-1.0f));
    REQUIRE(smud_sdf_circle(1.0f, 0.0f, 1.0f) == Approx(0.0f).margin(1e-6));
    REQUIRE(smud_sdf_circle(0.0f, 3.0f, 1.0f) == Approx(2.0f));
}

TEST_CASE("Box distance", "[sdf]") {
    REQUIRE(smud_sdf_box(0.0f, 0.0f, 1.0f, 2.0f) == Approx(-1.0f));
    REQUIRE(smud_sdf_box(2.0f, 0.0f, 1.0f, 1.0f) == Approx(1.0f));

    SECTION("Corner distance is Euclidean") {
        REQUIRE(smud_sdf_box(2.0f, 2.0f, 1.0f, 1.0f) == Approx(std::sqrt(2.0f)));
    }

    SECTION("Rounded box keeps its extent on the axes") {
        REQUIRE(smud_sdf_rounded_box(2.0f, 0.0f, 1.0f, 1.0f, 0.25f) == Approx(1.0f));
        REQUIRE(smud_sdf_rounded_box(1.0f, 0.0f, 1.0f, 1.0f, 0.25f) == Approx(0.0f).margin(1e-6));
    }
}

TEST_CASE("Segment distance", "[sdf]") {
    REQUIRE(smud_sdf_segment(0.0f, 1.0f, -1.0f, 0.0f, 1.0f, 0.0f) == Approx(1.0f));
    REQUIRE(smud_sdf_segment(3.0f, 0.0f, -1.0f, 0.0f, 1.0f, 0.0f) == Approx(2.0f));

    SECTION("Degenerate segment is a point") {
        REQUIRE(smud_sdf_segment(3.0f, 4.0f, 0.0f, 0.0f, 0.0f, 0.0f) == Approx(5.0f));
    }
}

TEST_CASE("Rhombus distance", "[sdf]") {
    /* Edge line x + 2y = 1 */
    REQUIRE(smud_sdf_rhombus(0.0f, 0.0f, 1.0f, 0.5f) == Approx(-1.0f / std::sqrt(5.0f)).margin(1e-5));
    REQUIRE(smud_sdf_rhombus(1.0f, 0.0f, 1.0f, 0.5f) == Approx(0.0f).margin(1e-5));
    REQUIRE(smud_sdf_rhombus(2.0f, 0.0f, 1.0f, 0.5f) > 0.0f);
}

TEST_CASE("Regular polygons use the inradius", "[sdf]") {
    REQUIRE(smud_sdf_equilateral_triangle(0.0f, 0.0f, 1.0f) == Approx(-1.0f / std::sqrt(3.0f)).margin(1e-5));
    REQUIRE(smud_sdf_pentagon(0.0f, 0.0f, 1.0f) == Approx(-1.0f).margin(1e-5));
    REQUIRE(smud_sdf_hexagon(0.0f, 0.0f, 1.0f) == Approx(-1.0f).margin(1e-5));
    REQUIRE(smud_sdf_octagon(0.0f, 0.0f, 1.0f) == Approx(-1.0f).margin(1e-5));

    SECTION("Flat top side") {
        REQUIRE(smud_sdf_pentagon(0.0f, 1.0f, 1.0f) == Approx(0.0f).margin(1e-5));
        REQUIRE(smud_sdf_hexagon(0.0f, 1.0f, 1.0f) == Approx(0.0f).margin(1e-5));
        REQUIRE(smud_sdf_octagon(0.0f, 1.0f, 1.0f) == Approx(0.0f).margin(1e-5));
    }

    SECTION("Far away is outside") {
        REQUIRE(smud_sdf_equilateral_triangle(0.0f, 5.0f, 1.0f) > 0.0f);
        REQUIRE(smud_sdf_hexagon(5.0f, 5.0f, 1.0f) > 0.0f);
    }
}

TEST_CASE("Star distance", "[sdf]") {
    REQUIRE(smud_sdf_star5(0.0f, 0.0f, 1.0f, 0.4f) == Approx(-0.4f).margin(1e-4));
    REQUIRE(smud_sdf_star5(0.0f, 5.0f, 1.0f, 0.4f) == Approx(4.0f).margin(1e-4));
}

TEST_CASE("Pie and arc open around +Y", "[sdf]") {
    const float aperture = 0.785398163f;

    REQUIRE(smud_sdf_pie(0.0f, 0.5f, aperture, 1.0f) < 0.0f);
    REQUIRE(smud_sdf_pie(0.0f, -0.5f, aperture, 1.0f) == Approx(0.5f).margin(1e-5));
    REQUIRE(smud_sdf_pie(0.0f, 2.0f, aperture, 1.0f) == Approx(1.0f).margin(1e-5));

    REQUIRE(smud_sdf_arc(0.0f, 1.0f, aperture, 1.0f, 0.1f) == Approx(-0.1f).margin(1e-5));
    REQUIRE(smud_sdf_arc(0.0f, 0.0f, aperture, 1.0f, 0.1f) == Approx(0.9f).margin(1e-5));
}

TEST_CASE("Curved shapes contain their center", "[sdf]") {
    REQUIRE(smud_sdf_vesica(0.0f, 0.0f, 1.0f, 0.5f) == Approx(-0.5f).margin(1e-5));
    REQUIRE(smud_sdf_egg(0.0f, 0.0f, 1.0f, 0.5f) < 0.0f);
    REQUIRE(smud_sdf_heart(0.0f, 0.5f, 1.0f) < 0.0f);
    REQUIRE(smud_sdf_heart(0.0f, 3.0f, 1.0f) > 0.0f);

    SECTION("Heart scales linearly") {
        float unit = smud_sdf_heart(0.3f, 0.9f, 1.0f);
        float doubled = smud_sdf_heart(0.6f, 1.8f, 2.0f);
        REQUIRE(doubled == Approx(unit * 2.0f).margin(1e-5));
    }

    SECTION("Zero-size heart is a point") {
        REQUIRE(smud_sdf_heart(3.0f, 4.0f, 0.0f) == Approx(5.0f));
    }
}

TEST_CASE("Cross and rounded X", "[sdf]") {
    REQUIRE(smud_sdf_cross(0.0f, 0.0f, 1.0f, 0.3f, 0.0f) < 0.0f);
    REQUIRE(smud_sdf_cross(0.9f, 0.9f, 1.0f, 0.3f, 0.0f) == Approx(0.6f).margin(1e-5));
    REQUIRE(smud_sdf_rounded_x(0.0f, 0.0f, 1.0f, 0.1f) == Approx(-0.1f).margin(1e-5));
}

/* ============================================================================
 * Operators
 * ============================================================================ */

TEST_CASE("Boolean operators", "[sdf][ops]") {
    REQUIRE(smud_sdf_union(-1.0f, 2.0f) == -1.0f);
    REQUIRE(smud_sdf_intersect(-1.0f, 2.0f) == 2.0f);
    REQUIRE(smud_sdf_subtract(-1.0f, -0.5f) == 0.5f);
    REQUIRE(smud_sdf_subtract(-1.0f, 3.0f) == -1.0f);
}

TEST_CASE("Smooth union", "[sdf][ops]") {
    SECTION("Blends below the plain minimum") {
        REQUIRE(smud_sdf_smooth_union(1.0f, 1.0f, 0.5f) == Approx(0.875f));
    }

    SECTION("Far apart distances are untouched") {
        REQUIRE(smud_sdf_smooth_union(0.0f, 5.0f, 0.5f) == Approx(0.0f));
    }

    SECTION("Non-positive k is a plain union") {
        REQUIRE(smud_sdf_smooth_union(0.3f, 0.2f, 0.0f) == Approx(0.2f));
    }
}

TEST_CASE("Round and annular", "[sdf][ops]") {
    float d = smud_sdf_circle(0.0f, 0.0f, 1.0f);
    REQUIRE(smud_sdf_round(d, 0.5f) == Approx(-1.5f));
    REQUIRE(smud_sdf_annular(d, 0.25f) == Approx(0.75f));
    REQUIRE(smud_sdf_annular(smud_sdf_circle(1.0f, 0.0f, 1.0f), 0.25f) == Approx(-0.25f));
}
