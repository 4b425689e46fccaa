#include <catch2/catch_test_macros.hpp>

#include "tracking/stability.hpp"

TEST_CASE("GeometryDebouncer", "[tracking]") {
    const Geometry a{100, 100, 500, 400};
    const Geometry b{200, 100, 500, 400};

    SECTION("ReleasesAfterRequiredPolls") {
        GeometryDebouncer d(3);
        REQUIRE_FALSE(d.observe(a));
        REQUIRE_FALSE(d.observe(a));
        auto released = d.observe(a);
        REQUIRE(released);
        REQUIRE(*released == a);
        REQUIRE(d.stable_count() == 3);
    }

    SECTION("ChangeResetsCounter") {
        GeometryDebouncer d(3);
        d.observe(a);
        d.observe(a);
        REQUIRE_FALSE(d.observe(b));
        REQUIRE(d.stable_count() == 1);
        REQUIRE_FALSE(d.observe(b));
        REQUIRE(d.observe(b) == b);
    }

    SECTION("ReleasedOnlyOnce") {
        GeometryDebouncer d(3);
        for (int i = 0; i < 3; i++) d.observe(a);
        for (int i = 0; i < 10; i++) REQUIRE_FALSE(d.observe(a));
        REQUIRE(d.last_docked() == a);
    }

    SECTION("ReturningToDockedGeometryDoesNotRelease") {
        GeometryDebouncer d(3);
        for (int i = 0; i < 3; i++) d.observe(a);
        d.observe(b);
        for (int i = 0; i < 5; i++) REQUIRE_FALSE(d.observe(a));
    }

    SECTION("NewGeometryReleasedAfterOld") {
        GeometryDebouncer d(3);
        for (int i = 0; i < 3; i++) d.observe(a);
        d.observe(b);
        d.observe(b);
        REQUIRE(d.observe(b) == b);
        REQUIRE(d.last_docked() == b);
    }

    SECTION("AbsentGeometryCountsButNeverReleases") {
        GeometryDebouncer d(3);
        for (int i = 0; i < 5; i++) REQUIRE_FALSE(d.observe(std::nullopt));
        REQUIRE(d.stable_count() == 5);
    }

    SECTION("InvalidGeometryNeverReleases") {
        GeometryDebouncer d(3);
        for (int i = 0; i < 5; i++) REQUIRE_FALSE(d.observe(Geometry{10, 10, 0, 0}));
    }

    SECTION("AbsentBreaksStreak") {
        GeometryDebouncer d(3);
        d.observe(a);
        d.observe(a);
        d.observe(std::nullopt);
        REQUIRE(d.stable_count() == 1);
        REQUIRE_FALSE(d.observe(a));
    }

    SECTION("ResetForgetsDockedGeometry") {
        GeometryDebouncer d(3);
        for (int i = 0; i < 3; i++) d.observe(a);
        d.reset();
        REQUIRE(d.stable_count() == 0);
        REQUIRE_FALSE(d.last_docked());
        d.observe(a);
        d.observe(a);
        REQUIRE(d.observe(a) == a);
    }

    SECTION("SinglePollReleasesImmediately") {
        GeometryDebouncer d(1);
        REQUIRE(d.observe(a) == a);
        REQUIRE(d.observe(b) == b);
    }
}
