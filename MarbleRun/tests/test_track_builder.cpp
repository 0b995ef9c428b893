// Unit tests for the track geometry builder
#include <catch2/catch.hpp>

#include <Track/TrackBuilder.hpp>
#include <Physics/PhysicsSystem.hpp>
#include <raymath.h>
#include <cmath>

using namespace MarbleRun;

static bool SameRotation(Quaternion a, Quaternion b)
{
    return a.x == b.x && a.y == b.y && a.z == b.z && a.w == b.w;
}

TEST_CASE("Walls sit either side of the floor", "[track]") {
    TrackParams p;
    p.width = 8.0f;
    p.wallThickness = 0.2f;
    p.wallHeight = 1.0f;

    TrackGeometry t = BuildTrack(p);

    CHECK(t.leftWall.position.x  == Approx(-4.1f));
    CHECK(t.rightWall.position.x == Approx(4.1f));
    CHECK(t.leftWall.position.y  == Approx(0.5f));
    CHECK(t.rightWall.position.y == Approx(0.5f));
    CHECK(t.leftWall.position.z  == 0.0f);

    CHECK(t.floor.position.x == 0.0f);
    CHECK(t.floor.position.y == 0.0f);
    CHECK(t.floor.position.z == 0.0f);
}

TEST_CASE("Every segment shares the floor slope", "[track]") {
    TrackParams p;
    p.slopeDegrees = 12.0f;
    TrackGeometry t = BuildTrack(p);

    CHECK(SameRotation(t.leftWall.rotation, t.floor.rotation));
    CHECK(SameRotation(t.rightWall.rotation, t.floor.rotation));

    // Floor up vector tilts toward +z: the -z end is the high end.
    Vector3 up = Vector3RotateByQuaternion({ 0.0f, 1.0f, 0.0f }, t.floor.rotation);
    CHECK(up.y == Approx(cosf(12.0f * DEG2RAD)));
    CHECK(up.z == Approx(sinf(12.0f * DEG2RAD)));
    CHECK(up.x == Approx(0.0f).margin(1e-6));
}

TEST_CASE("Segment extents follow the parameters", "[track]") {
    TrackParams p;
    p.width = 6.0f; p.depth = 30.0f; p.floorThickness = 0.3f;
    p.wallHeight = 2.0f; p.wallThickness = 0.4f;
    TrackGeometry t = BuildTrack(p);

    CHECK(t.floor.extents.x == 6.0f);
    CHECK(t.floor.extents.y == 0.3f);
    CHECK(t.floor.extents.z == 30.0f);
    CHECK(t.leftWall.extents.x == 0.4f);
    CHECK(t.leftWall.extents.y == 2.0f);
    CHECK(t.leftWall.extents.z == 30.0f);
    CHECK(t.rightWall.extents.x == t.leftWall.extents.x);
    CHECK(t.leftWall.position.x == Approx(-3.2f));
}

TEST_CASE("Floor carries friction, walls only when set", "[track]") {
    TrackParams p;
    p.floorFriction = 0.9f;
    TrackGeometry t = BuildTrack(p);
    REQUIRE(t.floor.friction.has_value());
    CHECK(*t.floor.friction == 0.9f);
    CHECK_FALSE(t.leftWall.friction.has_value());
    CHECK_FALSE(t.rightWall.friction.has_value());

    p.wallFriction = 0.1f;
    t = BuildTrack(p);
    REQUIRE(t.rightWall.friction.has_value());
    CHECK(*t.rightWall.friction == 0.1f);
}

TEST_CASE("RegisterTrack creates three static colliders", "[track][physics]") {
    Physics::PhysicsWorld physics;
    TrackGeometry t = BuildTrack(TrackParams{});

    REQUIRE(RegisterTrack(physics, t));
    CHECK(physics.StaticCount() == 3);
    CHECK(t.floor.collider > 0);
    CHECK(t.leftWall.collider > 0);
    CHECK(t.rightWall.collider > 0);
    CHECK(t.floor.collider != t.leftWall.collider);
    CHECK(t.leftWall.collider != t.rightWall.collider);
}

TEST_CASE("Floor surface height matches the registered collider", "[track][physics]") {
    TrackParams p;
    Physics::PhysicsWorld physics;
    TrackGeometry t = BuildTrack(p);
    REQUIRE(RegisterTrack(physics, t));

    const float z = -8.0f;
    const float surface = FloorSurfaceHeight(p, z);
    CHECK(surface > FloorSurfaceHeight(p, 0.0f));

    // A sphere resting on the surface, measured along the slope normal.
    Vector3 up = Vector3RotateByQuaternion({ 0.0f, 1.0f, 0.0f }, t.floor.rotation);
    Vector3 onSurface = { 0.0f, surface, z };
    Vector3 center = Vector3Add(onSurface, Vector3Scale(up, 0.5f));

    Physics::Contact c = physics.FindContact(t.floor.collider, center, 0.5f, 0.01f);
    REQUIRE(c);
    CHECK(c.depth == Approx(0.0f).margin(1e-3));
    CHECK(c.normal.y == Approx(up.y).margin(1e-4));
    CHECK(c.normal.z == Approx(up.z).margin(1e-4));
}

TEST_CASE("Flat track surface is half the floor thickness", "[track]") {
    TrackParams p;
    p.slopeDegrees = 0.0f;
    p.floorThickness = 0.4f;
    CHECK(FloorSurfaceHeight(p, -5.0f) == Approx(0.2f));
    CHECK(FloorSurfaceHeight(p, 5.0f) == Approx(0.2f));
}
