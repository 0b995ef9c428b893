// Unit tests for the sphere-vs-static-box physics world
#include <catch2/catch.hpp>

#include <Physics/PhysicsSystem.hpp>
#include <raymath.h>
#include <cmath>

using namespace MarbleRun::Physics;

namespace {

// 10 x 1 x 10 slab whose top face is the y = 0 plane.
StaticBoxDesc GroundSlab()
{
    StaticBoxDesc ground;
    ground.position = { 0.0f, -0.5f, 0.0f };
    ground.extents  = { 10.0f, 1.0f, 10.0f };
    return ground;
}

void RunFrames(PhysicsWorld& world, int frames, float dt = 1.0f / 60.0f)
{
    for (int i = 0; i < frames; ++i) world.Step(dt);
}

} // namespace

TEST_CASE("Degenerate bodies and colliders are rejected", "[physics]") {
    PhysicsWorld world;

    StaticBoxDesc flat = GroundSlab();
    flat.extents.y = 0.0f;
    CHECK(world.RegisterStaticBox(flat) == -1);

    SphereBodyDesc sphere;
    sphere.radius = 0.0f;
    CHECK(world.AddSphereBody(sphere) == -1);
    sphere.radius  = 0.5f;
    sphere.density = -1.0f;
    CHECK(world.AddSphereBody(sphere) == -1);

    CHECK(world.StaticCount() == 0);
    CHECK(world.BodyCount() == 0);
}

TEST_CASE("Handles are unique and lookups fail once removed", "[physics]") {
    PhysicsWorld world;
    int ground = world.RegisterStaticBox(GroundSlab());
    int a = world.AddSphereBody(SphereBodyDesc{});
    int b = world.AddSphereBody(SphereBodyDesc{});
    REQUIRE(ground > 0);
    REQUIRE(a > 0);
    REQUIRE(b > 0);
    CHECK(a != b);
    CHECK(a != ground);

    const PhysicsWorld& view = world;
    REQUIRE(view.GetBody(a) != nullptr);
    CHECK(view.GetBody(a)->handle == a);

    world.RemoveBody(a);
    CHECK(world.GetBody(a) == nullptr);
    CHECK(world.GetBody(b) != nullptr);
    CHECK(world.BodyCount() == 1);

    world.UnregisterStatic(ground);
    CHECK(world.StaticCount() == 0);
    CHECK(world.GetBody(12345) == nullptr);
}

TEST_CASE("Sphere mass and inertia follow radius and density", "[physics]") {
    PhysicsWorld world;
    SphereBodyDesc desc;
    desc.radius  = 0.5f;
    desc.density = 2.0f;
    int h = world.AddSphereBody(desc);
    REQUIRE(h > 0);

    const RigidBody* body = world.GetBody(h);
    REQUIRE(body != nullptr);
    const float expected = 2.0f * (4.0f / 3.0f) * PI * 0.125f;
    CHECK(body->mass == Approx(expected));
    CHECK(body->inertia == Approx(0.4f * expected * 0.25f));
}

TEST_CASE("Material coefficients combine as the mean", "[physics]") {
    CHECK(CombineCoefficient(0.5f, 0.7f) == Approx(0.6f));
    CHECK(CombineCoefficient(0.0f, 1.0f) == Approx(0.5f));
    CHECK(CombineCoefficient(0.3f, 0.3f) == Approx(0.3f));
}

TEST_CASE("Sweep reports the first surface hit", "[physics]") {
    PhysicsWorld world;
    int ground = world.RegisterStaticBox(GroundSlab());
    REQUIRE(ground > 0);

    SweepResult hit = world.SweepSphere({ 0.0f, 3.0f, 0.0f }, { 0.0f, -3.0f, 0.0f }, 0.5f);
    REQUIRE(hit);
    CHECK(hit.handle == ground);
    CHECK(hit.pos.y == Approx(0.5f).margin(1e-4));
    CHECK(hit.t == Approx(2.5f / 6.0f).margin(1e-4));
    CHECK(hit.normal.y == Approx(1.0f).margin(1e-4));
}

TEST_CASE("Sweep misses geometry off the path", "[physics]") {
    PhysicsWorld world;
    REQUIRE(world.RegisterStaticBox(GroundSlab()) > 0);

    SECTION("beside the slab") {
        CHECK_FALSE(world.SweepSphere({ 20.0f, 3.0f, 0.0f }, { 20.0f, -3.0f, 0.0f }, 0.5f));
    }
    SECTION("above the slab") {
        CHECK_FALSE(world.SweepSphere({ -20.0f, 2.0f, 0.0f }, { 20.0f, 2.0f, 0.0f }, 0.5f));
    }
    SECTION("stopping short") {
        CHECK_FALSE(world.SweepSphere({ 0.0f, 3.0f, 0.0f }, { 0.0f, 1.0f, 0.0f }, 0.5f));
    }
    SECTION("empty world") {
        PhysicsWorld empty;
        SweepResult r = empty.SweepSphere({ 0.0f, 3.0f, 0.0f }, { 0.0f, -3.0f, 0.0f }, 0.5f);
        CHECK_FALSE(r);
        CHECK(r.handle == -1);
    }
}

TEST_CASE("Contact query measures penetration depth", "[physics]") {
    PhysicsWorld world;
    int ground = world.RegisterStaticBox(GroundSlab());
    REQUIRE(ground > 0);

    Contact c = world.FindContact(ground, { 1.0f, 0.4f, 2.0f }, 0.5f);
    REQUIRE(c);
    CHECK(c.depth == Approx(0.1f).margin(1e-4));
    CHECK(c.normal.y == Approx(1.0f).margin(1e-4));

    CHECK_FALSE(world.FindContact(ground, { 1.0f, 0.505f, 2.0f }, 0.5f));
    CHECK(world.FindContact(ground, { 1.0f, 0.505f, 2.0f }, 0.5f, 0.01f));
    CHECK_FALSE(world.FindContact(ground + 100, { 1.0f, 0.4f, 2.0f }, 0.5f));
}

TEST_CASE("A dropped sphere comes to rest on a flat box", "[physics]") {
    PhysicsWorld world;
    REQUIRE(world.RegisterStaticBox(GroundSlab()) > 0);

    SphereBodyDesc desc;
    desc.position = { 0.0f, 2.0f, 0.0f };
    int h = world.AddSphereBody(desc);
    REQUIRE(h > 0);

    RunFrames(world, 180);

    const RigidBody* body = world.GetBody(h);
    REQUIRE(body != nullptr);
    CHECK(body->position.y == Approx(0.5f).margin(0.02));
    CHECK(std::fabs(body->linearVelocity.y) < 0.05f);
    CHECK(body->position.x == Approx(0.0f).margin(1e-4));
    CHECK(body->position.z == Approx(0.0f).margin(1e-4));
}

TEST_CASE("Removing the floor lets the sphere fall", "[physics]") {
    PhysicsWorld world;
    int ground = world.RegisterStaticBox(GroundSlab());
    SphereBodyDesc desc;
    desc.position = { 0.0f, 0.6f, 0.0f };
    int h = world.AddSphereBody(desc);
    REQUIRE(h > 0);

    RunFrames(world, 30);
    CHECK(world.GetBody(h)->position.y > 0.45f);

    world.UnregisterStatic(ground);
    RunFrames(world, 30);
    CHECK(world.GetBody(h)->position.y < 0.0f);
}

TEST_CASE("Bouncy materials rebound, dead ones do not", "[physics]") {
    PhysicsWorld world;
    StaticBoxDesc ground = GroundSlab();
    ground.restitution = 1.0f;
    REQUIRE(world.RegisterStaticBox(ground) > 0);

    SphereBodyDesc desc;
    desc.position    = { 0.0f, 2.0f, 0.0f };
    desc.restitution = 1.0f;
    int bouncy = world.AddSphereBody(desc);
    desc.position.x  = 3.0f;
    desc.restitution = 0.0f;
    int dead = world.AddSphereBody(desc);
    REQUIRE(bouncy > 0);
    REQUIRE(dead > 0);

    // Mean restitution: 1.0 for the bouncy ball, 0.5 for the other.
    float bestBounce = 0.0f;
    for (int i = 0; i < 60; ++i) {
        world.Step(1.0f / 60.0f);
        bestBounce = fmaxf(bestBounce, world.GetBody(bouncy)->linearVelocity.y);
    }
    CHECK(bestBounce > 3.0f);
    CHECK(world.GetBody(dead)->position.y < 2.0f);
}

TEST_CASE("Slow contacts do not bounce even when bouncy", "[physics]") {
    PhysicsWorld world;
    StaticBoxDesc ground = GroundSlab();
    ground.restitution = 1.0f;
    REQUIRE(world.RegisterStaticBox(ground) > 0);

    SphereBodyDesc desc;
    desc.position    = { 0.0f, 0.502f, 0.0f };
    desc.restitution = 1.0f;
    int h = world.AddSphereBody(desc);
    REQUIRE(h > 0);

    float highest = -1.0f;
    for (int i = 0; i < 30; ++i) {
        world.Step(1.0f / 60.0f);
        highest = fmaxf(highest, world.GetBody(h)->linearVelocity.y);
    }
    CHECK(highest < 0.01f);
    CHECK(world.GetBody(h)->position.y == Approx(0.5f).margin(0.02));
}

TEST_CASE("A sphere on a slope rolls downhill", "[physics]") {
    PhysicsWorld world;
    const float slope = 10.0f * DEG2RAD;

    StaticBoxDesc ramp;
    ramp.rotation = QuaternionFromAxisAngle({ 1.0f, 0.0f, 0.0f }, slope);
    ramp.extents  = { 20.0f, 1.0f, 40.0f };
    ramp.friction = 0.5f;
    REQUIRE(world.RegisterStaticBox(ramp) > 0);

    Vector3 up = Vector3RotateByQuaternion({ 0.0f, 1.0f, 0.0f }, ramp.rotation);
    SphereBodyDesc desc;
    desc.position = Vector3Scale(up, 1.005f);
    int h = world.AddSphereBody(desc);
    REQUIRE(h > 0);

    RunFrames(world, 60);

    const RigidBody* body = world.GetBody(h);
    REQUIRE(body != nullptr);
    CHECK(body->linearVelocity.z > 0.5f);
    CHECK(body->position.z > desc.position.z);
    CHECK(body->angularVelocity.x > 0.0f);
    CHECK(std::fabs(body->rotation.w) < 1.0f);

    // Friction keeps it close to rolling without slipping.
    float speed = Vector3Length(body->linearVelocity);
    CHECK(body->angularVelocity.x * body->radius == Approx(speed).epsilon(0.1));
}

TEST_CASE("Variable stepping clamps long frames", "[physics]") {
    WorldParams params;
    params.mode    = StepMode::Variable;
    params.maxStep = 1.0f / 60.0f;
    PhysicsWorld world(params);

    int h = world.AddSphereBody(SphereBodyDesc{});
    REQUIRE(h > 0);

    CHECK(world.Step(1.0f) == 1);
    CHECK(world.GetBody(h)->linearVelocity.y == Approx(-9.81f / 60.0f));

    CHECK(world.Step(0.0f) == 0);
    CHECK(world.Step(-1.0f) == 0);
    CHECK(world.GetBody(h)->linearVelocity.y == Approx(-9.81f / 60.0f));
}

TEST_CASE("Time scale slows the simulation", "[physics]") {
    WorldParams params;
    params.timeScale = 0.5f;
    PhysicsWorld world(params);
    int h = world.AddSphereBody(SphereBodyDesc{});
    REQUIRE(h > 0);

    world.Step(1.0f / 60.0f);
    CHECK(world.GetBody(h)->linearVelocity.y == Approx(-9.81f / 120.0f));
}

TEST_CASE("Fixed stepping consumes whole steps from an accumulator", "[physics]") {
    WorldParams params;
    params.mode    = StepMode::Fixed;
    params.maxStep = 0.25f;
    PhysicsWorld world(params);
    int h = world.AddSphereBody(SphereBodyDesc{});
    REQUIRE(h > 0);

    CHECK(world.Step(0.625f) == 2);
    CHECK(world.GetBody(h)->linearVelocity.y == Approx(-9.81f * 0.5f));

    // 0.125 left over plus 0.125 makes one more step.
    CHECK(world.Step(0.125f) == 1);
    CHECK(world.Step(0.125f) == 0);
    CHECK(world.Step(0.0f) == 0);
}

TEST_CASE("Fixed stepping caps catch-up work per frame", "[physics]") {
    WorldParams params;
    params.mode    = StepMode::Fixed;
    params.maxStep = 0.25f;
    PhysicsWorld world(params);

    CHECK(world.Step(10.0f) == 8);
    // The backlog was dropped, not carried.
    CHECK(world.Step(0.125f) == 0);
}

TEST_CASE("Substep count is at least one", "[physics]") {
    WorldParams params;
    params.substeps = 0;
    PhysicsWorld world(params);
    CHECK(world.Params().substeps == 1);

    int h = world.AddSphereBody(SphereBodyDesc{});
    world.Step(1.0f / 60.0f);
    CHECK(world.GetBody(h)->linearVelocity.y == Approx(-9.81f / 60.0f));
}

TEST_CASE("Raycast finds the nearest static surface", "[physics]") {
    PhysicsWorld world;
    int ground = world.RegisterStaticBox(GroundSlab());
    StaticBoxDesc shelf;
    shelf.position = { 0.0f, 2.0f, 0.0f };
    shelf.extents  = { 1.0f, 0.2f, 1.0f };
    int upper = world.RegisterStaticBox(shelf);
    REQUIRE(ground > 0);
    REQUIRE(upper > 0);

    RaycastResult hit = world.Raycast({ 0.2f, 5.0f, 0.1f }, { 0.0f, -4.0f, 0.0f });
    REQUIRE(hit);
    CHECK(hit.handle == upper);
    CHECK(hit.pos.y == Approx(2.1f).margin(1e-4));
    CHECK(hit.t == Approx(2.9f).margin(1e-4));
    CHECK(hit.normal.y == Approx(1.0f).margin(1e-4));

    RaycastResult beside = world.Raycast({ 3.0f, 5.0f, 3.0f }, { 0.0f, -1.0f, 0.0f });
    REQUIRE(beside);
    CHECK(beside.handle == ground);
    CHECK(beside.pos.y == Approx(0.0f).margin(1e-4));
}

TEST_CASE("Raycast respects direction and range", "[physics]") {
    PhysicsWorld world;
    REQUIRE(world.RegisterStaticBox(GroundSlab()) > 0);

    CHECK_FALSE(world.Raycast({ 0.0f, 5.0f, 0.0f }, { 0.0f, 1.0f, 0.0f }));
    CHECK_FALSE(world.Raycast({ 0.0f, 5.0f, 0.0f }, { 0.0f, -1.0f, 0.0f }, 4.0f));
    CHECK(world.Raycast({ 0.0f, 5.0f, 0.0f }, { 0.0f, -1.0f, 0.0f }, 6.0f));
    CHECK_FALSE(world.Raycast({ 0.0f, 5.0f, 0.0f }, { 0.0f, 0.0f, 0.0f }));
}
