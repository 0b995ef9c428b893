#include <World/World.hpp>
#include <Camera/CameraRig.hpp>
#include <Control/MarbleController.hpp>
#include <Input/Input.hpp>
#include <raymath.h>

namespace MarbleRun {

World BootstrapWorld(const GameConfig& cfg)
{
    World world(cfg);

    world.track = BuildTrack(cfg.track);
    if (!RegisterTrack(world.physics, world.track))
        TraceLog(LOG_WARNING, "[World] Track registered with missing colliders");

    Physics::SphereBodyDesc marble;
    marble.position       = cfg.marble.start;
    marble.linearVelocity = cfg.marble.initialVelocity;
    marble.radius         = cfg.marble.radius;
    marble.density        = cfg.marble.density;
    marble.friction       = cfg.marble.friction;
    marble.restitution    = cfg.marble.restitution;

    int handle = world.physics.AddSphereBody(marble);
    if (handle > 0) {
        world.marble = handle;
        TraceLog(LOG_INFO, "[World] Marble spawned at (%.2f,%.2f,%.2f) handle=%d",
                 cfg.marble.start.x, cfg.marble.start.y, cfg.marble.start.z, handle);
    } else {
        TraceLog(LOG_ERROR, "[World] Marble could not be spawned");
    }

    world.camera = MakeTrailingCamera(cfg.marble.start, cfg.camera);
    TraceLog(LOG_INFO, "[World] Camera at (%.2f,%.2f,%.2f)",
             world.camera->position.x, world.camera->position.y, world.camera->position.z);

    return world;
}

bool RespawnMarble(World& world)
{
    if (!world.marble) return false;
    Physics::RigidBody* body = world.physics.GetBody(*world.marble);
    if (!body) return false;

    body->position        = world.config.marble.start;
    body->rotation        = QuaternionIdentity();
    body->linearVelocity  = world.config.marble.initialVelocity;
    body->angularVelocity = { 0.0f, 0.0f, 0.0f };
    TraceLog(LOG_INFO, "[World] Marble respawned");
    return true;
}

bool RespawnIfFallen(World& world)
{
    if (!world.marble) return false;
    const Physics::RigidBody* body = world.physics.GetBody(*world.marble);
    if (!body || body->position.y >= world.config.marble.respawnHeight) return false;
    return RespawnMarble(world);
}

void StepFrame(World& world, const Input::InputSource& input, float dt)
{
    world.physics.Step(dt);
    RespawnIfFallen(world);
    ApplySteering(world.physics, world.marble, input, world.config.controls);
    TrackCamera(world.camera, world.physics, world.marble, world.config.camera, dt);
}

} // namespace MarbleRun
