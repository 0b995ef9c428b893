#pragma once
#include <raylib.h>
#include <Config/GameConfig.hpp>
#include <Physics/PhysicsSystem.hpp>
#include <Track/TrackBuilder.hpp>
#include <optional>

namespace MarbleRun {

namespace Input { class InputSource; }

// Everything one session simulates and draws.  Each role (marble, camera)
// is a single optional slot; an empty slot is a valid transient state.
struct World {
    GameConfig              config;
    Physics::PhysicsWorld   physics;
    TrackGeometry           track;
    std::optional<int>      marble;   // handle into `physics`
    std::optional<Camera3D> camera;

    explicit World(const GameConfig& cfg)
        : config(cfg), physics(cfg.world) {}
};

// One-time scene assembly: track colliders, marble, camera.
World BootstrapWorld(const GameConfig& cfg);

// Put the marble back on its start pose with its initial velocity.
// Returns false when there is no marble.
bool RespawnMarble(World& world);

// Respawn the marble if it has fallen below marble.respawnHeight.
// Returns true when a respawn happened.
bool RespawnIfFallen(World& world);

// One frame of simulation, in order: physics step, fall check, steering,
// camera tracking.  The camera therefore sees this frame's marble position.
void StepFrame(World& world, const Input::InputSource& input, float dt);

} // namespace MarbleRun
