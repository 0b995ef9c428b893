#pragma once
#include <raylib.h>
#include <Physics/PhysicsSystem.hpp>
#include <Track/TrackBuilder.hpp>
#include <Camera/CameraRig.hpp>
#include <Control/MarbleController.hpp>
#include <string>

namespace MarbleRun {

struct WindowParams {
    int         width     = 1024;
    int         height    = 768;
    std::string title     = "Marble Run";
    int         targetFps = 60;
};

struct MarbleParams {
    float   radius          = 0.5f;
    float   density         = 1.0f;
    float   friction        = 0.5f;
    float   restitution     = 0.3f;
    Vector3 start           = { 0.0f, 2.0f, -8.0f };
    Vector3 initialVelocity = { 0.0f, 0.0f, 0.5f };
    // Below this height the marble is put back on its start pose.
    float   respawnHeight   = -20.0f;
    Color   color           = { 51, 204, 51, 255 };
};

struct LightingParams {
    // Direction the sunlight travels in.
    Vector3 sunDirection = { -0.3f, -1.0f, 0.5f };
    Color   sunColor     = WHITE;
    float   illuminance  = 10000.0f;
    Color   ambientColor = WHITE;
    float   ambient      = 0.3f;
};

struct GameConfig {
    WindowParams          window;
    Physics::WorldParams  world;
    TrackParams           track;
    MarbleParams          marble;
    CameraParams          camera;
    ControlParams         controls;
    LightingParams        lighting;
};

// Check the fields that must be positive. On failure `error` names the
// first offending field.
bool ValidateConfig(const GameConfig& cfg, std::string& error);

} // namespace MarbleRun
