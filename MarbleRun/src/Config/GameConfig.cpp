#include <Config/GameConfig.hpp>

namespace MarbleRun {

bool ValidateConfig(const GameConfig& cfg, std::string& error)
{
    struct Check { const char* name; bool ok; };
    const Check checks[] = {
        { "window.width",          cfg.window.width > 0 },
        { "window.height",         cfg.window.height > 0 },
        { "window.targetFps",      cfg.window.targetFps > 0 },
        { "world.maxStep",         cfg.world.maxStep > 0.0f },
        { "world.substeps",        cfg.world.substeps >= 1 },
        { "world.timeScale",       cfg.world.timeScale > 0.0f },
        { "world.lengthUnit",      cfg.world.lengthUnit > 0.0f },
        { "track.width",           cfg.track.width > 0.0f },
        { "track.depth",           cfg.track.depth > 0.0f },
        { "track.floorThickness",  cfg.track.floorThickness > 0.0f },
        { "track.wallHeight",      cfg.track.wallHeight > 0.0f },
        { "track.wallThickness",   cfg.track.wallThickness > 0.0f },
        { "track.slope",           cfg.track.slopeDegrees > -90.0f && cfg.track.slopeDegrees < 90.0f },
        { "track.floorFriction",   cfg.track.floorFriction >= 0.0f },
        { "track.wallFriction",    !cfg.track.wallFriction || *cfg.track.wallFriction >= 0.0f },
        { "marble.radius",         cfg.marble.radius > 0.0f },
        { "marble.density",        cfg.marble.density > 0.0f },
        { "marble.friction",       cfg.marble.friction >= 0.0f },
        { "marble.restitution",    cfg.marble.restitution >= 0.0f && cfg.marble.restitution <= 1.0f },
        { "camera.smoothing",      cfg.camera.smoothingRate > 0.0f },
        { "camera.fovy",           cfg.camera.fovy > 0.0f && cfg.camera.fovy < 180.0f },
        { "controls.force",        cfg.controls.force >= 0.0f },
        { "lighting.ambient",      cfg.lighting.ambient >= 0.0f && cfg.lighting.ambient <= 1.0f },
    };

    for (const auto& c : checks) {
        if (!c.ok) {
            error = std::string("invalid value for ") + c.name;
            return false;
        }
    }
    return true;
}

} // namespace MarbleRun
