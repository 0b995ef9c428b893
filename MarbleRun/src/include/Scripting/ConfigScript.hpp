#pragma once

#include <string>

struct lua_State;

namespace MarbleRun { struct GameConfig; }

namespace MarbleRun::Scripting {

// Loads a Lua configuration script.  The script declares a global `Config`
// table; each optional sub-table overrides the matching GameConfig section:
//
//   Config = {
//     window   = { width = 1280, height = 720, title = "Marble Run", targetFps = 60 },
//     world    = { gravity = {0, -9.81, 0}, stepMode = "variable",
//                  maxStep = 1/60, substeps = 4, timeScale = 1, lengthUnit = 1 },
//     track    = { width = 8, depth = 20, floorThickness = 0.2, wallHeight = 1,
//                  wallThickness = 0.2, slope = 5, floorFriction = 0.7, wallFriction = 0.5 },
//     marble   = { radius = 0.5, density = 1, friction = 0.5, restitution = 0.3,
//                  start = {0, 2, -8}, initialVelocity = {0, 0, 0.5},
//                  respawnHeight = -20, color = {51, 204, 51} },
//     camera   = { offsetY = 4, offsetZ = -8, smoothing = 5, lookAhead = 10,
//                  lookDrop = 3, fovy = 60 },
//     controls = { force = 5 },
//     lighting = { sunDirection = {-0.3, -1, 0.5}, sunColor = {255, 255, 255},
//                  illuminance = 10000, ambientColor = {255, 255, 255}, ambient = 0.3 },
//   }
//
// Fields left out keep their current value.  Colours are 0-255 integers.
class ConfigScript {
public:
    ConfigScript();
    ~ConfigScript();

    ConfigScript(const ConfigScript&) = delete;
    ConfigScript& operator=(const ConfigScript&) = delete;

    // Run the script at `path` and apply its Config table onto `cfg`.
    // On any failure `cfg` is left untouched and GetLastError() explains why.
    bool Load(const std::string& path, GameConfig& cfg);

    // Last error message (empty when none).
    const std::string& GetLastError() const { return m_lastLuaError; }
    void ClearLastError() { m_lastLuaError.clear(); }

private:
    bool init();
    bool apply(GameConfig& cfg);

    lua_State*  L;
    std::string m_lastLuaError;
};

} // namespace MarbleRun::Scripting
