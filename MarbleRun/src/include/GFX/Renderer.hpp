#pragma once

namespace MarbleRun { struct World; }

namespace MarbleRun::GFX {

class Renderer {
public:
    // Track, marble and lighting. Call between BeginMode3D / EndMode3D.
    static void DrawWorld(const World& world, bool debug);

    // Controls and marble speed overlay. Call after EndMode3D.
    static void DrawHud(const World& world, bool debug);
};

} // namespace MarbleRun::GFX
