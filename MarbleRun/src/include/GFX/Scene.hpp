#pragma once

#include <raylib.h>

namespace MarbleRun {

class Scene {
public:
    virtual ~Scene() = default;
    virtual void Init() {}
    virtual void Update() = 0; // update logic (called before Draw)
    virtual void Draw() = 0;   // draw commands (called between BeginDrawing/EndDrawing)
    virtual void Unload() {}
};

} // namespace MarbleRun
