#pragma once

#include <GFX/Scene.hpp>
#include <Config/GameConfig.hpp>
#include <Input/Input.hpp>
#include <World/World.hpp>
#include <memory>
#include <raylib.h>

namespace MarbleRun {

class MarbleRunScene : public Scene {
public:
    explicit MarbleRunScene(const GameConfig& cfg);
    ~MarbleRunScene() override;

    void Init() override;
    void Update() override;
    void Draw() override;
    void Unload() override;

    // Flip collider debug drawing. Returns the new state.
    bool ToggleDebug();

private:
    GameConfig             config;
    std::unique_ptr<World> world;
    Input::KeyboardInput   keyboard;
    Input::NoInput         idle;
    bool                   worldDebug = false;
};

} // namespace MarbleRun
