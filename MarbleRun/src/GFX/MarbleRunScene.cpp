#include <GFX/MarbleRunScene.hpp>
#include <GFX/Renderer.hpp>

namespace MarbleRun {

MarbleRunScene::MarbleRunScene(const GameConfig& cfg)
    : config(cfg)
{
}

MarbleRunScene::~MarbleRunScene()
{
    Unload();
}

void MarbleRunScene::Init()
{
    world = std::make_unique<World>(BootstrapWorld(config));
}

void MarbleRunScene::Update()
{
    if (!world) return;

    if (IsKeyPressed(KEY_F2)) ToggleDebug();
    if (IsKeyPressed(KEY_R)) RespawnMarble(*world);

    // Steering keys are ignored while the window is in the background.
    const Input::InputSource& input = IsWindowFocused()
        ? static_cast<const Input::InputSource&>(keyboard)
        : static_cast<const Input::InputSource&>(idle);
    StepFrame(*world, input, GetFrameTime());
}

bool MarbleRunScene::ToggleDebug()
{
    worldDebug = !worldDebug;
    TraceLog(LOG_DEBUG, "[Scene] F2 pressed: collider debug=%d", worldDebug ? 1 : 0);
    return worldDebug;
}

void MarbleRunScene::Draw()
{
    ClearBackground((Color){ 135, 170, 210, 255 });
    if (!world) return;

    if (world->camera) {
        BeginMode3D(*world->camera);
        GFX::Renderer::DrawWorld(*world, worldDebug);
        EndMode3D();
    }
    GFX::Renderer::DrawHud(*world, worldDebug);
}

void MarbleRunScene::Unload()
{
    world.reset();
}

} // namespace MarbleRun
