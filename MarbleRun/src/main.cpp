#include <raylib.h>
#include <Config/GameConfig.hpp>
#include <GFX/MarbleRunScene.hpp>
#include <Scripting/ConfigScript.hpp>
#include "GFX/AssetPath.hpp"
#include <filesystem>
#include <string>

//------------------------------------------------------------------------------------
// Program main entry point
//------------------------------------------------------------------------------------
int main()
{
    SetTraceLogLevel(LOG_INFO);

    // Configuration: built-in defaults, optionally overridden by the Lua script
    //--------------------------------------------------------------------------------------
    MarbleRun::GameConfig config;
    const std::string configPath = MarbleRun::ResolveAssetPath("assets/marble_run.lua");
    if (std::filesystem::exists(configPath)) {
        MarbleRun::Scripting::ConfigScript script;
        if (!script.Load(configPath, config))
            TraceLog(LOG_WARNING, "[Config] Using built-in defaults (%s)", script.GetLastError().c_str());
    } else {
        TraceLog(LOG_INFO, "[Config] No %s; using built-in defaults", configPath.c_str());
    }

    // Initialization
    //--------------------------------------------------------------------------------------
    InitWindow(config.window.width, config.window.height, config.window.title.c_str());
    TraceLog(LOG_INFO, "Window initialized %dx%d", config.window.width, config.window.height);
    SetTargetFPS(config.window.targetFps);

    MarbleRun::MarbleRunScene scene(config);
    scene.Init();

    TraceLog(LOG_INFO, "Entering main loop");
    // Main game loop
    while (!WindowShouldClose())    // Detect window close button or ESC key
    {
        // Update
        //----------------------------------------------------------------------------------
        scene.Update();

        // Draw
        //----------------------------------------------------------------------------------
        BeginDrawing();
        scene.Draw();
        EndDrawing();
    }

    // De-Initialization
    //--------------------------------------------------------------------------------------
    scene.Unload();
    CloseWindow();        // Close window and OpenGL context

    return 0;
}
