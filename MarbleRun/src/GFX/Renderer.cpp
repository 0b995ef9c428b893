#include "../include/GFX/Renderer.hpp"
#include <World/World.hpp>
#include <Draw3D/Draw3D.hpp>
#include <raylib.h>
#include <raymath.h>
#include <algorithm>
#include <initializer_list>

namespace MarbleRun::GFX {

static constexpr Color FLOOR_COLOR = { 170, 180, 200, 255 };
static constexpr Color WALL_COLOR  = { 120, 100, 90, 255 };

void Renderer::DrawWorld(const World& world, bool debug)
{
    const LightingParams& light = world.config.lighting;
    const float sun = std::min(light.illuminance / 10000.0f, 1.0f);
    auto lit = [&](Color c, Vector3 normal) {
        return Draw3D::Shade(c, normal, light.sunDirection, light.sunColor, sun,
                             light.ambientColor, light.ambient);
    };

    const TrackGeometry& track = world.track;
    Vector3 up = Vector3RotateByQuaternion({ 0.0f, 1.0f, 0.0f }, track.floor.rotation);
    Draw3D::OrientedBox(track.floor.position, track.floor.rotation, track.floor.extents,
                        lit(FLOOR_COLOR, up));

    // Walls are shaded by the face looking into the channel.
    Draw3D::OrientedBox(track.leftWall.position, track.leftWall.rotation, track.leftWall.extents,
                        lit(WALL_COLOR, { 1.0f, 0.0f, 0.0f }));
    Draw3D::OrientedBox(track.rightWall.position, track.rightWall.rotation, track.rightWall.extents,
                        lit(WALL_COLOR, { -1.0f, 0.0f, 0.0f }));

    const Physics::RigidBody* body = world.marble ? world.physics.GetBody(*world.marble) : nullptr;
    Physics::RaycastResult ground;
    if (body) {
        Draw3D::Ball(body->position, body->rotation, body->radius, lit(world.config.marble.color, up));

        // Contact shadow, fading out as the marble leaves the track.
        ground = world.physics.Raycast(body->position, { 0.0f, -1.0f, 0.0f }, 30.0f);
        if (ground) {
            float lift = Clamp((ground.t - body->radius) / 5.0f, 0.0f, 1.0f);
            Draw3D::Disc(ground.pos, ground.normal, body->radius * (1.0f - 0.6f * lift),
                         Fade(BLACK, 0.35f * (1.0f - lift)));
        }
    }

    if (!debug) return;
    for (const TrackSegment* seg : { &track.floor, &track.leftWall, &track.rightWall })
        Draw3D::OrientedBoxWires(seg->position, seg->rotation, seg->extents, RED);
    Draw3D::Axes({ 0.0f, 0.0f, 0.0f }, 2.0f);
    if (body) {
        DrawSphereWires(body->position, body->radius, 8, 8, YELLOW);
        Vector3 toSun = Vector3Scale(Vector3Normalize(light.sunDirection), -2.0f);
        DrawLine3D(body->position, Vector3Add(body->position, toSun), ORANGE);
        if (ground) {
            DrawLine3D(body->position, ground.pos, LIME);
            DrawLine3D(ground.pos, Vector3Add(ground.pos, ground.normal), GREEN);
        }
    }
}

void Renderer::DrawHud(const World& world, bool debug)
{
    DrawRectangle(5, 5, 330, debug ? 105 : 75, Fade(SKYBLUE, 0.5f));
    DrawRectangleLines(5, 5, 330, debug ? 105 : 75, BLUE);
    DrawText("Marble controls:", 15, 15, 10, BLACK);
    DrawText("- Steer: A / D or Left / Right", 15, 30, 10, BLACK);
    DrawText("- Respawn: R    Collider debug: F2", 15, 45, 10, BLACK);

    const Physics::RigidBody* body = world.marble ? world.physics.GetBody(*world.marble) : nullptr;
    if (!body) {
        DrawText("- No marble", 15, 60, 10, MAROON);
        return;
    }
    DrawText(TextFormat("- Speed: (%06.3f)", Vector3Length(body->linearVelocity)), 15, 60, 10, BLACK);
    if (debug) {
        DrawText(TextFormat("- Pos: (%.2f, %.2f, %.2f)", body->position.x, body->position.y, body->position.z),
                 15, 75, 10, BLACK);
        DrawText(TextFormat("- Vel: (%.2f, %.2f, %.2f)", body->linearVelocity.x, body->linearVelocity.y,
                            body->linearVelocity.z), 15, 90, 10, BLACK);
    }
}

} // namespace MarbleRun::GFX
