#pragma once
#include <raylib.h>
#include <optional>

namespace MarbleRun {

namespace Physics { class PhysicsWorld; }

struct CameraParams {
    // Height above and distance behind (negative z) the marble.
    float offsetY       = 4.0f;
    float offsetZ       = -8.0f;
    // Per-second closing rate toward the trailing position.
    float smoothingRate = 5.0f;
    // Look point relative to the camera's own position.
    float lookAhead     = 10.0f;
    float lookDrop      = 3.0f;
    float fovy          = 60.0f;
};

// Trailing position for a marble at `marble`: follows x and z exactly,
// keeps a fixed height offset.
Vector3 CameraTrailTarget(Vector3 marble, const CameraParams& params);

// lerp(current, target, clamp(rate * dt, 0, 1)).
Vector3 SmoothToward(Vector3 current, Vector3 target, float rate, float dt);

// Forward-and-down point the camera faces, derived from the camera alone.
Vector3 CameraLookTarget(Vector3 cameraPos, const CameraParams& params);

// Heading of the camera's view direction about +y, radians, 0 = facing +z.
float CameraYaw(const Camera3D& camera);

// Camera placed on its trailing position for a marble at `marble`.
Camera3D MakeTrailingCamera(Vector3 marble, const CameraParams& params);

// Per-frame tracking. Does nothing when the camera slot is empty or the
// marble slot is empty or stale.
void TrackCamera(std::optional<Camera3D>& camera, const Physics::PhysicsWorld& physics,
                 std::optional<int> marble, const CameraParams& params, float dt);

} // namespace MarbleRun
