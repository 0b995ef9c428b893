#include <Camera/CameraRig.hpp>
#include <Physics/PhysicsSystem.hpp>
#include <raymath.h>
#include <cmath>

namespace MarbleRun {

Vector3 CameraTrailTarget(Vector3 marble, const CameraParams& params)
{
    return (Vector3){ marble.x, marble.y + params.offsetY, marble.z + params.offsetZ };
}

Vector3 SmoothToward(Vector3 current, Vector3 target, float rate, float dt)
{
    float alpha = Clamp(rate * dt, 0.0f, 1.0f);
    // Clamped case lands exactly on the target.
    if (alpha >= 1.0f) return target;
    return Vector3Lerp(current, target, alpha);
}

Vector3 CameraLookTarget(Vector3 cameraPos, const CameraParams& params)
{
    return (Vector3){ cameraPos.x, cameraPos.y - params.lookDrop, cameraPos.z + params.lookAhead };
}

float CameraYaw(const Camera3D& camera)
{
    Vector3 dir = Vector3Subtract(camera.target, camera.position);
    return atan2f(dir.x, dir.z);
}

Camera3D MakeTrailingCamera(Vector3 marble, const CameraParams& params)
{
    Camera3D camera = { 0 };
    camera.position   = CameraTrailTarget(marble, params);
    camera.target     = CameraLookTarget(camera.position, params);
    camera.up         = (Vector3){ 0.0f, 1.0f, 0.0f };
    camera.fovy       = params.fovy;
    camera.projection = CAMERA_PERSPECTIVE;
    return camera;
}

void TrackCamera(std::optional<Camera3D>& camera, const Physics::PhysicsWorld& physics,
                 std::optional<int> marble, const CameraParams& params, float dt)
{
    if (!camera || !marble) return;
    const Physics::RigidBody* body = physics.GetBody(*marble);
    if (!body) return;

    Vector3 target = CameraTrailTarget(body->position, params);
    camera->position = SmoothToward(camera->position, target, params.smoothingRate, dt);
    camera->target   = CameraLookTarget(camera->position, params);
    camera->up       = (Vector3){ 0.0f, 1.0f, 0.0f };
}

} // namespace MarbleRun
