#pragma once
#include <raylib.h>
#include <optional>

namespace MarbleRun {

namespace Physics { class PhysicsWorld; }
namespace Input   { class InputSource; }

struct ControlParams {
    // Lateral speed (units/s) while a steer key is held.
    float force = 5.0f;
};

// Replace the lateral (x) component of `velocity` with +force for left,
// -force for right, 0 for both or neither. y and z pass through.
Vector3 SteerVelocity(Vector3 velocity, bool left, bool right, float force);

// Per-frame steering. Does nothing when the marble slot is empty or stale.
void ApplySteering(Physics::PhysicsWorld& physics, std::optional<int> marble,
                   const Input::InputSource& input, const ControlParams& params);

} // namespace MarbleRun
