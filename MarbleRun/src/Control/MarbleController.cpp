#include <Control/MarbleController.hpp>
#include <Input/Input.hpp>
#include <Physics/PhysicsSystem.hpp>

namespace MarbleRun {

Vector3 SteerVelocity(Vector3 velocity, bool left, bool right, float force)
{
    float lateral = 0.0f;
    if (left)  lateral += force;
    if (right) lateral -= force;
    velocity.x = lateral;
    return velocity;
}

void ApplySteering(Physics::PhysicsWorld& physics, std::optional<int> marble,
                   const Input::InputSource& input, const ControlParams& params)
{
    if (!marble) return;
    Physics::RigidBody* body = physics.GetBody(*marble);
    if (!body) return;

    body->linearVelocity = SteerVelocity(body->linearVelocity,
                                         input.IsHeld(Input::Steer::Left),
                                         input.IsHeld(Input::Steer::Right),
                                         params.force);
}

} // namespace MarbleRun
