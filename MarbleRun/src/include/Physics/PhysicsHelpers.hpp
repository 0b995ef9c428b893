#pragma once

// ── MarbleRun::Physics: result structs and material helpers ─────────────────
//
// Value-returning query results used by PhysicsWorld, plus the small pieces of
// material math shared by the integrator and the tests.
//
// Usage:
//   auto hit = world.SweepSphere(start, end, 0.5f);
//   if (hit) {
//       // hit.pos, hit.normal, hit.t, hit.handle are all populated
//   }
//
//   auto ground = world.Raycast(body->position, { 0, -1, 0 }, 50.f);

#include <raylib.h>

namespace MarbleRun::Physics {

/// Friction used when a static collider does not set its own.
inline constexpr float DEFAULT_FRICTION = 0.5f;

/// Result of a raycast query.  Evaluates to `true` when an intersection occurred.
struct RaycastResult {
    bool    hit    = false;
    Vector3 pos    = { 0, 0, 0 };
    Vector3 normal = { 0, 1, 0 };
    /// Distance from the origin along the normalised direction.
    float   t      = 0.f;
    int     handle = -1;

    explicit operator bool() const { return hit; }
};

/// Result of a sphere-sweep query.  Evaluates to `true` when an intersection occurred.
struct SweepResult {
    bool    hit    = false;
    Vector3 pos    = { 0, 0, 0 };
    Vector3 normal = { 0, 1, 0 };
    /// Fraction [0,1] along the sweep segment where contact first occurs.
    float   t      = 0.f;
    /// Static collider that was hit, -1 when none.
    int     handle = -1;

    explicit operator bool() const { return hit; }
};

/// Closest overlap between a sphere and one static collider.
struct Contact {
    bool    hit    = false;
    Vector3 point  = { 0, 0, 0 };
    /// Points from the collider toward the sphere centre.
    Vector3 normal = { 0, 1, 0 };
    /// radius - distance; negative while the sphere is inside the contact skin only.
    float   depth  = 0.f;

    explicit operator bool() const { return hit; }
};

/// Pairwise material coefficient (arithmetic mean of both sides).
inline float CombineCoefficient(float a, float b)
{
    return 0.5f * (a + b);
}

/// Mass of a solid sphere of the given radius and density.
inline float SphereMass(float radius, float density)
{
    return density * (4.0f / 3.0f) * PI * radius * radius * radius;
}

/// Moment of inertia of a solid sphere about any axis through its centre.
inline float SphereInertia(float mass, float radius)
{
    return 0.4f * mass * radius * radius;
}

} // namespace MarbleRun::Physics
