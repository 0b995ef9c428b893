#pragma once
#include <raylib.h>
#include <Physics/PhysicsHelpers.hpp>
#include <cstddef>
#include <memory>
#include <optional>

namespace MarbleRun { namespace Physics {

enum class StepMode {
    Variable, // one step per frame, dt clamped to maxStep
    Fixed     // accumulate frame time, consume whole maxStep steps
};

// Global simulation parameters, fixed for the lifetime of a PhysicsWorld.
struct WorldParams {
    Vector3  gravity    = { 0.0f, -9.81f, 0.0f };
    StepMode mode       = StepMode::Variable;
    float    maxStep    = 1.0f / 60.0f;
    int      substeps   = 4;
    float    timeScale  = 1.0f;
    // World units per metre. Contact tolerances are expressed in metres.
    float    lengthUnit = 1.0f;
};

// Immovable oriented box. `extents` is the full size along the local axes.
struct StaticBoxDesc {
    Vector3              position    = { 0.0f, 0.0f, 0.0f };
    Quaternion           rotation    = { 0.0f, 0.0f, 0.0f, 1.0f };
    Vector3              extents     = { 1.0f, 1.0f, 1.0f };
    std::optional<float> friction;   // DEFAULT_FRICTION when unset
    float                restitution = 0.0f;
};

struct SphereBodyDesc {
    Vector3    position        = { 0.0f, 0.0f, 0.0f };
    Quaternion rotation        = { 0.0f, 0.0f, 0.0f, 1.0f };
    Vector3    linearVelocity  = { 0.0f, 0.0f, 0.0f };
    Vector3    angularVelocity = { 0.0f, 0.0f, 0.0f };
    float      radius          = 0.5f;
    float      density         = 1.0f;
    float      friction        = 0.5f;
    float      restitution     = 0.0f;
};

// Live state of a dynamic sphere. Velocities written here take effect on
// the next Step().
struct RigidBody {
    int        handle = 0;
    Vector3    position;
    Quaternion rotation;
    Vector3    linearVelocity;
    Vector3    angularVelocity;
    float      radius;
    float      mass;
    float      inertia;
    float      friction;
    float      restitution;
};

class PhysicsWorld {
public:
    explicit PhysicsWorld(const WorldParams& params = WorldParams{});
    ~PhysicsWorld();

    PhysicsWorld(PhysicsWorld&&) noexcept;
    PhysicsWorld& operator=(PhysicsWorld&&) noexcept;
    PhysicsWorld(const PhysicsWorld&) = delete;
    PhysicsWorld& operator=(const PhysicsWorld&) = delete;

    // Register a static box collider. Returns a positive handle id on success,
    // or -1 if the box is degenerate.
    int  RegisterStaticBox(const StaticBoxDesc& desc);
    void UnregisterStatic(int handle);

    // Spawn a dynamic sphere. Returns a positive handle id, or -1 on a
    // non-positive radius or density.
    int  AddSphereBody(const SphereBodyDesc& desc);
    void RemoveBody(int handle);

    // nullptr when the handle does not name a live body.
    RigidBody*       GetBody(int handle);
    const RigidBody* GetBody(int handle) const;

    // Advance the simulation by one rendered frame. Returns the number of
    // internal steps taken (each one split into params.substeps substeps).
    int Step(float frameDt);

    // Continuous sphere sweep against every static collider.
    // start/end are sphere centre positions; the earliest hit wins.
    SweepResult SweepSphere(const Vector3& start, const Vector3& end, float radius) const;

    // Nearest static surface along a ray. `dir` need not be normalised;
    // hits further than maxDist are ignored.
    RaycastResult Raycast(const Vector3& origin, const Vector3& dir, float maxDist = 1000.f) const;

    // Deepest overlap between a sphere and one static collider, counting
    // anything within `skin` of the surface as touching.
    Contact FindContact(int handle, const Vector3& center, float radius, float skin = 0.0f) const;

    const WorldParams& Params() const;
    std::size_t StaticCount() const;
    std::size_t BodyCount() const;

private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;

    void StepOnce(float dt);
    void IntegrateBody(RigidBody& body, float h);
};

}} // namespace MarbleRun::Physics
