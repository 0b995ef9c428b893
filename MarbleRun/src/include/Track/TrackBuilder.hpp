#pragma once
#include <raylib.h>
#include <optional>
#include <string>

namespace MarbleRun {

namespace Physics { class PhysicsWorld; }

// Channel dimensions. Slope is in degrees; the -z end is the high end.
struct TrackParams {
    float width          = 8.0f;
    float depth          = 20.0f;
    float floorThickness = 0.2f;
    float wallHeight     = 1.0f;
    float wallThickness  = 0.2f;
    float slopeDegrees   = 5.0f;
    float floorFriction  = 0.7f;
    std::optional<float> wallFriction;
};

struct TrackSegment {
    std::string          name;
    Vector3              position = { 0.0f, 0.0f, 0.0f };
    Quaternion           rotation = { 0.0f, 0.0f, 0.0f, 1.0f };
    Vector3              extents  = { 1.0f, 1.0f, 1.0f };
    std::optional<float> friction;
    int                  collider = -1; // set by RegisterTrack
};

struct TrackGeometry {
    TrackSegment floor;
    TrackSegment leftWall;
    TrackSegment rightWall;
};

// Rotation shared by every segment: slopeDegrees about +x.
Quaternion TrackRotation(const TrackParams& params);

// Floor on the origin, walls either side of it, all sharing the floor's slope.
TrackGeometry BuildTrack(const TrackParams& params);

// Hand every segment to the physics world as an immovable box and record
// the returned collider handles. Returns false if any registration failed.
bool RegisterTrack(Physics::PhysicsWorld& physics, TrackGeometry& track);

// Height of the floor's top surface at depth `z` along the centre line.
float FloorSurfaceHeight(const TrackParams& params, float z);

} // namespace MarbleRun
