#include <Track/TrackBuilder.hpp>
#include <Physics/PhysicsSystem.hpp>
#include <raymath.h>
#include <cmath>
#include <initializer_list>

namespace MarbleRun {

Quaternion TrackRotation(const TrackParams& params)
{
    return QuaternionFromAxisAngle((Vector3){ 1.0f, 0.0f, 0.0f }, params.slopeDegrees * DEG2RAD);
}

TrackGeometry BuildTrack(const TrackParams& params)
{
    const Quaternion slope = TrackRotation(params);
    const float wallOffset = params.width * 0.5f + params.wallThickness * 0.5f;

    TrackGeometry track;

    track.floor.name     = "floor";
    track.floor.position = { 0.0f, 0.0f, 0.0f };
    track.floor.rotation = slope;
    track.floor.extents  = { params.width, params.floorThickness, params.depth };
    track.floor.friction = params.floorFriction;

    track.leftWall.name     = "left_wall";
    track.leftWall.position = { -wallOffset, params.wallHeight * 0.5f, 0.0f };
    track.leftWall.rotation = slope;
    track.leftWall.extents  = { params.wallThickness, params.wallHeight, params.depth };
    track.leftWall.friction = params.wallFriction;

    track.rightWall          = track.leftWall;
    track.rightWall.name     = "right_wall";
    track.rightWall.position.x = wallOffset;

    return track;
}

bool RegisterTrack(Physics::PhysicsWorld& physics, TrackGeometry& track)
{
    bool ok = true;
    for (TrackSegment* seg : { &track.floor, &track.leftWall, &track.rightWall }) {
        Physics::StaticBoxDesc desc;
        desc.position = seg->position;
        desc.rotation = seg->rotation;
        desc.extents  = seg->extents;
        desc.friction = seg->friction;

        seg->collider = physics.RegisterStaticBox(desc);
        if (seg->collider < 0) {
            TraceLog(LOG_ERROR, "[Track] Failed to register %s", seg->name.c_str());
            ok = false;
            continue;
        }
        TraceLog(LOG_INFO, "[Track] %s at (%.2f,%.2f,%.2f) size %.2fx%.2fx%.2f collider=%d",
                 seg->name.c_str(), seg->position.x, seg->position.y, seg->position.z,
                 seg->extents.x, seg->extents.y, seg->extents.z, seg->collider);
    }
    return ok;
}

float FloorSurfaceHeight(const TrackParams& params, float z)
{
    const float theta = params.slopeDegrees * DEG2RAD;
    return (params.floorThickness * 0.5f) / cosf(theta) - z * tanf(theta);
}

} // namespace MarbleRun
