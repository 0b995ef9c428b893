#pragma once

// ── MarbleRun::Draw3D: 3-D primitives the scene is built from ───────────────
//
// Must only be called from within a BeginMode3D() / EndMode3D() block.
//
// Usage:
//   MarbleRun::Draw3D::OrientedBox(seg.position, seg.rotation, seg.extents, GRAY);
//   MarbleRun::Draw3D::Ball(body.position, body.rotation, body.radius, GREEN);

#include <raylib.h>
#include <raymath.h>
#include <rlgl.h>
#include <cmath>

namespace MarbleRun::Draw3D {

/// Light `c` for a surface facing `normal`.  Per channel the light is
/// ambient * ambientColor + (1 - ambient) * lambert * sunStrength * sunColor,
/// clamped to 1, where the sun travels along `sunDirection`.
inline Color Shade(Color c, Vector3 normal, Vector3 sunDirection, Color sunColor, float sunStrength,
                   Color ambientColor, float ambient)
{
    Vector3 toSun = Vector3Negate(Vector3Normalize(sunDirection));
    float diffuse = fmaxf(0.0f, Vector3DotProduct(Vector3Normalize(normal), toSun)) * sunStrength;
    float sunW = (1.0f - ambient) * diffuse / 255.0f;
    float ambW = ambient / 255.0f;
    auto channel = [&](unsigned char base, unsigned char sun, unsigned char amb) {
        float k = Clamp(ambW * amb + sunW * sun, 0.0f, 1.0f);
        return (unsigned char)(base * k);
    };
    return { channel(c.r, sunColor.r, ambientColor.r),
             channel(c.g, sunColor.g, ambientColor.g),
             channel(c.b, sunColor.b, ambientColor.b), c.a };
}

/// Solid box centred at `position`, rotated by `rotation`; `extents` is the full size.
inline void OrientedBox(Vector3 position, Quaternion rotation, Vector3 extents, Color c)
{
    Vector3 axis; float angle;
    QuaternionToAxisAngle(rotation, &axis, &angle);
    rlPushMatrix();
        rlTranslatef(position.x, position.y, position.z);
        rlRotatef(angle * RAD2DEG, axis.x, axis.y, axis.z);
        DrawCubeV({ 0, 0, 0 }, extents, c);
    rlPopMatrix();
}

/// Wireframe version of OrientedBox.
inline void OrientedBoxWires(Vector3 position, Quaternion rotation, Vector3 extents,
                             Color c = { 200, 200, 200, 255 })
{
    Vector3 axis; float angle;
    QuaternionToAxisAngle(rotation, &axis, &angle);
    rlPushMatrix();
        rlTranslatef(position.x, position.y, position.z);
        rlRotatef(angle * RAD2DEG, axis.x, axis.y, axis.z);
        DrawCubeWiresV({ 0, 0, 0 }, extents, c);
    rlPopMatrix();
}

/// Sphere with a band around its local x axis so rolling is visible.
inline void Ball(Vector3 position, Quaternion rotation, float radius, Color c,
                 Color band = { 240, 240, 240, 255 })
{
    DrawSphereEx(position, radius, 16, 16, c);

    const int segments = 24;
    const float r = radius * 1.01f;
    for (int i = 0; i < segments; ++i) {
        float a0 = (2.0f * PI * i) / segments;
        float a1 = (2.0f * PI * (i + 1)) / segments;
        Vector3 p0 = Vector3RotateByQuaternion({ 0.0f, r * cosf(a0), r * sinf(a0) }, rotation);
        Vector3 p1 = Vector3RotateByQuaternion({ 0.0f, r * cosf(a1), r * sinf(a1) }, rotation);
        DrawLine3D(Vector3Add(position, p0), Vector3Add(position, p1), band);
    }
}

/// Thin disc lying on a surface with the given normal.
inline void Disc(Vector3 center, Vector3 normal, float radius, Color c)
{
    Vector3 n = Vector3Normalize(normal);
    DrawCylinderEx(Vector3Add(center, Vector3Scale(n, 0.005f)),
                   Vector3Add(center, Vector3Scale(n, 0.015f)), radius, radius, 20, c);
}

/// Three axis lines: X=red, Y=green, Z=blue.
inline void Axes(Vector3 origin, float size = 1.0f)
{
    DrawLine3D(origin, { origin.x + size, origin.y,        origin.z        }, RED);
    DrawLine3D(origin, { origin.x,        origin.y + size, origin.z        }, GREEN);
    DrawLine3D(origin, { origin.x,        origin.y,        origin.z + size }, BLUE);
}

} // namespace MarbleRun::Draw3D
