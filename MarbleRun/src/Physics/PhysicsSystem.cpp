// Physics backend: dynamic spheres against static oriented boxes.
//
// Design:
//   RegisterStaticBox(): box corners → 12 triangles → median-split BVH
//   SweepNodeBVH():      traverse BVH, run analytic sphere-vs-tri sweep per leaf
//   RayNodeBVH():        traverse BVH, raylib ray-vs-tri per leaf
//   ContactNodeBVH():    traverse BVH, keep the deepest sphere-vs-tri overlap
//   IntegrateBody():     gravity, contact impulses, swept move, push-out, spin
//
// Sphere-vs-triangle sweep:
//   We cast a ray from (start) to (end) against the "inflated" geometry of each
//   triangle (the Minkowski sum of the triangle with a sphere of the given radius).
//   That Minkowski sum consists of:
//     1. The triangle face (ray vs plane, clamped to triangle)
//     2. Three edge capsules (ray vs infinite cylinder for each edge)
//     3. Three vertex spheres
//   Only hits where the motion points into the surface are kept, so a sphere
//   resting on or sliding along a face never reports the face it is leaving.
//
// Contact response (per touching collider, per substep):
//   normal impulse  jn = -(1 + e) * vn * m     e = 0 below RESTING_SPEED
//   friction        jt = min(|vt| / k, mu * jn) k = 1/m + r^2/I
//   The friction impulse acts at the contact point, so it also spins the sphere.

#include "../include/Physics/PhysicsSystem.hpp"
#include <algorithm>
#include <cfloat>
#include <cmath>
#include <utility>
#include <vector>
#include <raymath.h>

// ─── Geometry helpers (file-internal) ────────────────────────────────────────

static inline float v3dot(Vector3 a, Vector3 b) { return Vector3DotProduct(a, b); }
static inline float v3len(Vector3 a)             { return Vector3Length(a); }
static inline Vector3 v3norm(Vector3 a)           { return Vector3Normalize(a); }
static inline Vector3 v3sub(Vector3 a, Vector3 b) { return Vector3Subtract(a, b); }
static inline Vector3 v3add(Vector3 a, Vector3 b) { return Vector3Add(a, b); }
static inline Vector3 v3scale(Vector3 a, float s) { return Vector3Scale(a, s); }
static inline Vector3 v3cross(Vector3 a, Vector3 b){ return Vector3CrossProduct(a, b); }

// Contact tolerances, in metres (scaled by WorldParams::lengthUnit).
static constexpr float CONTACT_SKIN   = 0.01f;
static constexpr float SWEEP_EPSILON  = 0.001f;
// Approach speed (m/s) under which contacts do not bounce.
static constexpr float RESTING_SPEED  = 0.2f;
static constexpr int   MAX_SLIDE_ITERS = 3;
// Fixed mode never runs more than this many steps to catch up in one frame.
static constexpr int   MAX_FIXED_STEPS_PER_FRAME = 8;

// Closest point on triangle (abc) to point p (Ericson §5.1.5)
static Vector3 ClosestPtTriangle(Vector3 p, Vector3 a, Vector3 b, Vector3 c) {
    Vector3 ab = v3sub(b,a), ac = v3sub(c,a), ap = v3sub(p,a);
    float d1 = v3dot(ab,ap), d2 = v3dot(ac,ap);
    if (d1 <= 0.f && d2 <= 0.f) return a;

    Vector3 bp = v3sub(p,b);
    float d3 = v3dot(ab,bp), d4 = v3dot(ac,bp);
    if (d3 >= 0.f && d4 <= d3) return b;

    float vc = d1*d4 - d3*d2;
    if (vc <= 0.f && d1 >= 0.f && d3 <= 0.f) {
        float v = d1 / (d1 - d3);
        return v3add(a, v3scale(ab, v));
    }

    Vector3 cp = v3sub(p,c);
    float d5 = v3dot(ab,cp), d6 = v3dot(ac,cp);
    if (d6 >= 0.f && d5 <= d6) return c;

    float vb = d5*d2 - d1*d6;
    if (vb <= 0.f && d2 >= 0.f && d6 <= 0.f) {
        float w = d2 / (d2 - d6);
        return v3add(a, v3scale(ac, w));
    }

    float va = d3*d6 - d5*d4;
    float denom = d4 - d3 + d5 - d6;
    if (va <= 0.f && denom > 0.f) {
        float w = (d4 - d3) / denom;
        return v3add(b, v3scale(v3sub(c,b), w));
    }

    float dv = 1.f / (va + vb + vc);
    float vv = vb * dv, wv = vc * dv;
    return v3add(a, v3add(v3scale(ab,vv), v3scale(ac,wv)));
}

// Analytic ray-vs-sphere: ray o+t*d, sphere center c radius r.
// Returns t of first intersection, or FLT_MAX if none in [tMin,tMax].
static float RaySphere(Vector3 o, Vector3 d, Vector3 c, float r, float tMin, float tMax) {
    Vector3 oc = v3sub(o, c);
    float A = v3dot(d,d);
    float B = 2.f * v3dot(oc, d);
    float C = v3dot(oc, oc) - r*r;
    float disc = B*B - 4.f*A*C;
    if (disc < 0.f || A < 1e-12f) return FLT_MAX;
    float sqrtD = sqrtf(disc);
    float t = (-B - sqrtD) / (2.f*A);
    if (t >= tMin && t <= tMax) return t;
    t = (-B + sqrtD) / (2.f*A);
    if (t >= tMin && t <= tMax) return t;
    return FLT_MAX;
}

// Analytic ray-vs-cylinder (axis a→b, radius r), lateral surface only.
// Returns t of first intersection between the end caps, or FLT_MAX if none.
static float RayCylinder(Vector3 ro, Vector3 rd, Vector3 a, Vector3 b, float r, float tMin, float tMax) {
    Vector3 ab  = v3sub(b, a);
    Vector3 ao  = v3sub(ro, a);
    float abLen2 = v3dot(ab, ab);
    if (abLen2 < 1e-10f) return FLT_MAX;

    // Project rd and ao onto plane perpendicular to ab
    float rdDotAb = v3dot(rd, ab) / abLen2;
    float aoDotAb = v3dot(ao, ab) / abLen2;
    Vector3 d_perp = v3sub(rd, v3scale(ab, rdDotAb));
    Vector3 o_perp = v3sub(ao, v3scale(ab, aoDotAb));

    float A = v3dot(d_perp, d_perp);
    float B = 2.f * v3dot(o_perp, d_perp);
    float C = v3dot(o_perp, o_perp) - r*r;
    float disc = B*B - 4.f*A*C;
    if (disc < 0.f || A < 1e-10f) return FLT_MAX;
    float sqrtD = sqrtf(disc);
    float t = (-B - sqrtD) / (2.f*A);
    if (t < tMin || t > tMax) {
        t = (-B + sqrtD) / (2.f*A);
        if (t < tMin || t > tMax) return FLT_MAX;
    }
    Vector3 hitPt = v3add(ro, v3scale(rd, t));
    float proj = v3dot(v3sub(hitPt, a), ab) / abLen2;
    if (proj < 0.f || proj > 1.f) return FLT_MAX;
    return t;
}

// Continuous sphere vs triangle sweep.
// Returns t ∈ [0,1] of first contact, FLT_MAX if no hit.
// outNormal is filled with the contact normal at impact.
static float SweepSphereTriangle(Vector3 start, Vector3 end, float radius,
                                  Vector3 ta, Vector3 tb, Vector3 tc,
                                  Vector3& outNormal) {
    Vector3 d    = v3sub(end, start);
    float segLen = v3len(d);
    if (segLen < 1e-10f) return FLT_MAX;

    Vector3 triNorm = v3norm(v3cross(v3sub(tb,ta), v3sub(tc,ta)));
    float bestT = FLT_MAX;
    Vector3 bestN = triNorm;

    // ── 1. Ray vs face (plane offset by radius on either side) ───────────────
    {
        float nDotD = v3dot(triNorm, d);
        if (fabsf(nDotD) > 1e-8f) {
            for (int sign = -1; sign <= 1; sign += 2) {
                Vector3 n = v3scale(triNorm, (float)sign);
                if (v3dot(n, d) >= 0.f) continue; // moving away from this side
                Vector3 planePoint = v3add(ta, v3scale(n, radius));
                float t = v3dot(triNorm, v3sub(planePoint, start)) / nDotD;
                if (t >= 0.f && t < bestT) {
                    Vector3 hitPt   = v3add(start, v3scale(d, t));
                    Vector3 onPlane = v3sub(hitPt, v3scale(n, radius));
                    Vector3 closest = ClosestPtTriangle(onPlane, ta, tb, tc);
                    if (v3len(v3sub(onPlane, closest)) < 1e-4f) {
                        bestT = t;
                        bestN = n;
                    }
                }
            }
        }
    }

    // ── 2. Ray vs edge capsules ───────────────────────────────────────────────
    Vector3 edges[3][2] = { {ta,tb}, {tb,tc}, {tc,ta} };
    for (auto& e : edges) {
        float t = RayCylinder(start, d, e[0], e[1], radius, 0.f, bestT);
        if (t < bestT) {
            Vector3 hitPt   = v3add(start, v3scale(d, t));
            Vector3 ab      = v3sub(e[1], e[0]);
            float abL2      = v3dot(ab,ab);
            float proj      = abL2 > 1e-10f ? v3dot(v3sub(hitPt, e[0]), ab) / abL2 : 0.f;
            proj            = Clamp(proj, 0.f, 1.f);
            Vector3 closest = v3add(e[0], v3scale(ab, proj));
            Vector3 n       = v3sub(hitPt, closest);
            float nlen      = v3len(n);
            if (nlen > 1e-6f && v3dot(n, d) < 0.f) {
                bestT = t;
                bestN = v3scale(n, 1.f/nlen);
            }
        }
    }

    // ── 3. Ray vs vertex spheres ──────────────────────────────────────────────
    Vector3 verts[3] = { ta, tb, tc };
    for (auto& v : verts) {
        float t = RaySphere(start, d, v, radius, 0.f, bestT);
        if (t < bestT) {
            Vector3 hitPt = v3add(start, v3scale(d, t));
            Vector3 n     = v3sub(hitPt, v);
            float nlen    = v3len(n);
            if (nlen > 1e-6f && v3dot(n, d) < 0.f) {
                bestT = t;
                bestN = v3scale(n, 1.f/nlen);
            }
        }
    }

    if (bestT > 1.f + 1e-6f) return FLT_MAX; // no hit within segment
    outNormal = bestN;
    return bestT;
}

// ─── BVH ─────────────────────────────────────────────────────────────────────

struct Tri {
    Vector3 a, b, c;
    Vector3 centroid;
};

struct BVHNode {
    Vector3 bmin, bmax;
    // Leaf: [triStart, triStart+triCount) in the reordered triangle array.
    // Internal: left child = index+1, right child = rightChild.
    int triStart = 0, triCount = 0;
    int rightChild = -1; // -1 → leaf
};

struct BVH {
    std::vector<BVHNode> nodes;
    std::vector<Tri>     tris;   // reordered

    void Build(std::vector<Tri>&& inTris) {
        tris = std::move(inTris);
        nodes.clear();
        if (tris.empty()) return;
        nodes.reserve(tris.size() * 2);
        BuildNode(0, (int)tris.size());
    }

private:
    static Vector3 TriAabbMin(const Tri& t) {
        return { fminf(t.a.x, fminf(t.b.x, t.c.x)),
                 fminf(t.a.y, fminf(t.b.y, t.c.y)),
                 fminf(t.a.z, fminf(t.b.z, t.c.z)) };
    }
    static Vector3 TriAabbMax(const Tri& t) {
        return { fmaxf(t.a.x, fmaxf(t.b.x, t.c.x)),
                 fmaxf(t.a.y, fmaxf(t.b.y, t.c.y)),
                 fmaxf(t.a.z, fmaxf(t.b.z, t.c.z)) };
    }

    int BuildNode(int start, int end) {
        int nodeIdx = (int)nodes.size();
        nodes.push_back({});

        Vector3 bmin = TriAabbMin(tris[start]);
        Vector3 bmax = TriAabbMax(tris[start]);
        for (int i = start+1; i < end; ++i) {
            bmin = Vector3Min(bmin, TriAabbMin(tris[i]));
            bmax = Vector3Max(bmax, TriAabbMax(tris[i]));
        }
        nodes[nodeIdx].bmin = bmin;
        nodes[nodeIdx].bmax = bmax;

        int count = end - start;
        if (count <= 4) {
            nodes[nodeIdx].triStart = start;
            nodes[nodeIdx].triCount = count;
            return nodeIdx;
        }

        // Split on longest axis at centroid mean
        Vector3 ext = v3sub(bmax, bmin);
        int axis = (ext.x > ext.y && ext.x > ext.z) ? 0 : (ext.y > ext.z ? 1 : 2);
        float mid = 0.f;
        for (int i = start; i < end; ++i) mid += (&tris[i].centroid.x)[axis];
        mid /= (float)count;

        auto midIt = std::partition(tris.begin() + start, tris.begin() + end,
                                    [axis, mid](const Tri& t){ return (&t.centroid.x)[axis] < mid; });
        int split = (int)(midIt - tris.begin());
        if (split == start || split == end) split = start + count / 2;

        // Children are appended after this node; index, never hold a reference across recursion.
        nodes[nodeIdx].triStart = -1;
        BuildNode(start, split);
        int right = BuildNode(split, end);
        nodes[nodeIdx].rightChild = right;
        return nodeIdx;
    }
};

static bool AabbOverlap(Vector3 bmin, Vector3 bmax, Vector3 qmin, Vector3 qmax) {
    return (bmin.x <= qmax.x && bmax.x >= qmin.x) &&
           (bmin.y <= qmax.y && bmax.y >= qmin.y) &&
           (bmin.z <= qmax.z && bmax.z >= qmin.z);
}

// Traverse BVH for sweep; keeps the earliest t.
static void SweepNodeBVH(const BVH& bvh, int nodeIdx,
                          Vector3 start, Vector3 end, float radius,
                          float& bestT, Vector3& bestN) {
    if (nodeIdx < 0 || nodeIdx >= (int)bvh.nodes.size()) return;
    const BVHNode& node = bvh.nodes[nodeIdx];

    Vector3 r = { radius, radius, radius };
    Vector3 swMin = v3sub(Vector3Min(start, end), r);
    Vector3 swMax = v3add(Vector3Max(start, end), r);
    if (!AabbOverlap(node.bmin, node.bmax, swMin, swMax)) return;

    if (node.rightChild == -1) {
        for (int i = node.triStart; i < node.triStart + node.triCount; ++i) {
            const Tri& tri = bvh.tris[i];
            Vector3 n;
            float t = SweepSphereTriangle(start, end, radius, tri.a, tri.b, tri.c, n);
            if (t < bestT) { bestT = t; bestN = n; }
        }
        return;
    }
    SweepNodeBVH(bvh, nodeIdx + 1,     start, end, radius, bestT, bestN);
    SweepNodeBVH(bvh, node.rightChild, start, end, radius, bestT, bestN);
}

// Slab test against a node's box, rejecting boxes entered beyond tMax.
static bool RayAabb(Vector3 o, Vector3 invD, Vector3 bmin, Vector3 bmax, float tMax) {
    float t0 = 0.f, t1 = tMax;
    for (int a = 0; a < 3; ++a) {
        float oa = (&o.x)[a], ia = (&invD.x)[a];
        float tn = ((&bmin.x)[a] - oa) * ia;
        float tf = ((&bmax.x)[a] - oa) * ia;
        if (tn > tf) std::swap(tn, tf);
        t0 = fmaxf(t0, tn);
        t1 = fminf(t1, tf);
        if (t0 > t1) return false;
    }
    return true;
}

// Traverse BVH for a ray; keeps the nearest hit closer than `best.distance`.
static void RayNodeBVH(const BVH& bvh, int nodeIdx, Ray ray, Vector3 invD, RayCollision& best) {
    if (nodeIdx < 0 || nodeIdx >= (int)bvh.nodes.size()) return;
    const BVHNode& node = bvh.nodes[nodeIdx];
    if (!RayAabb(ray.position, invD, node.bmin, node.bmax, best.distance)) return;

    if (node.rightChild == -1) {
        for (int i = node.triStart; i < node.triStart + node.triCount; ++i) {
            const Tri& tri = bvh.tris[i];
            RayCollision c = GetRayCollisionTriangle(ray, tri.a, tri.b, tri.c);
            if (c.hit && c.distance < best.distance) best = c;
        }
        return;
    }
    RayNodeBVH(bvh, nodeIdx + 1,     ray, invD, best);
    RayNodeBVH(bvh, node.rightChild, ray, invD, best);
}

// Traverse BVH for overlap and keep the triangle whose closest point to
// `center` is nearest, provided it lies within `reach`.
static void ContactNodeBVH(const BVH& bvh, int nodeIdx,
                            Vector3 center, float reach,
                            float& bestDist, Vector3& bestPoint, Vector3& bestFaceN) {
    if (nodeIdx < 0 || nodeIdx >= (int)bvh.nodes.size()) return;
    const BVHNode& node = bvh.nodes[nodeIdx];

    if (center.x + reach < node.bmin.x || center.x - reach > node.bmax.x ||
        center.y + reach < node.bmin.y || center.y - reach > node.bmax.y ||
        center.z + reach < node.bmin.z || center.z - reach > node.bmax.z) return;

    if (node.rightChild == -1) {
        for (int i = node.triStart; i < node.triStart + node.triCount; ++i) {
            const Tri& tri = bvh.tris[i];
            Vector3 closest = ClosestPtTriangle(center, tri.a, tri.b, tri.c);
            float dist = v3len(v3sub(center, closest));
            if (dist < reach && dist < bestDist) {
                bestDist  = dist;
                bestPoint = closest;
                bestFaceN = v3norm(v3cross(v3sub(tri.b, tri.a), v3sub(tri.c, tri.a)));
            }
        }
        return;
    }
    ContactNodeBVH(bvh, nodeIdx + 1,     center, reach, bestDist, bestPoint, bestFaceN);
    ContactNodeBVH(bvh, node.rightChild, center, reach, bestDist, bestPoint, bestFaceN);
}

// Box corner i has local sign (+x if bit 0, +y if bit 1, +z if bit 2).
static std::vector<Tri> BoxTriangles(const MarbleRun::Physics::StaticBoxDesc& desc) {
    Vector3 half = v3scale(desc.extents, 0.5f);
    Vector3 corners[8];
    for (int i = 0; i < 8; ++i) {
        Vector3 local = { (i & 1) ? half.x : -half.x,
                          (i & 2) ? half.y : -half.y,
                          (i & 4) ? half.z : -half.z };
        corners[i] = v3add(desc.position, Vector3RotateByQuaternion(local, desc.rotation));
    }

    static const int quads[6][4] = {
        {0,2,6,4}, {1,3,7,5},   // -x, +x
        {0,1,5,4}, {2,3,7,6},   // -y, +y
        {0,1,3,2}, {4,5,7,6},   // -z, +z
    };

    std::vector<Tri> tris;
    tris.reserve(12);
    auto addTri = [&](Vector3 a, Vector3 b, Vector3 c) {
        Tri t;
        t.a = a; t.b = b; t.c = c;
        t.centroid = v3scale(v3add(a, v3add(b, c)), 1.f/3.f);
        // Wind so the face normal points out of the box.
        Vector3 n = v3cross(v3sub(b, a), v3sub(c, a));
        if (v3dot(n, v3sub(t.centroid, desc.position)) < 0.f) std::swap(t.b, t.c);
        tris.push_back(t);
    };
    for (const auto& q : quads) {
        addTri(corners[q[0]], corners[q[1]], corners[q[2]]);
        addTri(corners[q[0]], corners[q[2]], corners[q[3]]);
    }
    return tris;
}

// ─── Contact response ────────────────────────────────────────────────────────

static void ApplyContactImpulse(MarbleRun::Physics::RigidBody& body, Vector3 normal,
                                float staticFriction, float staticRestitution) {
    using MarbleRun::Physics::CombineCoefficient;

    Vector3 r  = v3scale(normal, -body.radius);   // centre → contact point
    Vector3 vc = v3add(body.linearVelocity, v3cross(body.angularVelocity, r));
    float vn   = v3dot(vc, normal);
    if (vn >= 0.f) return; // separating or resting

    float e = CombineCoefficient(body.restitution, staticRestitution);
    if (-vn < RESTING_SPEED) e = 0.f;

    // r is parallel to the normal, so the normal impulse does not spin the sphere.
    float jn = -(1.f + e) * vn * body.mass;
    body.linearVelocity = v3add(body.linearVelocity, v3scale(normal, jn / body.mass));

    vc = v3add(body.linearVelocity, v3cross(body.angularVelocity, r));
    Vector3 vt = v3sub(vc, v3scale(normal, v3dot(vc, normal)));
    float slip = v3len(vt);
    if (slip < 1e-6f) return;

    float mu = CombineCoefficient(body.friction, staticFriction);
    float k  = 1.f / body.mass + (body.radius * body.radius) / body.inertia;
    float jt = fminf(slip / k, mu * jn);
    Vector3 impulse = v3scale(vt, -jt / slip);

    body.linearVelocity  = v3add(body.linearVelocity, v3scale(impulse, 1.f / body.mass));
    body.angularVelocity = v3add(body.angularVelocity, v3scale(v3cross(r, impulse), 1.f / body.inertia));
}

// ─── World ───────────────────────────────────────────────────────────────────

namespace MarbleRun { namespace Physics {

struct StaticEntry {
    int   handle = 0;
    BVH   bvh;
    float friction    = DEFAULT_FRICTION;
    float restitution = 0.f;
};

struct PhysicsWorld::Impl {
    WorldParams              params;
    std::vector<StaticEntry> statics;
    std::vector<RigidBody>   bodies;
    int                      nextHandle  = 1;
    float                    accumulator = 0.f;

    const StaticEntry* FindStatic(int handle) const {
        for (const auto& e : statics)
            if (e.handle == handle) return &e;
        return nullptr;
    }
};

PhysicsWorld::PhysicsWorld(const WorldParams& params)
    : m_impl(std::make_unique<Impl>())
{
    m_impl->params = params;
    if (m_impl->params.substeps < 1) m_impl->params.substeps = 1;
    TraceLog(LOG_INFO, "[Physics] World created: gravity=(%.2f,%.2f,%.2f) mode=%s maxStep=%.4f substeps=%d",
             params.gravity.x, params.gravity.y, params.gravity.z,
             params.mode == StepMode::Fixed ? "fixed" : "variable",
             params.maxStep, m_impl->params.substeps);
}

PhysicsWorld::~PhysicsWorld() = default;
PhysicsWorld::PhysicsWorld(PhysicsWorld&&) noexcept = default;
PhysicsWorld& PhysicsWorld::operator=(PhysicsWorld&&) noexcept = default;

int PhysicsWorld::RegisterStaticBox(const StaticBoxDesc& desc) {
    if (desc.extents.x <= 0.f || desc.extents.y <= 0.f || desc.extents.z <= 0.f) {
        TraceLog(LOG_ERROR, "[Physics] Rejected degenerate static box (%.3f x %.3f x %.3f)",
                 desc.extents.x, desc.extents.y, desc.extents.z);
        return -1;
    }

    StaticEntry entry;
    entry.bvh.Build(BoxTriangles(desc));
    entry.friction    = desc.friction.value_or(DEFAULT_FRICTION);
    entry.restitution = desc.restitution;
    entry.handle      = m_impl->nextHandle++;
    m_impl->statics.push_back(std::move(entry));

    const StaticEntry& added = m_impl->statics.back();
    TraceLog(LOG_DEBUG, "[Physics] Registered static handle=%d tris=%d bvh_nodes=%d friction=%.2f",
             added.handle, (int)added.bvh.tris.size(), (int)added.bvh.nodes.size(), added.friction);
    return added.handle;
}

void PhysicsWorld::UnregisterStatic(int handle) {
    auto& statics = m_impl->statics;
    for (auto it = statics.begin(); it != statics.end(); ++it) {
        if (it->handle == handle) { statics.erase(it); return; }
    }
}

int PhysicsWorld::AddSphereBody(const SphereBodyDesc& desc) {
    if (desc.radius <= 0.f || desc.density <= 0.f) {
        TraceLog(LOG_ERROR, "[Physics] Rejected sphere body (radius=%.3f density=%.3f)",
                 desc.radius, desc.density);
        return -1;
    }

    RigidBody body;
    body.handle          = m_impl->nextHandle++;
    body.position        = desc.position;
    body.rotation        = QuaternionNormalize(desc.rotation);
    body.linearVelocity  = desc.linearVelocity;
    body.angularVelocity = desc.angularVelocity;
    body.radius          = desc.radius;
    body.mass            = SphereMass(desc.radius, desc.density);
    body.inertia         = SphereInertia(body.mass, desc.radius);
    body.friction        = desc.friction;
    body.restitution     = desc.restitution;
    m_impl->bodies.push_back(body);

    TraceLog(LOG_DEBUG, "[Physics] Added sphere handle=%d radius=%.2f mass=%.3f",
             body.handle, body.radius, body.mass);
    return body.handle;
}

void PhysicsWorld::RemoveBody(int handle) {
    auto& bodies = m_impl->bodies;
    bodies.erase(std::remove_if(bodies.begin(), bodies.end(),
                                [handle](const RigidBody& b) { return b.handle == handle; }),
                 bodies.end());
}

RigidBody* PhysicsWorld::GetBody(int handle) {
    for (auto& b : m_impl->bodies)
        if (b.handle == handle) return &b;
    return nullptr;
}

const RigidBody* PhysicsWorld::GetBody(int handle) const {
    for (const auto& b : m_impl->bodies)
        if (b.handle == handle) return &b;
    return nullptr;
}

int PhysicsWorld::Step(float frameDt) {
    if (!(frameDt > 0.f)) return 0;
    const WorldParams& p = m_impl->params;

    if (p.mode == StepMode::Variable) {
        StepOnce(fminf(frameDt, p.maxStep) * p.timeScale);
        return 1;
    }

    m_impl->accumulator += frameDt * p.timeScale;
    int steps = 0;
    while (m_impl->accumulator >= p.maxStep && steps < MAX_FIXED_STEPS_PER_FRAME) {
        StepOnce(p.maxStep);
        m_impl->accumulator -= p.maxStep;
        ++steps;
    }
    if (m_impl->accumulator >= p.maxStep) {
        TraceLog(LOG_DEBUG, "[Physics] Dropping %.4fs of fixed-step backlog", m_impl->accumulator);
        m_impl->accumulator = fmodf(m_impl->accumulator, p.maxStep);
    }
    return steps;
}

void PhysicsWorld::StepOnce(float dt) {
    float h = dt / (float)m_impl->params.substeps;
    for (int s = 0; s < m_impl->params.substeps; ++s) {
        for (auto& body : m_impl->bodies) IntegrateBody(body, h);
    }
}

void PhysicsWorld::IntegrateBody(RigidBody& body, float h) {
    const WorldParams& p = m_impl->params;
    const float skin = CONTACT_SKIN * p.lengthUnit;
    const float eps  = SWEEP_EPSILON * p.lengthUnit;

    body.linearVelocity = v3add(body.linearVelocity, v3scale(p.gravity, h));

    // Resting and grazing contacts
    for (const auto& s : m_impl->statics) {
        Contact c = FindContact(s.handle, body.position, body.radius, skin);
        if (c) ApplyContactImpulse(body, c.normal, s.friction, s.restitution);
    }

    // Swept move with slide (at most a few bounces per substep)
    Vector3 curr      = body.position;
    Vector3 remaining = v3scale(body.linearVelocity, h);
    for (int iter = 0; iter < MAX_SLIDE_ITERS; ++iter) {
        if (v3len(remaining) < 1e-7f) break;
        Vector3 target = v3add(curr, remaining);
        SweepResult hit = SweepSphere(curr, target, body.radius);
        if (!hit) { curr = target; break; }

        curr = v3add(hit.pos, v3scale(hit.normal, eps));
        Vector3 travel = v3sub(target, hit.pos);
        remaining = v3sub(travel, v3scale(hit.normal, v3dot(travel, hit.normal)));

        const StaticEntry* s = m_impl->FindStatic(hit.handle);
        if (s) ApplyContactImpulse(body, hit.normal, s->friction, s->restitution);
    }
    body.position = curr;

    // Push out of anything still overlapping
    for (const auto& s : m_impl->statics) {
        Contact c = FindContact(s.handle, body.position, body.radius);
        if (c && c.depth > 0.f) body.position = v3add(body.position, v3scale(c.normal, c.depth));
    }

    float w = v3len(body.angularVelocity);
    if (w > 1e-6f) {
        Quaternion dq = QuaternionFromAxisAngle(v3scale(body.angularVelocity, 1.f / w), w * h);
        body.rotation = QuaternionNormalize(QuaternionMultiply(dq, body.rotation));
    }
}

SweepResult PhysicsWorld::SweepSphere(const Vector3& start, const Vector3& end, float radius) const {
    SweepResult res;
    float bestT = FLT_MAX;
    for (const auto& s : m_impl->statics) {
        if (s.bvh.nodes.empty()) continue;
        float t = FLT_MAX;
        Vector3 n = { 0, 1, 0 };
        SweepNodeBVH(s.bvh, 0, start, end, radius, t, n);
        if (t <= 1.f + 1e-6f && t < bestT) {
            bestT      = t;
            res.normal = n;
            res.handle = s.handle;
        }
    }
    if (bestT == FLT_MAX) return res;

    res.hit = true;
    res.t   = fminf(bestT, 1.f);
    res.pos = v3add(start, v3scale(v3sub(end, start), res.t));
    return res;
}

RaycastResult PhysicsWorld::Raycast(const Vector3& origin, const Vector3& dir, float maxDist) const {
    RaycastResult res;
    float len = v3len(dir);
    if (len < 1e-8f || !(maxDist > 0.f)) return res;

    Ray ray = { origin, v3scale(dir, 1.f / len) };
    // Zero components give +/-inf, which the slab test handles.
    Vector3 invD = { 1.f / ray.direction.x, 1.f / ray.direction.y, 1.f / ray.direction.z };

    for (const auto& s : m_impl->statics) {
        if (s.bvh.nodes.empty()) continue;
        RayCollision best = {};
        best.distance = res.hit ? res.t : maxDist;
        RayNodeBVH(s.bvh, 0, ray, invD, best);
        if (best.hit) {
            res.hit    = true;
            res.pos    = best.point;
            res.normal = best.normal;
            res.t      = best.distance;
            res.handle = s.handle;
        }
    }
    return res;
}

Contact PhysicsWorld::FindContact(int handle, const Vector3& center, float radius, float skin) const {
    Contact c;
    const StaticEntry* s = m_impl->FindStatic(handle);
    if (!s || s->bvh.nodes.empty()) return c;

    float   bestDist  = FLT_MAX;
    Vector3 bestPoint = center;
    Vector3 faceN     = { 0, 1, 0 };
    ContactNodeBVH(s->bvh, 0, center, radius + skin, bestDist, bestPoint, faceN);
    if (bestDist == FLT_MAX) return c;

    c.hit   = true;
    c.point = bestPoint;
    c.depth = radius - bestDist;
    if (bestDist > 1e-6f) {
        c.normal = v3scale(v3sub(center, bestPoint), 1.f / bestDist);
    } else {
        // Centre is on the surface so push out along the face normal
        c.normal = faceN;
    }
    return c;
}

const WorldParams& PhysicsWorld::Params() const { return m_impl->params; }
std::size_t PhysicsWorld::StaticCount() const  { return m_impl->statics.size(); }
std::size_t PhysicsWorld::BodyCount() const    { return m_impl->bodies.size(); }

}} // namespace MarbleRun::Physics
