///// Otter: Sphere-tracing through the bulb field; damped steps, fixed budget, no retries.
///// Schneefuchs: Pure functions, no hidden state - same origin/dir/power always yields the same RayHit.
///// Maus: Normal = central differences of the distance only (6 extra samples, once per hit).
///// Datei: src/raymarcher.hpp

#pragma once

#include "bulb_math.hpp"
#include "bulb_types.hpp"
#include "field_evaluator.hpp"
#include "settings.hpp"

namespace bulb {

/*
  marchRay:
  - t starts at 0; per step sample at origin + dir*t.
  - distance < EPSILON  -> hit at the current t, steps = step index.
  - otherwise t += distance * DAMPING; t > MAX_DISTANCE or MAX_STEPS exhausted -> miss.
  - sample.trap carries the minimum trap over every sample of the march.
*/
BULB_HD RayHit marchRay(const Vec3& origin, const Vec3& dir, float power) {
    RayHit out;
    out.hit      = false;
    out.position = origin;
    out.steps    = static_cast<unsigned>(Settings::MAX_STEPS);
    out.sample.distance   = 0.0f;
    out.sample.iterations = 0u;
    out.sample.trap       = Settings::TRAP_SENTINEL;

    float t       = 0.0f;
    float minTrap = Settings::TRAP_SENTINEL;

    for (int i = 0; i < Settings::MAX_STEPS; ++i) {
        const Vec3 p = origin + dir * t;
        FieldSample s = evaluateField(p, power);
        minTrap = fminf(minTrap, s.trap);
        s.trap  = minTrap;
        out.sample   = s;
        out.position = p;

        if (s.distance < Settings::EPSILON) {
            out.hit   = true;
            out.steps = static_cast<unsigned>(i);
            return out;
        }

        t += s.distance * Settings::DAMPING;
        if (t > Settings::MAX_DISTANCE) {
            out.steps = static_cast<unsigned>(i + 1);
            out.position = origin + dir * t;
            return out;
        }
    }
    return out;
}

// Unit surface normal at p; falls back to +Y where the gradient vanishes.
BULB_HD Vec3 estimateNormal(const Vec3& p, float power) {
    const float e = Settings::NORMAL_EPSILON;
    const Vec3 ex = make_vec3(e, 0.0f, 0.0f);
    const Vec3 ey = make_vec3(0.0f, e, 0.0f);
    const Vec3 ez = make_vec3(0.0f, 0.0f, e);

    const Vec3 g = make_vec3(fieldDistance(p + ex, power) - fieldDistance(p - ex, power),
                             fieldDistance(p + ey, power) - fieldDistance(p - ey, power),
                             fieldDistance(p + ez, power) - fieldDistance(p - ez, power));
    const float len = length(g);
    if (!(len > 0.0f) || !(len < 3.402823466e+38f)) {
        return make_vec3(0.0f, 1.0f, 0.0f);
    }
    return g * (1.0f / len);
}

} // namespace bulb
