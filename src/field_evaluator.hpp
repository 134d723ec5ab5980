///// Otter: Bulb distance field - escape-time iteration with scalar derivative and orbit trap.
///// Schneefuchs: Header-only, BULB_HD; identical code path for CPU workers and the CUDA kernel.
///// Maus: Power domain [2,12] is enforced by callers (params encoder); no clamping in the hot loop.
///// Datei: src/field_evaluator.hpp

#pragma once

#include "bulb_math.hpp"
#include "bulb_types.hpp"
#include "settings.hpp"

namespace bulb {

// Smallest radius fed to logf; keeps the exact origin (r == 0) finite.
inline constexpr float kMinLogRadius = 1e-30f;

/*
  evaluateField:
  - z = p, dr = 1; per iteration: r = |z|, bail if r > BAILOUT, trap = min(trap, r),
    dr = r^(power-1) * power * dr + 1, then z = spherical power of z plus p.
  - iterations = index at which bailout fired, MAX_ITER if it never did.
  - distance = 0.5 * ln(r) * r / dr with r the last measured radius. Non-escaping
    points yield a small or negative estimate, which the marcher reads as a hit.
*/
BULB_HD FieldSample evaluateField(const Vec3& p, float power) {
    Vec3  z    = p;
    float dr   = 1.0f;
    float r    = 0.0f;
    float trap = Settings::TRAP_SENTINEL;
    unsigned iterations = static_cast<unsigned>(Settings::MAX_ITER);

    for (int i = 0; i < Settings::MAX_ITER; ++i) {
        r = length(z);
        if (r > Settings::BAILOUT) {
            iterations = static_cast<unsigned>(i);
            break;
        }
        trap = fminf(trap, r);

        dr = powf(r, power - 1.0f) * power * dr + 1.0f;

        const float theta = atan2f(z.z, sqrtf(z.x * z.x + z.y * z.y)) * power;
        const float phi   = atan2f(z.y, z.x) * power;
        const float zr    = powf(r, power);

        const float ct = cosf(theta);
        z = make_vec3(zr * ct * cosf(phi),
                      zr * ct * sinf(phi),
                      zr * sinf(theta));
        z = z + p;
    }

    FieldSample s;
    const float rl = fmaxf(r, kMinLogRadius);
    s.distance   = 0.5f * logf(rl) * r / dr;
    s.iterations = iterations;
    s.trap       = trap;
    return s;
}

// Distance component only (normal estimation).
BULB_HD float fieldDistance(const Vec3& p, float power) {
    return evaluateField(p, power).distance;
}

} // namespace bulb
