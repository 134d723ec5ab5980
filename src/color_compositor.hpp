///// Otter: Hit shading (two lights, Phong highlight, step-count AO, four-signal hue) and the dim background.
///// Schneefuchs: Header-only, BULB_HD; constants come from Settings only, nothing tuned inline.
///// Maus: No error states; every channel leaves here clamped to [0,1].
///// Datei: src/color_compositor.hpp

#pragma once

#include "bulb_math.hpp"
#include "bulb_types.hpp"
#include "raymarcher.hpp"
#include "settings.hpp"

namespace bulb {

// Primary key light (not renormalized; the specular term is tuned for this length).
BULB_HD Vec3 primaryLight()   { return make_vec3(0.577f, 0.577f, -0.577f); }
BULB_HD Vec3 secondaryLight() { return normalize(make_vec3(-0.5f, 0.8f, 0.3f)); }

// Ambient-occlusion proxy from march effort: 1 - (steps/MAX_STEPS)^AO_GAMMA.
BULB_HD float occlusionFromSteps(unsigned steps) {
    const float f = static_cast<float>(steps) / static_cast<float>(Settings::MAX_STEPS);
    return 1.0f - powf(f, Settings::AO_GAMMA);
}

/*
  blendHue:
  - iteration fraction + time drift, normal orientation, orbit trap, position sum.
  - weights 0.4 / 0.2 / 0.2 / 0.2, result wrapped into [0,1).
*/
BULB_HD float blendHue(const FieldSample& s, const Vec3& n, const Vec3& p, float time) {
    const float hIter   = static_cast<float>(s.iterations) / static_cast<float>(Settings::MAX_ITER)
                        + time * Settings::HUE_TIME_DRIFT;
    const float hNormal = (n.x + n.y * 0.5f + 1.0f) * 0.5f;
    const float hTrap   = s.trap * Settings::TRAP_HUE_SCALE;
    const float hPos    = (p.x + p.y + p.z) * Settings::POSITION_HUE_SCALE;
    return wrap01(hIter   * Settings::HUE_W_ITER
                + hNormal * Settings::HUE_W_NORMAL
                + hTrap   * Settings::HUE_W_TRAP
                + hPos    * Settings::HUE_W_POSITION);
}

// Surface color for a hit; viewDir is the (unit) ray direction.
BULB_HD Vec3 shadeHit(const RayHit& hit, const Vec3& viewDir, float power, float time) {
    const Vec3 n  = estimateNormal(hit.position, power);
    const Vec3 l1 = primaryLight();
    const Vec3 l2 = secondaryLight();

    const float diff1 = fmaxf(dot(n, l1), 0.0f);
    const float diff2 = fmaxf(dot(n, l2), 0.0f) * Settings::SECONDARY_LIGHT_WEIGHT;

    const Vec3  toEye = -viewDir;
    const Vec3  refl  = n * (2.0f * dot(n, l1)) - l1;
    const float spec  = powf(fmaxf(dot(toEye, refl), 0.0f), Settings::SPECULAR_EXPONENT)
                      * Settings::SPECULAR_WEIGHT;

    const float ao  = occlusionFromSteps(hit.steps);
    const float hue = blendHue(hit.sample, n, hit.position, time);
    const float sat = Settings::BASE_SATURATION + (1.0f - ao) * Settings::OCCLUSION_SATURATION;
    const float val = fminf((diff1 + diff2 + Settings::AMBIENT_FLOOR) * ao, 1.0f);

    const Vec3 base = hsvToRgb(hue, sat, val);
    return make_vec3(clamp01(base.x + spec), clamp01(base.y + spec), clamp01(base.z + spec));
}

// Miss color: vertical gradient under a slowly drifting blue hue. Monotone in viewDir.y.
BULB_HD Vec3 background(const Vec3& viewDir, float time) {
    const float gradient = (viewDir.y + 1.0f) * 0.5f;
    const float hue = Settings::BG_HUE + time * Settings::BG_HUE_DRIFT;
    const Vec3 c = hsvToRgb(hue, Settings::BG_SATURATION,
                            gradient * Settings::BG_VALUE_SCALE + Settings::BG_VALUE_FLOOR);
    return make_vec3(clamp01(c.x), clamp01(c.y), clamp01(c.z));
}

} // namespace bulb
