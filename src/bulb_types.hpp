///// Otter: Per-pixel value types shared by host and device (FieldSample, RayHit, FrameParams).
///// Schneefuchs: POD only; no constructors so device code and aggregate init stay trivial.
///// Maus: Created and discarded inside one pixel; nothing here is persisted.
///// Datei: src/bulb_types.hpp

#pragma once

#include "bulb_math.hpp"

namespace bulb {

// Output of one field evaluation.
struct FieldSample {
    float    distance;    // distance estimate (lower bound to the surface)
    unsigned iterations;  // bailout index, or MAX_ITER when the orbit never escaped
    float    trap;        // min |z| over the orbit, TRAP_SENTINEL if nothing was sampled
};

// Result of marching one ray.
struct RayHit {
    bool        hit;
    Vec3        position;  // origin + dir * t at termination
    unsigned    steps;     // step index of the hit, or steps consumed on a miss
    FieldSample sample;    // last sample; trap is the minimum over the whole march
};

// Decoded per-frame parameters (see params_record.hpp for the wire layout).
struct FrameParams {
    Vec3  cameraPos;
    float power;
    float yaw;
    float pitch;
    float time;
    float aspect;
};

} // namespace bulb
