///// Otter: One pixel end to end: ray from camera + pixel coordinate, march, shade or background, RGBA8.
///// Schneefuchs: Same function body runs in the CPU workers and the CUDA kernel; parity starts here.
///// Maus: v axis flipped so row 0 is the top of the image; aspect stretches u only.
///// Datei: src/pixel_pipeline.hpp

#pragma once

#include "bulb_math.hpp"
#include "bulb_types.hpp"
#include "color_compositor.hpp"
#include "raymarcher.hpp"

namespace bulb {

// Camera rotation: RotY(yaw) * RotX(pitch) applied to v.
BULB_HD Vec3 rotateCamera(const Vec3& v, float yaw, float pitch) {
    return rotateY(rotateX(v, pitch), yaw);
}

// Unit view ray through the corner of pixel (x, y) on a width x height surface.
BULB_HD Vec3 primaryRayDir(const FrameParams& fp, int x, int y, int width, int height) {
    const float u = (static_cast<float>(x) / static_cast<float>(width)  * 2.0f - 1.0f) * fp.aspect;
    const float v = -(static_cast<float>(y) / static_cast<float>(height) * 2.0f - 1.0f);
    return rotateCamera(normalize(make_vec3(u, v, 1.0f)), fp.yaw, fp.pitch);
}

// Linear color of one pixel, channels in [0,1].
BULB_HD Vec3 renderPixel(const FrameParams& fp, int x, int y, int width, int height) {
    const Vec3 dir = primaryRayDir(fp, x, y, width, height);
    const RayHit hit = marchRay(fp.cameraPos, dir, fp.power);
    return hit.hit ? shadeHit(hit, dir, fp.power, fp.time)
                   : background(dir, fp.time);
}

// Writes the quantized pixel to rgba[0..3]; alpha is always opaque.
BULB_HD void storePixel(unsigned char* rgba, const Vec3& c) {
    rgba[0] = toByte(c.x);
    rgba[1] = toByte(c.y);
    rgba[2] = toByte(c.z);
    rgba[3] = 255u;
}

} // namespace bulb
