///// Otter: Shared host/device vector math + HSV; one source compiled by g++ and nvcc.
///// Schneefuchs: Header-only, zero deps; BULB_HD marks every helper for both sides; deterministic.
///// Maus: Only C float math (sqrtf, atan2f, powf...) so host and device pick the same functions.
///// Datei: src/bulb_math.hpp

#pragma once

#include <cmath> // sqrtf, atan2f, powf, logf, sinf, cosf, floorf, fminf, fmaxf

// Host TUs see plain inline functions; nvcc sees __host__ __device__ copies.
#if defined(__CUDACC__)
  #define BULB_HD __host__ __device__ __forceinline__
#else
  #define BULB_HD inline
#endif

namespace bulb {

// Value-semantics 3-vector (positions, directions, normals, colors).
struct Vec3 {
    float x, y, z;
};

BULB_HD Vec3 make_vec3(float x, float y, float z) { Vec3 v; v.x = x; v.y = y; v.z = z; return v; }

BULB_HD Vec3 operator+(const Vec3& a, const Vec3& b) { return make_vec3(a.x + b.x, a.y + b.y, a.z + b.z); }
BULB_HD Vec3 operator-(const Vec3& a, const Vec3& b) { return make_vec3(a.x - b.x, a.y - b.y, a.z - b.z); }
BULB_HD Vec3 operator-(const Vec3& a)                { return make_vec3(-a.x, -a.y, -a.z); }
BULB_HD Vec3 operator*(const Vec3& a, float s)       { return make_vec3(a.x * s, a.y * s, a.z * s); }
BULB_HD Vec3 operator*(float s, const Vec3& a)       { return make_vec3(a.x * s, a.y * s, a.z * s); }

BULB_HD float dot(const Vec3& a, const Vec3& b) { return a.x * b.x + a.y * b.y + a.z * b.z; }
BULB_HD float length(const Vec3& a)             { return sqrtf(dot(a, a)); }

// Unit vector; a zero vector stays zero (callers guard degenerate input).
BULB_HD Vec3 normalize(const Vec3& a) {
    const float len = length(a);
    return len > 0.0f ? a * (1.0f / len) : make_vec3(0.0f, 0.0f, 0.0f);
}

// ---------- scalar utils ----------
BULB_HD float clamp01(float x) { return x < 0.0f ? 0.0f : (x > 1.0f ? 1.0f : x); }

// Fractional part wrapped into [0,1) for any sign.
BULB_HD float wrap01(float x) {
    float f = x - floorf(x);
    if (f >= 1.0f) f = 0.0f; // -tiny - floor(-tiny) rounds to 1.0
    return f;
}

// ---------- rotations (right-handed, column vectors) ----------
BULB_HD Vec3 rotateX(const Vec3& v, float a) {
    const float c = cosf(a), s = sinf(a);
    return make_vec3(v.x, c * v.y - s * v.z, s * v.y + c * v.z);
}

BULB_HD Vec3 rotateY(const Vec3& v, float a) {
    const float c = cosf(a), s = sinf(a);
    return make_vec3(c * v.x + s * v.z, v.y, -s * v.x + c * v.z);
}

// ---------- color ----------
/*
  hsvToRgb:
  - h wraps into [0,1); s, v are expected in [0,1].
  - Six-sector form; sector index is clamped so h*6 rounding up to 6 maps to sector 0.
*/
BULB_HD Vec3 hsvToRgb(float h, float s, float v) {
    h = wrap01(h);
    const float h6 = h * 6.0f;
    int   i = static_cast<int>(floorf(h6));
    const float f = h6 - static_cast<float>(i);
    const float p = v * (1.0f - s);
    const float q = v * (1.0f - f * s);
    const float t = v * (1.0f - (1.0f - f) * s);
    i = i % 6;
    switch (i) {
        case 0:  return make_vec3(v, t, p);
        case 1:  return make_vec3(q, v, p);
        case 2:  return make_vec3(p, v, t);
        case 3:  return make_vec3(p, q, v);
        case 4:  return make_vec3(t, p, v);
        default: return make_vec3(v, p, q);
    }
}

// 8-bit quantizer shared by both backends: floor(c*255 + 0.5) on the clamped channel.
BULB_HD unsigned char toByte(float c) {
    return static_cast<unsigned char>(floorf(clamp01(c) * 255.0f + 0.5f));
}

} // namespace bulb
