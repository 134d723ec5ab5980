///// Otter: Per-frame parameter blob - 8 floats, 32 bytes, 16-byte aligned; the only state crossing host/device.
///// Schneefuchs: Slot indices are the contract; encoder validates and throws, decoder is BULB_HD and never fails.
///// Maus: CPU backend decodes the same blob as the kernel, so both start from identical bits.
///// Datei: src/params_record.hpp

#pragma once

#include "bulb_math.hpp"
#include "bulb_types.hpp"

#include <cstddef>

namespace bulb {

class CameraState;

// Named float slots of the wire record.
namespace ParamsSlot {
    inline constexpr int PosX   = 0;
    inline constexpr int PosY   = 1;
    inline constexpr int PosZ   = 2;
    inline constexpr int Power  = 3;  // pos.xyz + power form the first 16-byte vector
    inline constexpr int Yaw    = 4;
    inline constexpr int Pitch  = 5;
    inline constexpr int Time   = 6;
    inline constexpr int Aspect = 7;
    inline constexpr int Count  = 8;
}

struct alignas(16) ParamsWire {
    float slots[ParamsSlot::Count];
};

static_assert(sizeof(ParamsWire) == 32, "ParamsWire must be exactly 32 bytes");
static_assert(alignof(ParamsWire) == 16, "ParamsWire must be 16-byte aligned");
static_assert(offsetof(ParamsWire, slots) == 0, "ParamsWire slots must start at offset 0");

// Packs camera + aspect. Throws std::invalid_argument on non-finite values,
// a non-integer power, power outside [POWER_MIN, POWER_MAX] or aspect <= 0.
[[nodiscard]] ParamsWire encodeParams(const CameraState& camera, float aspect);

// Same validation for an already unpacked parameter set.
[[nodiscard]] ParamsWire encodeParams(const FrameParams& params);

// Unpacks slots; no validation (the encoder is the only producer).
BULB_HD FrameParams decodeParams(const float* slots) {
    FrameParams fp;
    fp.cameraPos = make_vec3(slots[ParamsSlot::PosX], slots[ParamsSlot::PosY], slots[ParamsSlot::PosZ]);
    fp.power  = slots[ParamsSlot::Power];
    fp.yaw    = slots[ParamsSlot::Yaw];
    fp.pitch  = slots[ParamsSlot::Pitch];
    fp.time   = slots[ParamsSlot::Time];
    fp.aspect = slots[ParamsSlot::Aspect];
    return fp;
}

} // namespace bulb
