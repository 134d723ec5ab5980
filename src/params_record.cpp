///// Otter: Params encoder - validation at the one boundary where bad shape parameters could enter.
///// Schneefuchs: std::invalid_argument with the offending value in the message; ASCII only.
///// Maus: Debug log of the packed record only when Settings::debugLogging is on.
///// Datei: src/params_record.cpp

#include "params_record.hpp"
#include "camera_state.hpp"
#include "bulb_log.hpp"
#include "settings.hpp"

#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace bulb {

namespace {
    [[noreturn]] void reject(const char* what, float value) {
        char buf[96];
        std::snprintf(buf, sizeof(buf), "encodeParams: %s (value=%g)", what, static_cast<double>(value));
        throw std::invalid_argument(buf);
    }
} // namespace

ParamsWire encodeParams(const FrameParams& p) {
    ParamsWire w{};
    w.slots[ParamsSlot::PosX]   = p.cameraPos.x;
    w.slots[ParamsSlot::PosY]   = p.cameraPos.y;
    w.slots[ParamsSlot::PosZ]   = p.cameraPos.z;
    w.slots[ParamsSlot::Power]  = p.power;
    w.slots[ParamsSlot::Yaw]    = p.yaw;
    w.slots[ParamsSlot::Pitch]  = p.pitch;
    w.slots[ParamsSlot::Time]   = p.time;
    w.slots[ParamsSlot::Aspect] = p.aspect;

    for (int i = 0; i < ParamsSlot::Count; ++i) {
        if (!std::isfinite(w.slots[i])) reject("non-finite slot", w.slots[i]);
    }
    if (p.power < Settings::POWER_MIN || p.power > Settings::POWER_MAX) {
        reject("power outside [POWER_MIN, POWER_MAX]", p.power);
    }
    if (std::floor(p.power) != p.power) {
        reject("power must be an integer exponent", p.power);
    }
    if (!(p.aspect > 0.0f)) {
        reject("aspect must be > 0", p.aspect);
    }

    if constexpr (Settings::debugLogging) {
        BULB_LOG_HOST("[PARAMS] pos=(%.4f,%.4f,%.4f) power=%.1f yaw=%.4f pitch=%.4f time=%.3f aspect=%.4f",
                      p.cameraPos.x, p.cameraPos.y, p.cameraPos.z, p.power,
                      p.yaw, p.pitch, p.time, p.aspect);
    }
    return w;
}

ParamsWire encodeParams(const CameraState& camera, float aspect) {
    FrameParams p;
    p.cameraPos = camera.position();
    p.power  = camera.power();
    p.yaw    = camera.yaw();
    p.pitch  = camera.pitch();
    p.time   = camera.time();
    p.aspect = aspect;
    return encodeParams(p);
}

} // namespace bulb
