///// Otter: CameraState implementation; movement in the rotated view basis.
///// Schneefuchs: No logging in the hot input path; clamps are silent and deterministic.
///// Maus: Same rotation helpers as the ray builder, so W always moves along the center ray.
///// Datei: src/camera_state.cpp

#include "camera_state.hpp"
#include "pixel_pipeline.hpp" // rotateCamera

#include <cmath>

namespace bulb {

void CameraState::reset() noexcept {
    position_ = make_vec3(Settings::initialCameraX, Settings::initialCameraY, Settings::initialCameraZ);
    yaw_   = 0.0f;
    pitch_ = 0.0f;
    power_ = Settings::POWER_DEFAULT;
    time_  = 0.0f;
}

float CameraState::clampPower(float power) noexcept {
    if (power < Settings::POWER_MIN) return Settings::POWER_MIN;
    if (power > Settings::POWER_MAX) return Settings::POWER_MAX;
    return power;
}

void CameraState::setPower(float power) noexcept {
    if (!std::isfinite(power)) return;
    power_ = clampPower(std::round(power));
}

Vec3 CameraState::forward() const noexcept {
    return rotateCamera(make_vec3(0.0f, 0.0f, 1.0f), yaw_, pitch_);
}

Vec3 CameraState::right() const noexcept {
    return rotateY(make_vec3(1.0f, 0.0f, 0.0f), yaw_);
}

void CameraState::moveForward(float amount) noexcept { position_ = position_ + forward() * amount; }
void CameraState::moveRight(float amount) noexcept   { position_ = position_ + right() * amount; }
void CameraState::moveUp(float amount) noexcept      { position_.y += amount; }

void CameraState::turn(float deltaYaw, float deltaPitch) noexcept {
    yaw_   += deltaYaw;
    pitch_ += deltaPitch;
}

} // namespace bulb
