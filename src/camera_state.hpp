///// Otter: CameraState - position, yaw, pitch, shape power, hue time; owned by the app, snapshotted per frame.
///// Schneefuchs: Power only changes through setPower (clamped to [POWER_MIN, POWER_MAX]); renderers take const&.
///// Maus: Movement helpers follow the view basis (forward = rotated +Z, right = yawed +X).
///// Datei: src/camera_state.hpp

#pragma once

#include "bulb_math.hpp"
#include "settings.hpp"

namespace bulb {

class CameraState {
public:
    CameraState() noexcept { reset(); }

    // Default pose (0,0,-2.5), yaw = pitch = 0, power = POWER_DEFAULT, time = 0.
    void reset() noexcept;

    [[nodiscard]] const Vec3& position() const noexcept { return position_; }
    [[nodiscard]] float yaw()   const noexcept { return yaw_; }
    [[nodiscard]] float pitch() const noexcept { return pitch_; }
    [[nodiscard]] float power() const noexcept { return power_; }
    [[nodiscard]] float time()  const noexcept { return time_; }

    void setPosition(const Vec3& p) noexcept { position_ = p; }
    void setOrientation(float yaw, float pitch) noexcept { yaw_ = yaw; pitch_ = pitch; }
    void setTime(float seconds) noexcept { time_ = seconds; }

    // Rounded to the nearest integer exponent and clamped into [POWER_MIN, POWER_MAX];
    // non-finite input keeps the current power.
    void setPower(float power) noexcept;

    [[nodiscard]] Vec3 forward() const noexcept;
    [[nodiscard]] Vec3 right() const noexcept;

    void moveForward(float amount) noexcept;
    void moveRight(float amount) noexcept;
    void moveUp(float amount) noexcept;
    void turn(float deltaYaw, float deltaPitch) noexcept;

    [[nodiscard]] static float clampPower(float power) noexcept;

private:
    Vec3  position_{};
    float yaw_   = 0.0f;
    float pitch_ = 0.0f;
    float power_ = Settings::POWER_DEFAULT;
    float time_  = 0.0f;
};

} // namespace bulb
