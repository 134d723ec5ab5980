///// Otter: Key mapping implementation; presets and per-frame deltas from Settings.
///// Schneefuchs: Power changes only through CameraState::setPower (clamped).
///// Maus: Debug line per discrete press when Settings::debugLogging is on.
///// Datei: src/input_controller.cpp

#include "input_controller.hpp"
#include "bulb_log.hpp"
#include "settings.hpp"

namespace InputController {

float powerForDigit(int digit) noexcept {
    if (digit >= 1 && digit <= 8) return static_cast<float>(digit + 1);
    if (digit == 9) return 12.0f;
    return 0.0f;
}

void applyHeldKeys(const HeldKeys& k, bulb::CameraState& camera) noexcept {
    const float m = Settings::moveSpeed;
    const float r = Settings::rotateSpeed;

    if (k.forward) camera.moveForward(m);
    if (k.back)    camera.moveForward(-m);
    if (k.right)   camera.moveRight(m);
    if (k.left)    camera.moveRight(-m);
    if (k.up)      camera.moveUp(m);
    if (k.down)    camera.moveUp(-m);

    if (k.turnLeft)  camera.turn(-r, 0.0f);
    if (k.turnRight) camera.turn( r, 0.0f);
    if (k.turnUp)    camera.turn(0.0f, -r);
    if (k.turnDown)  camera.turn(0.0f,  r);
}

Action applyKeyPress(KeyPress key, bulb::CameraState& camera) noexcept {
    switch (key) {
        case KeyPress::Digit1: case KeyPress::Digit2: case KeyPress::Digit3:
        case KeyPress::Digit4: case KeyPress::Digit5: case KeyPress::Digit6:
        case KeyPress::Digit7: case KeyPress::Digit8: case KeyPress::Digit9: {
            const int digit = static_cast<int>(key) - static_cast<int>(KeyPress::Digit1) + 1;
            camera.setPower(powerForDigit(digit));
            if constexpr (Settings::debugLogging) {
                BULB_LOG_HOST("[INPUT] digit=%d power=%.0f", digit, camera.power());
            }
            return Action::None;
        }
        case KeyPress::Reset: {
            const float t = camera.time(); // hue clock keeps running across resets
            camera.reset();
            camera.setTime(t);
            return Action::None;
        }
        case KeyPress::Screenshot:    return Action::Screenshot;
        case KeyPress::ToggleBackend: return Action::ToggleBackend;
        case KeyPress::Quit:          return Action::Quit;
    }
    return Action::None;
}

} // namespace InputController
