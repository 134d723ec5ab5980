///// Otter: Key mapping as data - held movement keys and discrete presses turned into CameraState deltas/actions.
///// Schneefuchs: No GLFW here; the frame loop translates GLFW keys into HeldKeys / KeyPress.
///// Maus: Deltas are per frame (moveSpeed / rotateSpeed), matching the fixed-step feel of the viewer.
///// Datei: src/input_controller.hpp

#pragma once

#include "camera_state.hpp"

namespace InputController {

// Keys that act every frame while held.
struct HeldKeys {
    bool forward   = false;  // W
    bool back      = false;  // S
    bool left      = false;  // A
    bool right     = false;  // D
    bool up        = false;  // Space
    bool down      = false;  // Left Shift
    bool turnLeft  = false;  // Left arrow
    bool turnRight = false;  // Right arrow
    bool turnUp    = false;  // Up arrow
    bool turnDown  = false;  // Down arrow
};

// Keys that act once per press.
enum class KeyPress { Digit1, Digit2, Digit3, Digit4, Digit5, Digit6, Digit7, Digit8, Digit9,
                      Reset, Screenshot, ToggleBackend, Quit };

// What the frame loop still has to do after a press.
enum class Action { None, Screenshot, ToggleBackend, Quit };

// Power preset behind digit keys 1..9: 2,3,4,5,6,7,8,9,12. 0 for anything else.
[[nodiscard]] float powerForDigit(int digit) noexcept;

void applyHeldKeys(const HeldKeys& keys, bulb::CameraState& camera) noexcept;

// Digits set power, Reset restores the default pose and power 2; other keys become actions.
[[nodiscard]] Action applyKeyPress(KeyPress key, bulb::CameraState& camera) noexcept;

} // namespace InputController
