///// Otter: ImGui overlay - backend, power, position, orientation, frame time.
///// Schneefuchs: GLFW + OpenGL3 ImGui backends; init/draw/shutdown, no other ImGui use in the project.
///// Maus: Plain data in, nothing read back; overlay never changes render state.
///// Datei: src/hud.hpp

#pragma once

struct GLFWwindow;

namespace Hud {

struct Info {
    const char* backend = "CPU";
    float power   = 2.0f;
    float posX    = 0.0f;
    float posY    = 0.0f;
    float posZ    = 0.0f;
    float yaw     = 0.0f;
    float pitch   = 0.0f;
    float frameMs = 0.0f;
};

[[nodiscard]] bool init(GLFWwindow* window);
void draw(const Info& info);
void shutdown();

} // namespace Hud
