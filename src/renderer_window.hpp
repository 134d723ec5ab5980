///// Otter: GLFW window + GL 4.3 core context + GLEW loader; one place for bootstrap order.
///// Schneefuchs: GLFWwindow forward-declared; no GLFW header leaks to callers.
///// Maus: Failures log and return nullptr/false; glfwTerminate happens in destroyWindow().
///// Datei: src/renderer_window.hpp

#pragma once

struct GLFWwindow;

namespace RendererWindow {

// glfwInit, error callback, hints, window, current context, swap interval, GLEW. nullptr on failure.
[[nodiscard]] GLFWwindow* createWindow(int width, int height, const char* title);

[[nodiscard]] bool shouldClose(GLFWwindow* window);
void requestClose(GLFWwindow* window);
void setTitle(GLFWwindow* window, const char* title);

// Destroys the window and terminates GLFW.
void destroyWindow(GLFWwindow* window);

} // namespace RendererWindow
