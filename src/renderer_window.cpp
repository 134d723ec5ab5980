///// Otter: Modern GL context (4.3 core), deterministic setup flow; error callback installed right after glfwInit().
///// Schneefuchs: ASCII logs; GLEW initialized once the context is current; VSync from Settings::preferVSync.
///// Maus: Window position fixed or centered at compile time; no GLFW calls before createWindow().
///// Datei: src/renderer_window.cpp

#include "renderer_window.hpp"
#include "bulb_log.hpp"
#include "settings.hpp"

#include <GL/glew.h>
#include <GLFW/glfw3.h>

namespace {

void glfwErrorCallback(int code, const char* description) {
    BULB_LOG_HOST("[GLFW-ERROR] code=%d desc=%s", code, description ? description : "(null)");
}

void placeWindow(GLFWwindow* window, int w, int h) {
    constexpr bool kHasFixedPos = (Settings::windowPosX >= 0) && (Settings::windowPosY >= 0);
    if constexpr (kHasFixedPos) {
        glfwSetWindowPos(window, Settings::windowPosX, Settings::windowPosY);
    } else {
        GLFWmonitor* mon = glfwGetPrimaryMonitor();
        const GLFWvidmode* vm = mon ? glfwGetVideoMode(mon) : nullptr;
        if (vm) glfwSetWindowPos(window, (vm->width - w) / 2, (vm->height - h) / 2);
    }
}

bool initGlew() {
    glewExperimental = GL_TRUE;
    const GLenum err = glewInit();
    if (err != GLEW_OK) {
        BULB_LOG_HOST("[ERROR] glewInit failed: %s",
                      reinterpret_cast<const char*>(glewGetErrorString(err)));
        return false;
    }
    (void)glGetError(); // glewInit may leave GL_INVALID_ENUM on core profiles
    BULB_LOG_HOST("[GL] vendor=%s renderer=%s version=%s",
                  reinterpret_cast<const char*>(glGetString(GL_VENDOR)),
                  reinterpret_cast<const char*>(glGetString(GL_RENDERER)),
                  reinterpret_cast<const char*>(glGetString(GL_VERSION)));
    return true;
}

} // namespace

namespace RendererWindow {

GLFWwindow* createWindow(int width, int height, const char* title) {
    if (!glfwInit()) {
        BULB_LOG_HOST("[ERROR] GLFW init failed");
        return nullptr;
    }
    glfwSetErrorCallback(glfwErrorCallback);

    glfwDefaultWindowHints();
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 4);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
#if defined(__APPLE__)
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GL_TRUE);
#endif
    glfwWindowHint(GLFW_OPENGL_DEBUG_CONTEXT, Settings::debugLogging ? GLFW_TRUE : GLFW_FALSE);
    glfwWindowHint(GLFW_DOUBLEBUFFER, GLFW_TRUE);
    glfwWindowHint(GLFW_RESIZABLE,    GLFW_FALSE); // resolution is fixed per session

    GLFWwindow* window = glfwCreateWindow(width, height, title ? title : "BulbMarch", nullptr, nullptr);
    if (!window) {
        BULB_LOG_HOST("[ERROR] Window creation failed w=%d h=%d", width, height);
        glfwTerminate();
        return nullptr;
    }
    glfwMakeContextCurrent(window);

    if (!initGlew()) {
        glfwDestroyWindow(window);
        glfwTerminate();
        return nullptr;
    }

    glfwSwapInterval(Settings::preferVSync ? 1 : 0);
    if constexpr (Settings::performanceLogging) {
        BULB_LOG_HOST("[VSync] swapInterval=%d", Settings::preferVSync ? 1 : 0);
    }
    placeWindow(window, width, height);
    return window;
}

bool shouldClose(GLFWwindow* window) {
    return glfwWindowShouldClose(window) != 0;
}

void requestClose(GLFWwindow* window) {
    glfwSetWindowShouldClose(window, GLFW_TRUE);
}

void setTitle(GLFWwindow* window, const char* title) {
    if (window && title) glfwSetWindowTitle(window, title);
}

void destroyWindow(GLFWwindow* window) {
    if (window) glfwDestroyWindow(window);
    glfwTerminate();
}

} // namespace RendererWindow
