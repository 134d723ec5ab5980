///// Otter: ImGui HUD - one auto-sized, undecorated window in the top-left corner.
///// Schneefuchs: GLSL "#version 430" for the ImGui GL3 backend, matching the 4.3 core context.
///// Maus: FPS derived from our own frame time, not io.Framerate (which smooths over 120 frames).
///// Datei: src/hud.cpp

#include "hud.hpp"
#include "bulb_log.hpp"

#include <GL/glew.h>
#include <GLFW/glfw3.h>
#include <imgui.h>
#include <imgui_impl_glfw.h>
#include <imgui_impl_opengl3.h>

namespace Hud {

namespace {
    bool s_ready = false;
}

bool init(GLFWwindow* window) {
    if (s_ready) return true;
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.IniFilename = nullptr;
    io.FontGlobalScale = 1.2f;

    ImGui::StyleColorsDark();
    ImGuiStyle& style = ImGui::GetStyle();
    style.WindowRounding   = 5.0f;
    style.WindowBorderSize = 1.0f;
    style.Colors[ImGuiCol_WindowBg].w = 0.7f;

    if (!ImGui_ImplGlfw_InitForOpenGL(window, true)) {
        BULB_LOG_HOST("[HUD] ImGui GLFW backend init failed");
        ImGui::DestroyContext();
        return false;
    }
    if (!ImGui_ImplOpenGL3_Init("#version 430")) {
        BULB_LOG_HOST("[HUD] ImGui OpenGL3 backend init failed");
        ImGui_ImplGlfw_Shutdown();
        ImGui::DestroyContext();
        return false;
    }
    s_ready = true;
    return true;
}

void draw(const Info& info) {
    if (!s_ready) return;

    ImGui_ImplOpenGL3_NewFrame();
    ImGui_ImplGlfw_NewFrame();
    ImGui::NewFrame();

    const ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration
                                 | ImGuiWindowFlags_AlwaysAutoResize
                                 | ImGuiWindowFlags_NoSavedSettings
                                 | ImGuiWindowFlags_NoFocusOnAppearing
                                 | ImGuiWindowFlags_NoNav;
    ImGui::SetNextWindowPos(ImVec2(10, 10), ImGuiCond_Always);
    ImGui::Begin("HUD", nullptr, flags);

    ImGui::Text("Backend: %s", info.backend ? info.backend : "-");
    ImGui::Text("Power:   %.0f", info.power);
    ImGui::Text("Pos:     %.3f, %.3f, %.3f", info.posX, info.posY, info.posZ);
    ImGui::Text("Yaw/Pitch: %.3f / %.3f", info.yaw, info.pitch);
    const float fps = info.frameMs > 0.0f ? 1000.0f / info.frameMs : 0.0f;
    ImGui::Text("Frame:   %.1f ms (%.1f fps)", info.frameMs, fps);

    ImGui::End();
    ImGui::Render();
    ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
}

void shutdown() {
    if (!s_ready) return;
    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();
    s_ready = false;
}

} // namespace Hud
