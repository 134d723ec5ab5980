///// Otter: App frame loop - input, camera snapshot, backend render, upload, blit, HUD, swap.
///// Schneefuchs: AppContext owns every per-session resource; main() only wires it up.
///// Maus: GPU failure inside a frame switches to the CPU for the rest of the session, once, with a log line.
///// Datei: src/frame_loop.hpp

#pragma once

#include "async_frame_writer.hpp"
#include "camera_state.hpp"
#include "cpu_renderer.hpp"
#include "frame_buffer.hpp"
#include "gpu_renderer.hpp"
#include "pbo_interop.hpp"
#include "settings.hpp"

#include <GL/glew.h>
#include <memory>

struct GLFWwindow;

struct AppContext {
    AppContext(GLFWwindow* win, int w, int h)
        : window(win), width(w), height(h), frame(w, h), writer(Settings::screenshotQueue) {}

    GLFWwindow* window = nullptr;
    int width;
    int height;

    bulb::CameraState camera;
    bulb::FrameBuffer frame;

    std::unique_ptr<bulb::CpuRenderer> cpu;
    std::unique_ptr<bulb::GpuRenderer> gpu;
    std::unique_ptr<CudaInterop::PboResource> pboResource;
    bool useGpu = false;

    GLuint tex = 0;
    GLuint pbo = 0;
    bool   hudReady = false;

    bulb::AsyncFrameWriter writer;
    bool screenshotRequested = false;
    bool toggleRequested     = false;

    double startTime   = 0.0;
    long long frameCount = 0;
    float lastFrameMs  = 0.0f;
    int   screenshotCount = 0;
};

namespace FrameLoop {

// Runs until the window is closed or Quit is pressed.
void run(AppContext& ctx);

// Drops the GPU backend (and its PBO registration) and continues on the CPU.
void fallBackToCpu(AppContext& ctx, const char* reason);

} // namespace FrameLoop
