///// Otter: Frame loop - one immutable camera snapshot per frame, GPU via PBO interop or CPU via host upload.
///// Schneefuchs: Key callback only sets flags or camera state; rendering never runs inside a callback.
///// Maus: Title mirrors power and frame time; [PERF] at PERF_LOG_EVERY; [DEBUG] lines only with -d.
///// Datei: src/frame_loop.cpp

#include "frame_loop.hpp"
#include "bulb_log.hpp"
#include "hud.hpp"
#include "input_controller.hpp"
#include "opengl_utils.hpp"
#include "present_pipeline.hpp"
#include "renderer_window.hpp"

#include <GLFW/glfw3.h>
#include <chrono>
#include <cstdio>
#include <exception>

namespace FrameLoop {

namespace {

bool keyToPress(int key, InputController::KeyPress& out) {
    using InputController::KeyPress;
    switch (key) {
        case GLFW_KEY_1: out = KeyPress::Digit1; return true;
        case GLFW_KEY_2: out = KeyPress::Digit2; return true;
        case GLFW_KEY_3: out = KeyPress::Digit3; return true;
        case GLFW_KEY_4: out = KeyPress::Digit4; return true;
        case GLFW_KEY_5: out = KeyPress::Digit5; return true;
        case GLFW_KEY_6: out = KeyPress::Digit6; return true;
        case GLFW_KEY_7: out = KeyPress::Digit7; return true;
        case GLFW_KEY_8: out = KeyPress::Digit8; return true;
        case GLFW_KEY_9: out = KeyPress::Digit9; return true;
        case GLFW_KEY_R: out = KeyPress::Reset; return true;
        case GLFW_KEY_P: out = KeyPress::Screenshot; return true;
        case GLFW_KEY_B: out = KeyPress::ToggleBackend; return true;
        case GLFW_KEY_ESCAPE:
        case GLFW_KEY_Q: out = KeyPress::Quit; return true;
        default: return false;
    }
}

void keyCallback(GLFWwindow* window, int key, int scancode, int action, int mods) {
    (void)scancode; (void)mods;
    if (action != GLFW_PRESS) return;

    auto* ctx = static_cast<AppContext*>(glfwGetWindowUserPointer(window));
    if (!ctx) return;

    InputController::KeyPress press;
    if (!keyToPress(key, press)) return;

    switch (InputController::applyKeyPress(press, ctx->camera)) {
        case InputController::Action::Screenshot:    ctx->screenshotRequested = true; break;
        case InputController::Action::ToggleBackend: ctx->toggleRequested = true; break;
        case InputController::Action::Quit:          RendererWindow::requestClose(window); break;
        case InputController::Action::None:          break;
    }
}

InputController::HeldKeys pollHeldKeys(GLFWwindow* w) {
    auto down = [w](int key) { return glfwGetKey(w, key) == GLFW_PRESS; };
    InputController::HeldKeys k;
    k.forward   = down(GLFW_KEY_W);
    k.back      = down(GLFW_KEY_S);
    k.left      = down(GLFW_KEY_A);
    k.right     = down(GLFW_KEY_D);
    k.up        = down(GLFW_KEY_SPACE);
    k.down      = down(GLFW_KEY_LEFT_SHIFT);
    k.turnLeft  = down(GLFW_KEY_LEFT);
    k.turnRight = down(GLFW_KEY_RIGHT);
    k.turnUp    = down(GLFW_KEY_UP);
    k.turnDown  = down(GLFW_KEY_DOWN);
    return k;
}

void handleToggle(AppContext& ctx) {
    ctx.toggleRequested = false;
    if (ctx.useGpu) {
        ctx.useGpu = false;
    } else if (ctx.gpu) {
        ctx.useGpu = true;
    } else {
        BULB_LOG_HOST("[APP] GPU backend unavailable; staying on CPU");
        return;
    }
    BULB_LOG_HOST("[APP] backend -> %s", ctx.useGpu ? "GPU" : "CPU");
}

// GPU path: render into the mapped PBO, then PBO -> texture. Throws on CUDA failure.
void renderGpu(AppContext& ctx, const bulb::CameraState& snap) {
    if (ctx.pboResource) {
        CUstream_st* s = ctx.gpu->stream();
        void* dev = ctx.pboResource->map(ctx.frame.sizeBytes(), s);
        try {
            ctx.gpu->renderToDevice(snap, dev, ctx.width, ctx.height);
        } catch (...) {
            ctx.pboResource->unmap(s);
            throw;
        }
        ctx.pboResource->unmap(s);
        OpenGLUtils::updateTextureFromPBO(ctx.pbo, ctx.tex, ctx.width, ctx.height);
        if (ctx.screenshotRequested) {
            ctx.gpu->render(snap, ctx.frame); // host copy only when a file is wanted
        }
    } else {
        ctx.gpu->render(snap, ctx.frame);
        OpenGLUtils::updateTextureFromHost(ctx.frame.data(), ctx.tex, ctx.width, ctx.height);
    }
}

void renderCpu(AppContext& ctx, const bulb::CameraState& snap) {
    ctx.cpu->render(snap, ctx.frame);
    OpenGLUtils::updateTextureFromHost(ctx.frame.data(), ctx.tex, ctx.width, ctx.height);
}

void saveScreenshot(AppContext& ctx) {
    ctx.screenshotRequested = false;
    char path[64];
    std::snprintf(path, sizeof(path), "bulbmarch_%03d.bmp", ctx.screenshotCount++);
    if (!ctx.writer.enqueue(path, ctx.frame.data(), ctx.width, ctx.height, ctx.frame.strideBytes())) {
        BULB_LOG_HOST("[APP] screenshot not queued path=%s", path);
    }
}

void updateTitle(AppContext& ctx) {
    char title[128];
    const float fps = ctx.lastFrameMs > 0.0f ? 1000.0f / ctx.lastFrameMs : 0.0f;
    std::snprintf(title, sizeof(title), "BulbMarch (Power=%d) - %.1f ms (%.1f fps) [%s]",
                  static_cast<int>(ctx.camera.power()), ctx.lastFrameMs, fps,
                  ctx.useGpu ? "GPU" : "CPU");
    RendererWindow::setTitle(ctx.window, title);
}

void renderOneFrame(AppContext& ctx) {
    const auto t0 = std::chrono::high_resolution_clock::now();

    glfwPollEvents();
    InputController::applyHeldKeys(pollHeldKeys(ctx.window), ctx.camera);
    if (ctx.toggleRequested) handleToggle(ctx);
    if constexpr (Settings::animateHue) {
        ctx.camera.setTime(static_cast<float>(glfwGetTime() - ctx.startTime));
    }

    const bulb::CameraState snap = ctx.camera;

    bool rendered = false;
    if (ctx.useGpu && ctx.gpu) {
        try {
            renderGpu(ctx, snap);
            rendered = true;
        } catch (const std::exception& e) {
            fallBackToCpu(ctx, e.what());
        }
    }
    if (!rendered) renderCpu(ctx, snap);

    if (ctx.screenshotRequested) saveScreenshot(ctx);

    int fbW = 0, fbH = 0;
    glfwGetFramebufferSize(ctx.window, &fbW, &fbH);
    glViewport(0, 0, fbW, fbH);
    glClear(GL_COLOR_BUFFER_BIT);
    PresentPipeline::drawFullscreenTriangle(ctx.tex);

    if (ctx.hudReady) {
        Hud::Info info;
        info.backend = ctx.useGpu ? "GPU (CUDA)" : "CPU";
        info.power   = snap.power();
        info.posX    = snap.position().x;
        info.posY    = snap.position().y;
        info.posZ    = snap.position().z;
        info.yaw     = snap.yaw();
        info.pitch   = snap.pitch();
        info.frameMs = ctx.lastFrameMs;
        Hud::draw(info);
    }

    glfwSwapBuffers(ctx.window);

    const auto t1 = std::chrono::high_resolution_clock::now();
    ctx.lastFrameMs = std::chrono::duration<float, std::milli>(t1 - t0).count();
    ++ctx.frameCount;
    updateTitle(ctx);

    if constexpr (Settings::performanceLogging) {
        if (ctx.frameCount % Settings::PERF_LOG_EVERY == 0) {
            BULB_LOG_HOST("[PERF] frame=%lld backend=%s total=%.2f ms",
                          ctx.frameCount, ctx.useGpu ? "GPU" : "CPU", ctx.lastFrameMs);
        }
    }
    if (BulbLog::isVerbose()) {
        BULB_LOG_HOST("[DEBUG] frame=%lld pos=(%.3f,%.3f,%.3f) yaw=%.3f pitch=%.3f power=%.0f",
                      ctx.frameCount, snap.position().x, snap.position().y, snap.position().z,
                      snap.yaw(), snap.pitch(), snap.power());
    }
}

} // namespace

void fallBackToCpu(AppContext& ctx, const char* reason) {
    BULB_LOG_HOST("[GPU] %s -> falling back to CPU for this session", reason ? reason : "failure");
    ctx.useGpu = false;
    ctx.pboResource.reset();
    ctx.gpu.reset();
}

void run(AppContext& ctx) {
    glfwSetWindowUserPointer(ctx.window, &ctx);
    glfwSetKeyCallback(ctx.window, keyCallback);
    ctx.startTime = glfwGetTime();

    BULB_LOG_HOST("[APP] loop start %dx%d backend=%s", ctx.width, ctx.height, ctx.useGpu ? "GPU" : "CPU");
    while (!RendererWindow::shouldClose(ctx.window)) {
        renderOneFrame(ctx);
    }
    BULB_LOG_HOST("[APP] loop end frames=%lld", ctx.frameCount);
}

} // namespace FrameLoop
