///// Otter: Main parses --cpu / -d, boots window + GL, picks the backend (CUDA precheck, CPU fallback), runs the loop.
///// Schneefuchs: Every init step logs and either aborts ([FATAL]) or degrades to the CPU; no silent failures.
///// Maus: Teardown order: writer, HUD, interop, GL objects, window; runs on every exit path.
///// Datei: src/main.cpp

#include "bulb_log.hpp"
#include "common.hpp"
#include "cuda_interop.hpp"
#include "frame_loop.hpp"
#include "hud.hpp"
#include "opengl_utils.hpp"
#include "present_pipeline.hpp"
#include "renderer_window.hpp"
#include "settings.hpp"

#include <cstdlib>
#include <cstring>
#include <exception>
#include <memory>
#include <stdexcept>

namespace {

struct CommandLine {
    bool forceCpu = false;
    bool verbose  = false;
    bool help     = false;
};

CommandLine parseArgs(int argc, char** argv) {
    CommandLine cl;
    for (int i = 1; i < argc; ++i) {
        const char* a = argv[i];
        if (std::strcmp(a, "--cpu") == 0)      cl.forceCpu = true;
        else if (std::strcmp(a, "-d") == 0)    cl.verbose  = true;
        else if (std::strcmp(a, "-h") == 0 || std::strcmp(a, "--help") == 0) cl.help = true;
        else BULB_LOG_HOST("[BOOT] ignoring unknown argument '%s'", a);
    }
    return cl;
}

// GPU backend + PBO registration; any failure leaves ctx on the CPU.
void tryEnableGpu(AppContext& ctx) {
    if (!CudaInterop::precheckCudaRuntime()) {
        BULB_LOG_HOST("[BOOT] no usable CUDA device; using CPU backend");
        return;
    }
    CudaInterop::logCudaDeviceContext("boot");
    try {
        ctx.gpu = std::make_unique<bulb::GpuRenderer>(ctx.width, ctx.height);
        ctx.pbo = OpenGLUtils::createPBO(ctx.width, ctx.height);
        if (ctx.pbo) {
            ctx.pboResource = std::make_unique<CudaInterop::PboResource>(ctx.pbo);
        } else {
            BULB_LOG_HOST("[BOOT] PBO unavailable; GPU frames go through host readback");
        }
        ctx.useGpu = true;
    } catch (const std::exception& e) {
        FrameLoop::fallBackToCpu(ctx, e.what());
    }
}

void teardown(AppContext& ctx) noexcept {
    ctx.writer.stop();
    if (ctx.hudReady) Hud::shutdown();
    ctx.pboResource.reset();
    ctx.gpu.reset();
    if (ctx.pbo) { glDeleteBuffers(1, &ctx.pbo); ctx.pbo = 0; }
    if (ctx.tex) { glDeleteTextures(1, &ctx.tex); ctx.tex = 0; }
    PresentPipeline::cleanup();
}

} // namespace

int main(int argc, char** argv)
{
    const CommandLine cl = parseArgs(argc, argv);
    if (cl.help) {
        BULB_LOG_HOST("usage: bulbmarch [--cpu] [-d]");
        return EXIT_SUCCESS;
    }
    BulbLog::setVerbose(cl.verbose || Settings::debugLogging);
    BULB_LOG_HOST("[BOOT] BulbMarch started %dx%d", Settings::width, Settings::height);

    GLFWwindow* window = RendererWindow::createWindow(Settings::width, Settings::height, "BulbMarch");
    if (!window) {
        BULB_LOG_HOST("[FATAL] window/OpenGL initialization failed - aborting");
        return EXIT_FAILURE;
    }

    int rc = EXIT_SUCCESS;
    try {
        AppContext ctx(window, Settings::width, Settings::height);
        const ScopeExit releaseSession([&ctx]() noexcept { teardown(ctx); });

        if (!PresentPipeline::init()) {
            throw std::runtime_error("presentation pipeline init failed");
        }
        ctx.tex = OpenGLUtils::createTexture(ctx.width, ctx.height);
        if (!ctx.tex) {
            throw std::runtime_error("frame texture creation failed");
        }

        ctx.cpu = std::make_unique<bulb::CpuRenderer>(Settings::cpuWorkerThreads);
        if (cl.forceCpu) {
            BULB_LOG_HOST("[BOOT] --cpu given; GPU backend disabled");
        } else if constexpr (Settings::preferGpu) {
            tryEnableGpu(ctx);
        }

        ctx.hudReady = Hud::init(window);
        ctx.writer.start();

        FrameLoop::run(ctx);
    } catch (const std::exception& e) {
        BULB_LOG_HOST("[FATAL] %s", e.what());
        rc = EXIT_FAILURE;
    }

    RendererWindow::destroyWindow(window);
    BULB_LOG_HOST("[EXIT] %s", rc == EXIT_SUCCESS ? "Clean shutdown" : "Shutdown after failure");
    BulbLog::flushLogs();
    return rc;
}
