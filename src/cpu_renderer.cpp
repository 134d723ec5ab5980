///// Otter: CPU backend implementation - one pool job per frame, one row per claim.
///// Schneefuchs: Params go through encode/decode exactly like the CUDA upload path.
///// Maus: [PERF] line every PERF_LOG_EVERY frames; no per-row logging.
///// Datei: src/cpu_renderer.cpp

#include "cpu_renderer.hpp"
#include "bulb_log.hpp"
#include "pixel_pipeline.hpp"
#include "settings.hpp"

#include <chrono>

namespace bulb {

CpuRenderer::CpuRenderer(int threadCount)
    : pool_(threadCount > 0 ? threadCount : Settings::cpuWorkerThreads) {
    BULB_LOG_HOST("[CPU] renderer ready; workers=%d", pool_.threadCount());
}

void CpuRenderer::renderRows(const ParamsWire& wire, FrameBuffer& out, int y0, int y1) {
    const FrameParams fp = decodeParams(wire.slots);
    const int w = out.width();
    const int h = out.height();
    for (int y = y0; y < y1; ++y) {
        uint8_t* row = out.rowPtr(y);
        for (int x = 0; x < w; ++x) {
            storePixel(row + static_cast<std::size_t>(x) * FrameBuffer::kChannels,
                       renderPixel(fp, x, y, w, h));
        }
    }
}

void CpuRenderer::render(const CameraState& camera, FrameBuffer& out) {
    const auto t0 = std::chrono::high_resolution_clock::now();

    const ParamsWire wire = encodeParams(camera, out.aspect());
    pool_.run(out.height(), [&](int y) { renderRows(wire, out, y, y + 1); });

    ++frameIndex_;
    if constexpr (Settings::performanceLogging) {
        if (frameIndex_ % Settings::PERF_LOG_EVERY == 0) {
            const auto t1 = std::chrono::high_resolution_clock::now();
            const double ms = std::chrono::duration<double, std::milli>(t1 - t0).count();
            BULB_LOG_HOST("[PERF] cpu frame=%lld %dx%d render=%.2f ms workers=%d",
                          frameIndex_, out.width(), out.height(), ms, pool_.threadCount());
        }
    }
}

} // namespace bulb
