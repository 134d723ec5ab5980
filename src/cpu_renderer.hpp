///// Otter: CPU backend - encodes the params blob, decodes it like the kernel, renders rows on the ScanlinePool.
///// Schneefuchs: Each row is owned by exactly one worker; no locks on the output buffer.
///// Maus: renderRows() is the serial reference path used by tests and by the single-thread case.
///// Datei: src/cpu_renderer.hpp

#pragma once

#include "frame_renderer.hpp"
#include "params_record.hpp"
#include "scanline_pool.hpp"

namespace bulb {

class CpuRenderer final : public FrameRenderer {
public:
    // threadCount <= 0 => Settings::cpuWorkerThreads, then hardware concurrency.
    explicit CpuRenderer(int threadCount = 0);

    void render(const CameraState& camera, FrameBuffer& out) override;
    [[nodiscard]] const char* name() const noexcept override { return "CPU"; }

    [[nodiscard]] int threadCount() const noexcept { return pool_.threadCount(); }

    // Serial render of rows [y0, y1) from an encoded record; thread-agnostic.
    static void renderRows(const ParamsWire& wire, FrameBuffer& out, int y0, int y1);

private:
    ScanlinePool pool_;
    long long    frameIndex_ = 0;
};

} // namespace bulb
