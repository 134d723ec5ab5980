///// Otter: CUDA backend - params blob into __constant__, one thread per pixel, same pixel pipeline as the CPU.
///// Schneefuchs: No CUDA headers here (stream forward-declared); construction failures throw so the app can fall back.
///// Maus: Every call blocks on its own non-blocking stream; at most one frame in flight.
///// Datei: src/gpu_renderer.hpp

#pragma once

#include "cuda_device_buffer.hpp"
#include "frame_renderer.hpp"

struct CUstream_st;

namespace bulb {

class GpuRenderer final : public FrameRenderer {
public:
    // Allocates a width x height RGBA8 device target and a private stream. Throws std::runtime_error.
    GpuRenderer(int width, int height);
    ~GpuRenderer() override;

    GpuRenderer(const GpuRenderer&) = delete;
    GpuRenderer& operator=(const GpuRenderer&) = delete;

    // Device render + read back into out (tests, screenshots, CPU-side presentation).
    void render(const CameraState& camera, FrameBuffer& out) override;
    [[nodiscard]] const char* name() const noexcept override { return "GPU"; }

    // Device render straight into caller memory (mapped PBO); devRgba holds width*height*4 bytes.
    void renderToDevice(const CameraState& camera, void* devRgba, int width, int height);

    [[nodiscard]] CUstream_st* stream() const noexcept { return stream_; }

private:
    void launch(const CameraState& camera, void* devRgba, int width, int height);

    int width_;
    int height_;
    CUstream_st* stream_ = nullptr;
    CudaInterop::CudaDeviceBuffer target_;
    long long frameIndex_ = 0;
};

} // namespace bulb
