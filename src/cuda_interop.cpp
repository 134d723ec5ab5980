///// Otter: CUDA precheck - device count, context creation on device 0, capability log.
///// Schneefuchs: Every runtime call checked; failures logged with the CUDA error string, never thrown.
///// Maus: Called once at boot and by the parity test fixture.
///// Datei: src/cuda_interop.cpp

#include "cuda_interop.hpp"
#include "bulb_log.hpp"
#include "settings.hpp"

#include <cuda_runtime_api.h>

namespace CudaInterop {

namespace {
    inline const char* errStr(cudaError_t e) {
        const char* s = cudaGetErrorString(e);
        return s ? s : "<null>";
    }
} // namespace

bool precheckCudaRuntime() noexcept {
    int count = 0;
    cudaError_t err = cudaGetDeviceCount(&count);
    if (err != cudaSuccess) {
        BULB_LOG_HOST("[CUDA] cudaGetDeviceCount failed -> %s", errStr(err));
        (void)cudaGetLastError(); // clear sticky state before a CPU fallback
        return false;
    }
    if (count <= 0) {
        BULB_LOG_HOST("[CUDA] no CUDA device found");
        return false;
    }

    err = cudaSetDevice(0);
    if (err != cudaSuccess) {
        BULB_LOG_HOST("[CUDA] cudaSetDevice(0) failed -> %s", errStr(err));
        return false;
    }
    err = cudaFree(nullptr); // forces context creation
    if (err != cudaSuccess) {
        BULB_LOG_HOST("[CUDA] context creation failed -> %s", errStr(err));
        return false;
    }

    if constexpr (Settings::debugLogging) {
        BULB_LOG_HOST("[CUDA] precheck ok; devices=%d", count);
    }
    return true;
}

void logCudaDeviceContext(const char* tag) noexcept {
    int dev = -1;
    if (cudaGetDevice(&dev) != cudaSuccess) {
        BULB_LOG_HOST("[CUDA] %s: no current device", tag ? tag : "-");
        return;
    }
    cudaDeviceProp prop{};
    if (cudaGetDeviceProperties(&prop, dev) != cudaSuccess) {
        BULB_LOG_HOST("[CUDA] %s: cudaGetDeviceProperties failed dev=%d", tag ? tag : "-", dev);
        return;
    }
    int drv = 0, rt = 0;
    if (cudaDriverGetVersion(&drv) != cudaSuccess)  drv = -1;
    if (cudaRuntimeGetVersion(&rt) != cudaSuccess)  rt  = -1;

    BULB_LOG_HOST("[CUDA] %s: dev=%d name=%s cc=%d.%d sms=%d mem=%zu MB driver=%d runtime=%d",
                  tag ? tag : "-", dev, prop.name, prop.major, prop.minor,
                  prop.multiProcessorCount,
                  static_cast<size_t>(prop.totalGlobalMem / (1024u * 1024u)), drv, rt);
}

} // namespace CudaInterop
