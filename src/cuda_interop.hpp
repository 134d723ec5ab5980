///// Otter: CUDA runtime environment checks and device diagnostics; no render logic here.
///// Schneefuchs: Headers & sources in sync; no CUDA or GL includes in this header; stable signatures.
///// Maus: noexcept probes that log and return bool; the caller decides between GPU and CPU.
///// Datei: src/cuda_interop.hpp

#pragma once

namespace CudaInterop {

// True when at least one CUDA device is visible and a context can be created on device 0.
[[nodiscard]] bool precheckCudaRuntime() noexcept;

// One [CUDA] line: device name, compute capability, memory, driver/runtime versions.
void logCudaDeviceContext(const char* tag) noexcept;

} // namespace CudaInterop
