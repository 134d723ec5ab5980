///// Otter: RAII for CUDA device memory; deterministic lifecycle; neither copied nor moved.
///// Schneefuchs: Clear ownership; header/source in sync; no CUDA headers leak from here.
///// Maus: Minimal surface area; no manual cudaFree in client code.
///// Datei: src/cuda_device_buffer.hpp

#pragma once

#include <cstddef>

namespace CudaInterop {

class CudaDeviceBuffer {
public:
    CudaDeviceBuffer();
    ~CudaDeviceBuffer();

    CudaDeviceBuffer(const CudaDeviceBuffer&) = delete;
    CudaDeviceBuffer& operator=(const CudaDeviceBuffer&) = delete;

    // Allocate exactly sizeBytes (previous content is discarded). Throws on failure.
    void   allocate(std::size_t sizeBytes);

    void   free() noexcept;

    [[nodiscard]] void*       get() const noexcept { return ptr_; }
    [[nodiscard]] std::size_t size() const noexcept { return sizeBytes_; }
    [[nodiscard]] explicit operator bool() const noexcept { return ptr_ != nullptr && sizeBytes_ > 0; }

private:
    void*       ptr_;
    std::size_t sizeBytes_;
};

} // namespace CudaInterop
