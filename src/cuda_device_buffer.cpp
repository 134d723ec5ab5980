///// Otter: CUDA device buffer RAII; allocate() replaces, free() releases; debug logs on alloc/free.
///// Schneefuchs: cudaMalloc failure throws via BULB_CUDA_CHECK; free() never throws.
///// Maus: Implementation kept apart from the interface; no hidden allocations.
///// Datei: src/cuda_device_buffer.cpp

#include "cuda_device_buffer.hpp"
#include "cuda_check.hpp"
#include "settings.hpp"

#include <cuda_runtime_api.h>   // cudaMalloc / cudaFree

namespace CudaInterop {

CudaDeviceBuffer::CudaDeviceBuffer() : ptr_(nullptr), sizeBytes_(0) {}

CudaDeviceBuffer::~CudaDeviceBuffer() {
    free();
}

void CudaDeviceBuffer::allocate(std::size_t sizeBytes) {
    free();
    if (sizeBytes == 0) return;

    void* p = nullptr;
    BULB_CUDA_CHECK(cudaMalloc(&p, sizeBytes));
    ptr_       = p;
    sizeBytes_ = sizeBytes;
    if constexpr (Settings::debugLogging) {
        BULB_LOG_HOST("[CUDA] cudaMalloc ok ptr=%p bytes=%zu", ptr_, sizeBytes_);
    }
}

void CudaDeviceBuffer::free() noexcept {
    if (!ptr_) return;
    const void*       p  = ptr_;
    const std::size_t sz = sizeBytes_;
    const cudaError_t err = cudaFree(ptr_);
    ptr_       = nullptr;
    sizeBytes_ = 0;
    if (err != cudaSuccess) {
        BULB_LOG_HOST("[CUDA] cudaFree ptr=%p bytes=%zu failed code=%d", p, sz, static_cast<int>(err));
    } else if constexpr (Settings::debugLogging) {
        BULB_LOG_HOST("[CUDA] cudaFree ptr=%p bytes=%zu", p, sz);
    }
}

} // namespace CudaInterop
