///// Otter: PBO interop implementation - register with binding restore, map/unmap on the renderer stream.
///// Schneefuchs: Registration and mapping errors throw via BULB_CUDA_CHECK; teardown never throws.
///// Maus: [PBO] debug lines only with Settings::debugLogging; ASCII-only.
///// Datei: src/pbo_interop.cpp

#include "pbo_interop.hpp"
#include "cuda_check.hpp"
#include "settings.hpp"

#include <GL/glew.h>
#include <cuda_gl_interop.h>
#include <stdexcept>

namespace CudaInterop {

PboResource::PboResource(unsigned int pboId) {
    if (pboId == 0) {
        throw std::runtime_error("PboResource: pbo id is 0");
    }

    // Preserve-then-bind; the previous unpack binding is restored even on failure.
    GLint prevBinding = 0;
    glGetIntegerv(GL_PIXEL_UNPACK_BUFFER_BINDING, &prevBinding);
    glBindBuffer(GL_PIXEL_UNPACK_BUFFER, static_cast<GLuint>(pboId));

    const cudaError_t err = cudaGraphicsGLRegisterBuffer(&resource_, static_cast<GLuint>(pboId),
                                                         cudaGraphicsRegisterFlagsWriteDiscard);
    glBindBuffer(GL_PIXEL_UNPACK_BUFFER, static_cast<GLuint>(prevBinding));

    if (err != cudaSuccess) {
        resource_ = nullptr;
        BULB_LOG_HOST("[PBO] cudaGraphicsGLRegisterBuffer pbo=%u failed -> %s",
                      pboId, cudaGetErrorString(err));
        throw std::runtime_error("PboResource: cudaGraphicsGLRegisterBuffer failed");
    }
    if constexpr (Settings::debugLogging) {
        BULB_LOG_HOST("[PBO] registered pbo=%u resource=%p", pboId, static_cast<void*>(resource_));
    }
}

PboResource::~PboResource() {
    release();
}

void PboResource::release() noexcept {
    if (!resource_) return;
    if (mapped_) {
        const cudaError_t e = cudaGraphicsUnmapResources(1, &resource_, 0);
        if (e != cudaSuccess) {
            BULB_LOG_HOST("[PBO] unmap on release failed code=%d", static_cast<int>(e));
        }
        mapped_ = false;
    }
    const cudaError_t err = cudaGraphicsUnregisterResource(resource_);
    if (err != cudaSuccess) {
        BULB_LOG_HOST("[PBO] cudaGraphicsUnregisterResource failed code=%d", static_cast<int>(err));
    }
    resource_ = nullptr;
}

void* PboResource::map(std::size_t expectedBytes, CUstream_st* stream) {
    if (!resource_) {
        throw std::runtime_error("PboResource: map() on released resource");
    }
    if (!mapped_) {
        BULB_CUDA_CHECK(cudaGraphicsMapResources(1, &resource_, stream));
        mapped_ = true;
    }

    void* devPtr = nullptr;
    std::size_t size = 0;
    const cudaError_t err = cudaGraphicsResourceGetMappedPointer(&devPtr, &size, resource_);
    if (err != cudaSuccess || size < expectedBytes) {
        unmap(stream);
        BULB_LOG_HOST("[PBO] mapped pointer invalid code=%d have=%zu need=%zu",
                      static_cast<int>(err), size, expectedBytes);
        throw std::runtime_error("PboResource: mapped buffer unusable");
    }
    if constexpr (Settings::debugLogging) {
        BULB_LOG_HOST("[PBO] mapped ptr=%p size=%zu", devPtr, size);
    }
    return devPtr;
}

void PboResource::unmap(CUstream_st* stream) {
    if (!resource_ || !mapped_) return;
    mapped_ = false;
    BULB_CUDA_CHECK(cudaGraphicsUnmapResources(1, &resource_, stream));
}

} // namespace CudaInterop
