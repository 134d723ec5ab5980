///// Otter: PBO RAII - registers a GL pixel-unpack buffer with CUDA, maps it per frame, unmaps in the dtor.
///// Schneefuchs: No GL/CUDA headers here; ids are unsigned int, handles forward-declared.
///// Maus: Map size is checked against the expected frame size; mismatch throws.
///// Datei: src/pbo_interop.hpp

#pragma once

#include <cstddef>

struct cudaGraphicsResource;
struct CUstream_st;

namespace CudaInterop {

class PboResource {
public:
    // Registers pboId (write-discard). Throws std::runtime_error on failure.
    explicit PboResource(unsigned int pboId);
    ~PboResource();

    PboResource(const PboResource&) = delete;
    PboResource& operator=(const PboResource&) = delete;

    // Maps on stream and returns the device pointer; mapped size must be >= expectedBytes.
    [[nodiscard]] void* map(std::size_t expectedBytes, CUstream_st* stream);
    void unmap(CUstream_st* stream);

private:
    void release() noexcept;

    cudaGraphicsResource* resource_{nullptr};
    bool        mapped_{false};
};

} // namespace CudaInterop
