///// Otter: FrameRenderer seam - CPU and CUDA backends behind one virtual render().
///// Schneefuchs: Camera is taken by const& (one immutable snapshot per frame); output size is the frame's.
///// Maus: render() returns only after every pixel is written (at most one frame in flight).
///// Datei: src/frame_renderer.hpp

#pragma once

#include "camera_state.hpp"
#include "frame_buffer.hpp"

namespace bulb {

class FrameRenderer {
public:
    virtual ~FrameRenderer() = default;

    // Fills every pixel of out. Throws on backend failure (std::runtime_error)
    // or on an invalid camera snapshot (std::invalid_argument).
    virtual void render(const CameraState& camera, FrameBuffer& out) = 0;

    [[nodiscard]] virtual const char* name() const noexcept = 0;
};

} // namespace bulb
