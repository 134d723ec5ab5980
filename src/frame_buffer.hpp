///// Otter: Host RGBA8 frame - row-major, tightly packed (stride = width*4), fixed size per session.
///// Schneefuchs: Plain owning std::vector; workers write disjoint rows through rowPtr().
///// Maus: Same byte layout as the GL texture and the CUDA output buffer.
///// Datei: src/frame_buffer.hpp

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace bulb {

class FrameBuffer {
public:
    static constexpr int kChannels = 4;

    FrameBuffer(int width, int height)
        : width_(width), height_(height) {
        if (width <= 0 || height <= 0) {
            throw std::invalid_argument("FrameBuffer: width and height must be > 0");
        }
        pixels_.assign(static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * kChannels, 0u);
    }

    [[nodiscard]] int width()  const noexcept { return width_; }
    [[nodiscard]] int height() const noexcept { return height_; }
    [[nodiscard]] int strideBytes() const noexcept { return width_ * kChannels; }
    [[nodiscard]] std::size_t sizeBytes() const noexcept { return pixels_.size(); }
    [[nodiscard]] float aspect() const noexcept { return static_cast<float>(width_) / static_cast<float>(height_); }

    [[nodiscard]] uint8_t*       data() noexcept       { return pixels_.data(); }
    [[nodiscard]] const uint8_t* data() const noexcept { return pixels_.data(); }

    [[nodiscard]] uint8_t* rowPtr(int y) noexcept {
        return pixels_.data() + static_cast<std::size_t>(y) * static_cast<std::size_t>(strideBytes());
    }
    [[nodiscard]] const uint8_t* pixelPtr(int x, int y) const noexcept {
        return pixels_.data() + (static_cast<std::size_t>(y) * static_cast<std::size_t>(width_)
                                 + static_cast<std::size_t>(x)) * kChannels;
    }

private:
    int width_;
    int height_;
    std::vector<uint8_t> pixels_;
};

} // namespace bulb
