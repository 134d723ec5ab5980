///// Otter: AsyncFrameWriter implementation - bounded queue, worker drains on stop, timing per file.
///// Schneefuchs: Bottom-up BMP rows; row padding; single pass write; RGBA -> BGR swizzle.
///// Maus: Failures are logged and counted, never thrown into the frame loop; ASCII-only.
///// Datei: src/async_frame_writer.cpp

#include "async_frame_writer.hpp"
#include "bulb_log.hpp"

#include <chrono>
#include <fstream>

namespace bulb {

AsyncFrameWriter::AsyncFrameWriter(std::size_t maxQueuedJobs)
    : maxQueue_(maxQueuedJobs ? maxQueuedJobs : 1) {}

AsyncFrameWriter::~AsyncFrameWriter() {
    stop();
}

void AsyncFrameWriter::start() {
    if (running_.exchange(true)) return;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        accepting_ = true;
    }
    worker_ = std::thread(&AsyncFrameWriter::workerLoop, this);
    BULB_LOG_HOST("[AsyncFrameWriter] started; maxQueue=%zu", maxQueue_);
}

void AsyncFrameWriter::stop() {
    if (!running_.exchange(false)) return;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        accepting_ = false;
    }
    cv_.notify_all();
    if (worker_.joinable()) worker_.join();
    BULB_LOG_HOST("[AsyncFrameWriter] stopped; dropped=%zu", dropped_.load());
}

bool AsyncFrameWriter::enqueue(const std::string& path, const uint8_t* rgba8, int width, int height, int strideBytes) {
    if (!rgba8 || width <= 0 || height <= 0 || strideBytes < width * 4) {
        BULB_LOG_HOST("[AsyncFrameWriter] rejected %s (w=%d h=%d stride=%d)",
                      path.c_str(), width, height, strideBytes);
        return false;
    }

    const std::size_t bytes = static_cast<std::size_t>(height) * static_cast<std::size_t>(strideBytes);
    Job job{path, width, height, strideBytes, std::vector<uint8_t>(rgba8, rgba8 + bytes)};

    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!accepting_) {
            BULB_LOG_HOST("[AsyncFrameWriter] not running; screenshot %s skipped", path.c_str());
            return false;
        }
        while (queue_.size() >= maxQueue_) {
            BULB_LOG_HOST("[AsyncFrameWriter] backlog %zu; dropping %s",
                          queue_.size(), queue_.front().path.c_str());
            queue_.pop_front();
            dropped_.fetch_add(1);
        }
        queue_.push_back(std::move(job));
    }
    cv_.notify_one();
    return true;
}

std::size_t AsyncFrameWriter::pending() const noexcept {
    std::lock_guard<std::mutex> lock(mtx_);
    return queue_.size();
}

void AsyncFrameWriter::workerLoop() {
    std::unique_lock<std::mutex> lock(mtx_);
    for (;;) {
        cv_.wait(lock, [&] { return !accepting_ || !queue_.empty(); });
        if (queue_.empty()) return; // stop requested, backlog written

        Job job = std::move(queue_.front());
        queue_.pop_front();

        lock.unlock();
        saveJob(job);
        lock.lock();
    }
}

void AsyncFrameWriter::saveJob(const Job& job) {
    const auto t0 = std::chrono::steady_clock::now();
    const bool ok = writeBmp24(job.path, job.pixels.data(), job.width, job.height, job.stride);
    const double ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
    BULB_LOG_HOST("[AsyncFrameWriter] %s %s (%dx%d) in %.3f ms",
                  ok ? "wrote" : "FAILED", job.path.c_str(), job.width, job.height, ms);
}

namespace {
    inline void putLe32(unsigned char* dst, uint32_t v) {
        dst[0] = static_cast<unsigned char>(v);
        dst[1] = static_cast<unsigned char>(v >> 8);
        dst[2] = static_cast<unsigned char>(v >> 16);
        dst[3] = static_cast<unsigned char>(v >> 24);
    }
} // namespace

bool AsyncFrameWriter::writeBmp24(const std::string& path, const uint8_t* src, int w, int h, int stride) {
    const int bytesPerPixel = 3;
    const int rowOut = ((w * bytesPerPixel + 3) / 4) * 4;
    const uint32_t fileHeaderSize = 14;
    const uint32_t infoHeaderSize = 40;
    const uint32_t dataSize = static_cast<uint32_t>(rowOut) * static_cast<uint32_t>(h);
    const uint32_t fileSize = fileHeaderSize + infoHeaderSize + dataSize;

    std::ofstream f(path, std::ios::binary);
    if (!f.is_open()) {
        BULB_LOG_HOST("[AsyncFrameWriter] cannot open path=%s", path.c_str());
        return false;
    }

    unsigned char fileHeader[14] = {'B', 'M'};
    putLe32(fileHeader + 2, fileSize);
    putLe32(fileHeader + 10, fileHeaderSize + infoHeaderSize);
    f.write(reinterpret_cast<char*>(fileHeader), sizeof(fileHeader));

    unsigned char infoHeader[40] = {0};
    putLe32(infoHeader + 0, infoHeaderSize);
    putLe32(infoHeader + 4, static_cast<uint32_t>(w));
    putLe32(infoHeader + 8, static_cast<uint32_t>(h));
    infoHeader[12] = 1;   // planes
    infoHeader[14] = 24;  // bpp
    putLe32(infoHeader + 20, dataSize);
    f.write(reinterpret_cast<char*>(infoHeader), sizeof(infoHeader));

    std::vector<unsigned char> row(static_cast<std::size_t>(rowOut), 0u);
    for (int y = h - 1; y >= 0; --y) {
        const uint8_t* srcRow = src + static_cast<std::size_t>(y) * static_cast<std::size_t>(stride);
        unsigned char* dst = row.data();
        for (int x = 0; x < w; ++x) {
            *dst++ = srcRow[x * 4 + 2];
            *dst++ = srcRow[x * 4 + 1];
            *dst++ = srcRow[x * 4 + 0];
        }
        f.write(reinterpret_cast<char*>(row.data()), rowOut);
        if (!f.good()) {
            BULB_LOG_HOST("[AsyncFrameWriter] write error at y=%d", y);
            return false;
        }
    }
    return true;
}

} // namespace bulb
