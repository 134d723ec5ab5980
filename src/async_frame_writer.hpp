///// Otter: AsyncFrameWriter - screenshots saved as BMP24 on a worker thread; the frame loop never touches disk.
///// Schneefuchs: Queue drops oldest on overflow (bounded latency); stop() drains what is still queued.
///// Maus: Input is the RGBA8 frame layout; alpha is dropped on write. ASCII logs via BULB_LOG_HOST.
///// Datei: src/async_frame_writer.hpp

#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <deque>
#include <string>
#include <thread>
#include <vector>

namespace bulb {

class AsyncFrameWriter {
public:
    explicit AsyncFrameWriter(std::size_t maxQueuedJobs = 4);
    ~AsyncFrameWriter();

    AsyncFrameWriter(const AsyncFrameWriter&) = delete;
    AsyncFrameWriter& operator=(const AsyncFrameWriter&) = delete;

    void start();
    void stop();

    // Enqueue RGBA8 frame; strideBytes >= width*4. Returns immediately (internal copy).
    // Returns false when the writer is not running or the arguments are invalid.
    // A true return means the file is written before stop() returns (unless dropped on overflow).
    bool enqueue(const std::string& path, const uint8_t* rgba8, int width, int height, int strideBytes);

    [[nodiscard]] std::size_t pending() const noexcept;
    [[nodiscard]] std::size_t dropped() const noexcept { return dropped_.load(); }

    // Synchronous BMP24 writer (bottom-up rows, 4-byte row padding).
    static bool writeBmp24(const std::string& path, const uint8_t* rgba8, int w, int h, int stride);

private:
    struct Job {
        std::string path;
        int width  = 0;
        int height = 0;
        int stride = 0;
        std::vector<uint8_t> pixels;
    };

    void workerLoop();
    static void saveJob(const Job& job);

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<Job> queue_;
    std::size_t maxQueue_ = 4;
    bool accepting_ = false;                 // guarded by mtx_; true between start() and stop()
    std::atomic<bool> running_{false};
    std::atomic<std::size_t> dropped_{0};
    std::thread worker_;
};

} // namespace bulb
