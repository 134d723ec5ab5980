///// Otter: Screenshot writer tests - BMP24 header fields, BGR swizzle, bottom-up rows, padding, drain on stop.
///// Schneefuchs: Files go to the system temp dir and are removed afterwards.
///// Maus: Parsed back byte-wise; no image library involved.
///// Datei: tests/test_async_frame_writer.cpp

#include <gtest/gtest.h>

#include "async_frame_writer.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <thread>
#include <vector>

namespace {

std::vector<uint8_t> readAll(const std::filesystem::path& p) {
    std::ifstream f(p, std::ios::binary);
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}

uint32_t le32(const std::vector<uint8_t>& b, std::size_t off) {
    return static_cast<uint32_t>(b[off]) | (static_cast<uint32_t>(b[off + 1]) << 8)
         | (static_cast<uint32_t>(b[off + 2]) << 16) | (static_cast<uint32_t>(b[off + 3]) << 24);
}

std::filesystem::path tempFile(const char* name) {
    return std::filesystem::temp_directory_path() / name;
}

} // namespace

TEST(AsyncFrameWriter, WritesPaddedBottomUpBgr) {
    // 3x2 RGBA: row 0 red/green/blue, row 1 white/black/gray.
    const uint8_t rgba[] = {
        255, 0, 0, 255,    0, 255, 0, 255,    0, 0, 255, 255,
        255, 255, 255, 255, 0, 0, 0, 255,     128, 128, 128, 255,
    };
    const auto path = tempFile("bulbmarch_test_writer_a.bmp");
    ASSERT_TRUE(bulb::AsyncFrameWriter::writeBmp24(path.string(), rgba, 3, 2, 12));

    const std::vector<uint8_t> b = readAll(path);
    const std::size_t rowOut = 12; // 9 bytes padded to 12
    ASSERT_EQ(b.size(), 54u + rowOut * 2);
    EXPECT_EQ(b[0], 'B');
    EXPECT_EQ(b[1], 'M');
    EXPECT_EQ(le32(b, 2), b.size());
    EXPECT_EQ(le32(b, 10), 54u);
    EXPECT_EQ(le32(b, 18), 3u);
    EXPECT_EQ(le32(b, 22), 2u);
    EXPECT_EQ(b[28], 24);
    EXPECT_EQ(le32(b, 34), rowOut * 2);

    // First stored row is the bottom image row (white, black, gray).
    const uint8_t* r0 = b.data() + 54;
    EXPECT_EQ(r0[0], 255); EXPECT_EQ(r0[1], 255); EXPECT_EQ(r0[2], 255);
    EXPECT_EQ(r0[3], 0);   EXPECT_EQ(r0[4], 0);   EXPECT_EQ(r0[5], 0);
    EXPECT_EQ(r0[6], 128); EXPECT_EQ(r0[7], 128); EXPECT_EQ(r0[8], 128);
    EXPECT_EQ(r0[9], 0);   EXPECT_EQ(r0[10], 0);  EXPECT_EQ(r0[11], 0);

    // Top row, swizzled to BGR.
    const uint8_t* r1 = r0 + rowOut;
    EXPECT_EQ(r1[0], 0);   EXPECT_EQ(r1[1], 0);   EXPECT_EQ(r1[2], 255); // red
    EXPECT_EQ(r1[3], 0);   EXPECT_EQ(r1[4], 255); EXPECT_EQ(r1[5], 0);   // green
    EXPECT_EQ(r1[6], 255); EXPECT_EQ(r1[7], 0);   EXPECT_EQ(r1[8], 0);   // blue

    std::filesystem::remove(path);
}

TEST(AsyncFrameWriter, HonoursSourceStride) {
    // 1x2 with 8-byte stride; the padding bytes must not leak into the file.
    const uint8_t rgba[] = {
        10, 20, 30, 255,  99, 99, 99, 99,
        40, 50, 60, 255,  99, 99, 99, 99,
    };
    const auto path = tempFile("bulbmarch_test_writer_b.bmp");
    ASSERT_TRUE(bulb::AsyncFrameWriter::writeBmp24(path.string(), rgba, 1, 2, 8));
    const std::vector<uint8_t> b = readAll(path);
    ASSERT_EQ(b.size(), 54u + 4u * 2u);
    EXPECT_EQ(b[54], 60); EXPECT_EQ(b[55], 50); EXPECT_EQ(b[56], 40); EXPECT_EQ(b[57], 0);
    EXPECT_EQ(b[58], 30); EXPECT_EQ(b[59], 20); EXPECT_EQ(b[60], 10); EXPECT_EQ(b[61], 0);
    std::filesystem::remove(path);
}

TEST(AsyncFrameWriter, RejectsWhenStoppedOrInvalid) {
    bulb::AsyncFrameWriter writer(2);
    const uint8_t px[4] = {1, 2, 3, 255};
    EXPECT_FALSE(writer.enqueue(tempFile("bulbmarch_never.bmp").string(), px, 1, 1, 4));

    writer.start();
    EXPECT_FALSE(writer.enqueue(tempFile("bulbmarch_never.bmp").string(), px, 1, 1, 2));
    EXPECT_FALSE(writer.enqueue(tempFile("bulbmarch_never.bmp").string(), nullptr, 1, 1, 4));
    writer.stop();
    EXPECT_FALSE(std::filesystem::exists(tempFile("bulbmarch_never.bmp")));
}

TEST(AsyncFrameWriter, StopDrainsQueuedJobs) {
    std::vector<uint8_t> frame(8 * 8 * 4, 200);
    std::vector<std::filesystem::path> paths;
    {
        bulb::AsyncFrameWriter writer(16);
        writer.start();
        for (int i = 0; i < 5; ++i) {
            paths.push_back(tempFile(("bulbmarch_test_drain_" + std::to_string(i) + ".bmp").c_str()));
            ASSERT_TRUE(writer.enqueue(paths.back().string(), frame.data(), 8, 8, 32));
        }
        writer.stop();
        EXPECT_EQ(writer.pending(), 0u);
        EXPECT_EQ(writer.dropped(), 0u);
    }
    for (const auto& p : paths) {
        EXPECT_TRUE(std::filesystem::exists(p)) << p;
        EXPECT_EQ(std::filesystem::file_size(p), 54u + 24u * 8u);
        std::filesystem::remove(p);
    }
}

TEST(AsyncFrameWriter, AcceptedJobsSurviveConcurrentStop) {
    constexpr int kThreads = 4;
    constexpr int kPerThread = 20;
    const uint8_t px[4] = {7, 8, 9, 255};

    bulb::AsyncFrameWriter writer(kThreads * kPerThread);
    writer.start();

    std::vector<std::vector<std::filesystem::path>> accepted(kThreads);
    std::vector<std::vector<std::filesystem::path>> refused(kThreads);
    std::vector<std::thread> producers;
    for (int t = 0; t < kThreads; ++t) {
        producers.emplace_back([&, t] {
            for (int i = 0; i < kPerThread; ++i) {
                const auto p = tempFile(("bulbmarch_test_race_" + std::to_string(t) + "_" +
                                         std::to_string(i) + ".bmp").c_str());
                std::filesystem::remove(p);
                if (writer.enqueue(p.string(), px, 1, 1, 4)) accepted[static_cast<std::size_t>(t)].push_back(p);
                else                                         refused[static_cast<std::size_t>(t)].push_back(p);
            }
        });
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
    writer.stop();
    for (auto& th : producers) th.join();

    EXPECT_EQ(writer.dropped(), 0u);
    for (int t = 0; t < kThreads; ++t) {
        for (const auto& p : accepted[static_cast<std::size_t>(t)]) {
            EXPECT_TRUE(std::filesystem::exists(p)) << p;
            std::filesystem::remove(p);
        }
        for (const auto& p : refused[static_cast<std::size_t>(t)]) {
            EXPECT_FALSE(std::filesystem::exists(p)) << p;
        }
    }
}
