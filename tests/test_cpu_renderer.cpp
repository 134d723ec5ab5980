///// Otter: CPU backend tests - pooled render equals the serial row path, pixels match renderPixel.
///// Schneefuchs: Small frames only; the march is the expensive part.
///// Maus: Alpha must be opaque everywhere.
///// Datei: tests/test_cpu_renderer.cpp

#include <gtest/gtest.h>

#include "cpu_renderer.hpp"
#include "frame_buffer.hpp"
#include "pixel_pipeline.hpp"

#include <cstring>
#include <stdexcept>

namespace {
    bulb::CameraState frontView() {
        bulb::CameraState cam;
        cam.setPosition(bulb::make_vec3(0.0f, 0.0f, -4.0f));
        cam.setPower(8.0f);
        cam.setTime(1.25f);
        return cam;
    }
}

TEST(CpuRenderer, PooledMatchesSerial) {
    const bulb::CameraState cam = frontView();

    bulb::FrameBuffer pooled(40, 30);
    bulb::CpuRenderer renderer(4);
    renderer.render(cam, pooled);

    bulb::FrameBuffer serial(40, 30);
    bulb::CpuRenderer::renderRows(bulb::encodeParams(cam, serial.aspect()), serial, 0, serial.height());

    EXPECT_EQ(std::memcmp(pooled.data(), serial.data(), pooled.sizeBytes()), 0);
}

TEST(CpuRenderer, CenterPixelShowsTheBulb) {
    const bulb::CameraState cam = frontView();
    bulb::FrameBuffer fb(32, 32);
    bulb::CpuRenderer renderer(2);
    renderer.render(cam, fb);

    const bulb::FrameParams fp = bulb::decodeParams(bulb::encodeParams(cam, fb.aspect()).slots);
    const bulb::Vec3 dir = bulb::primaryRayDir(fp, 16, 16, 32, 32);
    ASSERT_TRUE(bulb::marchRay(fp.cameraPos, dir, fp.power).hit);

    const bulb::Vec3 expected = bulb::renderPixel(fp, 16, 16, 32, 32);
    const uint8_t* px = fb.pixelPtr(16, 16);
    EXPECT_EQ(px[0], bulb::toByte(expected.x));
    EXPECT_EQ(px[1], bulb::toByte(expected.y));
    EXPECT_EQ(px[2], bulb::toByte(expected.z));
}

TEST(CpuRenderer, CornerPixelIsBackground) {
    const bulb::CameraState cam = frontView();
    bulb::FrameBuffer fb(32, 32);
    bulb::CpuRenderer renderer(2);
    renderer.render(cam, fb);

    const bulb::FrameParams fp = bulb::decodeParams(bulb::encodeParams(cam, fb.aspect()).slots);
    const bulb::Vec3 dir = bulb::primaryRayDir(fp, 0, 0, 32, 32);
    ASSERT_FALSE(bulb::marchRay(fp.cameraPos, dir, fp.power).hit);

    const bulb::Vec3 bg = bulb::background(dir, fp.time);
    const uint8_t* px = fb.pixelPtr(0, 0);
    EXPECT_EQ(px[0], bulb::toByte(bg.x));
    EXPECT_EQ(px[1], bulb::toByte(bg.y));
    EXPECT_EQ(px[2], bulb::toByte(bg.z));
}

TEST(CpuRenderer, AlphaIsOpaque) {
    bulb::FrameBuffer fb(16, 9);
    bulb::CpuRenderer renderer(3);
    renderer.render(bulb::CameraState{}, fb);
    for (int y = 0; y < fb.height(); ++y) {
        for (int x = 0; x < fb.width(); ++x) {
            ASSERT_EQ(fb.pixelPtr(x, y)[3], 255);
        }
    }
}

TEST(CpuRenderer, RepeatedFramesAreIdentical) {
    const bulb::CameraState cam = frontView();
    bulb::CpuRenderer renderer(4);
    bulb::FrameBuffer a(24, 24);
    bulb::FrameBuffer b(24, 24);
    renderer.render(cam, a);
    renderer.render(cam, b);
    EXPECT_EQ(std::memcmp(a.data(), b.data(), a.sizeBytes()), 0);
}

TEST(FrameBuffer, RejectsEmptySize) {
    EXPECT_THROW(bulb::FrameBuffer(0, 10), std::invalid_argument);
    EXPECT_THROW(bulb::FrameBuffer(10, -1), std::invalid_argument);
}
