///// Otter: Compositor tests - background monotone in view y, channel ranges, AO proxy, HSV sectors.
///// Schneefuchs: Host-only; hits come from the real marcher so shading sees realistic inputs.
///// Maus: Monotonicity checked per channel over a dense sweep at several times.
///// Datei: tests/test_color_compositor.cpp

#include <gtest/gtest.h>

#include "color_compositor.hpp"
#include "pixel_pipeline.hpp"
#include "settings.hpp"

using bulb::make_vec3;

namespace {
    void expectInUnitRange(const bulb::Vec3& c) {
        EXPECT_GE(c.x, 0.0f); EXPECT_LE(c.x, 1.0f);
        EXPECT_GE(c.y, 0.0f); EXPECT_LE(c.y, 1.0f);
        EXPECT_GE(c.z, 0.0f); EXPECT_LE(c.z, 1.0f);
    }
}

TEST(ColorCompositor, BackgroundIsMonotoneInViewY) {
    for (float time : {0.0f, 3.7f, 42.0f}) {
        bulb::Vec3 prev = bulb::background(make_vec3(0.0f, -1.0f, 0.0f), time);
        for (int i = 1; i <= 200; ++i) {
            const float y = -1.0f + 2.0f * static_cast<float>(i) / 200.0f;
            const bulb::Vec3 c = bulb::background(make_vec3(0.0f, y, 0.0f), time);
            EXPECT_GE(c.x, prev.x);
            EXPECT_GE(c.y, prev.y);
            EXPECT_GE(c.z, prev.z);
            prev = c;
        }
        const bulb::Vec3 lo = bulb::background(make_vec3(0.0f, -1.0f, 0.0f), time);
        const bulb::Vec3 hi = bulb::background(make_vec3(0.0f,  1.0f, 0.0f), time);
        EXPECT_GT(hi.x + hi.y + hi.z, lo.x + lo.y + lo.z);
    }
}

TEST(ColorCompositor, BackgroundIsDim) {
    const bulb::Vec3 c = bulb::background(make_vec3(0.0f, 1.0f, 0.0f), 0.0f);
    expectInUnitRange(c);
    EXPECT_LE(c.x, Settings::BG_VALUE_SCALE + Settings::BG_VALUE_FLOOR + 1e-6f);
    EXPECT_LE(c.y, Settings::BG_VALUE_SCALE + Settings::BG_VALUE_FLOOR + 1e-6f);
    EXPECT_LE(c.z, Settings::BG_VALUE_SCALE + Settings::BG_VALUE_FLOOR + 1e-6f);
}

TEST(ColorCompositor, OcclusionFallsWithSteps) {
    EXPECT_FLOAT_EQ(bulb::occlusionFromSteps(0), 1.0f);
    EXPECT_NEAR(bulb::occlusionFromSteps(static_cast<unsigned>(Settings::MAX_STEPS)), 0.0f, 1e-6f);
    EXPECT_GT(bulb::occlusionFromSteps(10), bulb::occlusionFromSteps(60));
}

TEST(ColorCompositor, BlendedHueIsWrappedIntoUnitInterval) {
    bulb::FieldSample s{};
    s.iterations = 7;
    s.trap = 0.9f;
    for (float time : {0.0f, 1.0f, 123.4f}) {
        const float h = bulb::blendHue(s, make_vec3(0.0f, 1.0f, 0.0f), make_vec3(-3.0f, -2.0f, -4.0f), time);
        EXPECT_GE(h, 0.0f);
        EXPECT_LT(h, 1.0f);
    }
}

TEST(ColorCompositor, ShadedHitsStayInUnitRange) {
    bulb::FrameParams fp{};
    fp.cameraPos = make_vec3(0.0f, 0.0f, -2.5f);
    fp.aspect = 4.0f / 3.0f;
    int shaded = 0;
    for (float power : {2.0f, 8.0f, 12.0f}) {
        fp.power = power;
        fp.time  = power * 0.7f;
        for (int y = 0; y < 48; y += 4) {
            for (int x = 0; x < 64; x += 4) {
                const bulb::Vec3 d = bulb::primaryRayDir(fp, x, y, 64, 48);
                const bulb::RayHit hit = bulb::marchRay(fp.cameraPos, d, fp.power);
                if (!hit.hit) continue;
                ++shaded;
                expectInUnitRange(bulb::shadeHit(hit, d, fp.power, fp.time));
            }
        }
    }
    EXPECT_GT(shaded, 0);
}

TEST(HsvToRgb, PrimarySectorsAndGray) {
    const bulb::Vec3 red = bulb::hsvToRgb(0.0f, 1.0f, 1.0f);
    EXPECT_FLOAT_EQ(red.x, 1.0f); EXPECT_FLOAT_EQ(red.y, 0.0f); EXPECT_FLOAT_EQ(red.z, 0.0f);

    const bulb::Vec3 green = bulb::hsvToRgb(1.0f / 3.0f, 1.0f, 1.0f);
    EXPECT_NEAR(green.x, 0.0f, 1e-5f); EXPECT_NEAR(green.y, 1.0f, 1e-5f); EXPECT_NEAR(green.z, 0.0f, 1e-5f);

    const bulb::Vec3 gray = bulb::hsvToRgb(0.42f, 0.0f, 0.5f);
    EXPECT_FLOAT_EQ(gray.x, 0.5f); EXPECT_FLOAT_EQ(gray.y, 0.5f); EXPECT_FLOAT_EQ(gray.z, 0.5f);

    const bulb::Vec3 wrapped = bulb::hsvToRgb(1.0f, 1.0f, 1.0f);
    EXPECT_FLOAT_EQ(wrapped.x, 1.0f);
}

TEST(HsvToRgb, QuantizerRoundsHalfUpAndClamps) {
    EXPECT_EQ(bulb::toByte(-0.5f), 0);
    EXPECT_EQ(bulb::toByte(0.0f), 0);
    EXPECT_EQ(bulb::toByte(1.0f), 255);
    EXPECT_EQ(bulb::toByte(2.0f), 255);
    EXPECT_EQ(bulb::toByte(0.5f), 128);
}
