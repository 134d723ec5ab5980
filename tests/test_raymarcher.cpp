///// Otter: Raymarcher + normal tests - center hit at power 8, far miss, determinism, unit normals.
///// Schneefuchs: Pure functions; every assertion compares host results only.
///// Maus: Bitwise equality for the determinism check (memcmp over the whole RayHit payload).
///// Datei: tests/test_raymarcher.cpp

#include <gtest/gtest.h>

#include "pixel_pipeline.hpp"
#include "raymarcher.hpp"
#include "settings.hpp"

#include <cmath>

using bulb::make_vec3;
using bulb::marchRay;

TEST(Raymarcher, CenterRayFromMinusFourHitsPowerEight) {
    const bulb::RayHit hit = marchRay(make_vec3(0.0f, 0.0f, -4.0f), make_vec3(0.0f, 0.0f, 1.0f), 8.0f);
    ASSERT_TRUE(hit.hit);
    EXPECT_LT(hit.steps, static_cast<unsigned>(Settings::MAX_STEPS));
    EXPECT_LT(hit.sample.distance, Settings::EPSILON);
    // Surface of the power-8 bulb on the -z axis lies a little inside radius 1.
    EXPECT_GT(hit.position.z, -1.2f);
    EXPECT_LT(hit.position.z, -0.5f);
}

TEST(Raymarcher, OffsetRayFarOutsideMisses) {
    const bulb::RayHit hit = marchRay(make_vec3(3.0f, 0.0f, -100.0f), make_vec3(0.0f, 0.0f, 1.0f), 8.0f);
    EXPECT_FALSE(hit.hit);
}

TEST(Raymarcher, RayPointingAwayMisses) {
    const bulb::RayHit hit = marchRay(make_vec3(0.0f, 0.0f, -2.5f), make_vec3(0.0f, 0.0f, -1.0f), 8.0f);
    EXPECT_FALSE(hit.hit);
    EXPECT_LE(hit.steps, static_cast<unsigned>(Settings::MAX_STEPS));
}

TEST(Raymarcher, MarchingTwiceGivesIdenticalResult) {
    const bulb::Vec3 o = make_vec3(0.1f, 0.2f, -2.5f);
    const bulb::Vec3 d = bulb::normalize(make_vec3(-0.05f, -0.08f, 1.0f));
    for (float power : {2.0f, 5.0f, 8.0f, 12.0f}) {
        const bulb::RayHit a = marchRay(o, d, power);
        const bulb::RayHit b = marchRay(o, d, power);
        EXPECT_EQ(a.hit, b.hit);
        EXPECT_EQ(a.steps, b.steps);
        EXPECT_EQ(a.position.x, b.position.x);
        EXPECT_EQ(a.position.y, b.position.y);
        EXPECT_EQ(a.position.z, b.position.z);
        EXPECT_EQ(a.sample.distance, b.sample.distance);
        EXPECT_EQ(a.sample.iterations, b.sample.iterations);
        EXPECT_EQ(a.sample.trap, b.sample.trap);
    }
}

TEST(Raymarcher, HitTrapIsMinimumOverTheMarch) {
    const bulb::RayHit hit = marchRay(make_vec3(0.0f, 0.0f, -4.0f), make_vec3(0.0f, 0.0f, 1.0f), 8.0f);
    ASSERT_TRUE(hit.hit);
    // The hit point lies inside the bailout radius, so its own orbit already samples |position|.
    EXPECT_LE(hit.sample.trap, bulb::length(hit.position) + 1e-6f);
}

TEST(NormalEstimator, NormalsAtHitPointsAreUnitLength) {
    const bulb::Vec3 origin = make_vec3(0.0f, 0.0f, -2.5f);
    int hits = 0;
    for (int j = -3; j <= 3; ++j) {
        for (int i = -3; i <= 3; ++i) {
            const bulb::Vec3 d = bulb::normalize(make_vec3(0.08f * i, 0.08f * j, 1.0f));
            for (float power : {2.0f, 8.0f}) {
                const bulb::RayHit hit = marchRay(origin, d, power);
                if (!hit.hit) continue;
                ++hits;
                const bulb::Vec3 n = bulb::estimateNormal(hit.position, power);
                EXPECT_NEAR(bulb::length(n), 1.0f, 1e-4f);
            }
        }
    }
    EXPECT_GT(hits, 0);
}

TEST(NormalEstimator, CenterHitNormalFacesTheCamera) {
    const bulb::RayHit hit = marchRay(make_vec3(0.0f, 0.0f, -4.0f), make_vec3(0.0f, 0.0f, 1.0f), 8.0f);
    ASSERT_TRUE(hit.hit);
    const bulb::Vec3 n = bulb::estimateNormal(hit.position, 8.0f);
    EXPECT_LT(n.z, 0.0f);
}

TEST(PixelPipeline, CenterPixelOfDefaultFrameLooksDownPlusZ) {
    bulb::FrameParams fp{};
    fp.cameraPos = make_vec3(0.0f, 0.0f, -4.0f);
    fp.power  = 8.0f;
    fp.aspect = 640.0f / 480.0f;
    const bulb::Vec3 d = bulb::primaryRayDir(fp, 320, 240, 640, 480);
    EXPECT_NEAR(d.x, 0.0f, 1e-6f);
    EXPECT_NEAR(d.y, 0.0f, 1e-6f);
    EXPECT_NEAR(d.z, 1.0f, 1e-6f);

    const bulb::RayHit hit = marchRay(fp.cameraPos, d, fp.power);
    EXPECT_TRUE(hit.hit);
    EXPECT_LT(hit.steps, static_cast<unsigned>(Settings::MAX_STEPS));
}

TEST(PixelPipeline, TopRowLooksUpAndYawTurnsRight) {
    bulb::FrameParams fp{};
    fp.cameraPos = make_vec3(0.0f, 0.0f, -2.5f);
    fp.power  = 2.0f;
    fp.aspect = 1.0f;
    EXPECT_GT(bulb::primaryRayDir(fp, 50, 0, 100, 100).y, 0.0f);
    EXPECT_LT(bulb::primaryRayDir(fp, 50, 99, 100, 100).y, 0.0f);

    fp.yaw = 0.5f;
    EXPECT_GT(bulb::primaryRayDir(fp, 50, 50, 100, 100).x, 0.0f);
}
