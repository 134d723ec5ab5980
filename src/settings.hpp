///// Otter: Central config; every value documented (purpose, range, default).
///// Schneefuchs: No hidden macros; single source of truth for both backends (host + device read the same constants).
///// Maus: Tunables are compile-time constant; ASCII-only logs; sanity checks at the bottom.
///// Datei: src/settings.hpp

#pragma once

// ============================================================================
// Central project settings - fully documented (only active/used switches).
// Policy: All runtime LOG/DEBUG output must be English and ASCII-only.
// Values are stable and compile-time constant. The CUDA kernel and the CPU
// workers include this header, so a change here moves both backends at once.
// ============================================================================

namespace Settings {

// ============================== Raymarcher ===================================

    // MAX_STEPS
    // Upper bound of distance-field samples along one ray.
    // Range: 100 .. 150 | Default: 150
    inline constexpr int   MAX_STEPS = 150;

    // EPSILON
    // Hit threshold: a sample closer than this counts as surface.
    // Range: 1e-4 .. 1e-3 | Default: 0.0005
    inline constexpr float EPSILON = 0.0005f;

    // DAMPING
    // Fraction of the distance estimate actually advanced per step.
    // Range: 0.5 .. 1.0 | Default: 0.8
    inline constexpr float DAMPING = 0.8f;

    // MAX_DISTANCE
    // Distance budget along the ray (camera units) before declaring a miss.
    // Range: 4.0 .. 20.0 | Default: 6.0
    inline constexpr float MAX_DISTANCE = 6.0f;

// ============================== Field evaluator ==============================

    // MAX_ITER
    // Iteration cap of the bulb iteration per field sample.
    // Range: 10 .. 12 | Default: 12
    inline constexpr int   MAX_ITER = 12;

    // BAILOUT
    // Escape radius of the iterate.
    // Range: fixed | Default: 2.0
    inline constexpr float BAILOUT = 2.0f;

    // TRAP_SENTINEL
    // Initial orbit-trap value (no iterate sampled yet).
    inline constexpr float TRAP_SENTINEL = 3.402823466e+38f; // FLT_MAX

    // POWER_MIN / POWER_MAX / POWER_DEFAULT
    // Valid domain of the shape exponent; callers clamp before rendering.
    inline constexpr float POWER_MIN     = 2.0f;
    inline constexpr float POWER_MAX     = 12.0f;
    inline constexpr float POWER_DEFAULT = 2.0f;

// ============================== Normals ======================================

    // NORMAL_EPSILON
    // Central-difference offset along each axis.
    // Range: 1e-4 .. 1e-3 | Default: 0.0005
    inline constexpr float NORMAL_EPSILON = 0.0005f;

// ============================== Shading ======================================

    inline constexpr float SECONDARY_LIGHT_WEIGHT = 0.5f;   // diff2 weight
    inline constexpr float SPECULAR_EXPONENT      = 32.0f;  // Phong exponent
    inline constexpr float SPECULAR_WEIGHT        = 0.5f;   // additive highlight
    inline constexpr float AO_GAMMA               = 0.4f;   // 0.3 .. 0.6
    inline constexpr float AMBIENT_FLOOR          = 0.15f;  // 0.0 .. 0.3
    inline constexpr float BASE_SATURATION        = 0.8f;
    inline constexpr float OCCLUSION_SATURATION   = 0.2f;   // added at full occlusion

    // Hue blend weights (must sum to 1.0).
    inline constexpr float HUE_W_ITER     = 0.4f;
    inline constexpr float HUE_W_NORMAL   = 0.2f;
    inline constexpr float HUE_W_TRAP     = 0.2f;
    inline constexpr float HUE_W_POSITION = 0.2f;

    inline constexpr float HUE_TIME_DRIFT        = 0.1f;   // per second
    inline constexpr float TRAP_HUE_SCALE        = 2.0f;
    inline constexpr float POSITION_HUE_SCALE    = 0.3f;

    // Background (miss) gradient.
    inline constexpr float BG_HUE          = 0.6f;   // blue..violet
    inline constexpr float BG_HUE_DRIFT    = 0.02f;  // per second
    inline constexpr float BG_SATURATION   = 0.5f;
    inline constexpr float BG_VALUE_SCALE  = 0.15f;
    inline constexpr float BG_VALUE_FLOOR  = 0.02f;

// ============================== Start / Window ===============================

    inline constexpr int   width      = 640;   // px
    inline constexpr int   height     = 480;   // px
    inline constexpr int   windowPosX = 100;   // px, <0 => center on primary monitor
    inline constexpr int   windowPosY = 100;   // px

    inline constexpr float initialCameraX = 0.0f;
    inline constexpr float initialCameraY = 0.0f;
    inline constexpr float initialCameraZ = -2.5f;

    // Per-frame camera deltas used by the input mapping.
    inline constexpr float moveSpeed   = 0.05f;  // camera units per frame
    inline constexpr float rotateSpeed = 0.05f;  // radians per frame

    // animateHue
    // Drive CameraState::time from the wall clock (hue drift).
    // Range: {false, true} | Default: true
    inline constexpr bool  animateHue = true;

    // preferVSync
    // Range: {false, true} | Default: true
    inline constexpr bool  preferVSync = true;

// ============================== Backends =====================================

    // preferGpu
    // Start on the CUDA backend when a device is present; --cpu overrides.
    // Range: {false, true} | Default: true
    inline constexpr bool preferGpu = true;

    // cpuWorkerThreads
    // Size of the scanline worker pool; 0 => std::thread::hardware_concurrency().
    // Range: 0 .. 256 | Default: 0
    inline constexpr int  cpuWorkerThreads = 0;

    // CUDA launch geometry (threads per block).
    inline constexpr int  BLOCK_X = 16;   // multiple of 8
    inline constexpr int  BLOCK_Y = 16;

// ============================== Logging / Perf ===============================

    // debugLogging
    // Targeted debug/diagnostic output.
    // Range: {false, true} | Default: false
    inline constexpr bool debugLogging = false;

    // performanceLogging
    // Condensed [PERF] logs along the frame loop.
    // Range: {false, true} | Default: true
    inline constexpr bool performanceLogging = true;

    // PERF_LOG_EVERY
    // Cadence of [PERF] lines in frames.
    inline constexpr int  PERF_LOG_EVERY = 120;

// ============================== Screenshots ==================================

    inline constexpr int  screenshotQueue = 4;   // 1..16 pending BMP jobs

// ============================== Sanity checks ================================

static_assert(MAX_STEPS > 0 && MAX_ITER > 0, "iteration caps must be > 0");
static_assert(EPSILON > 0.0f && NORMAL_EPSILON > 0.0f, "epsilons must be > 0");
static_assert(DAMPING > 0.0f && DAMPING <= 1.0f, "DAMPING must be in (0,1]");
static_assert(POWER_MIN >= 2.0f && POWER_MIN <= POWER_DEFAULT && POWER_DEFAULT <= POWER_MAX,
              "POWER_MIN <= POWER_DEFAULT <= POWER_MAX with POWER_MIN >= 2 required");
static_assert(HUE_W_ITER + HUE_W_NORMAL + HUE_W_TRAP + HUE_W_POSITION > 0.999f &&
              HUE_W_ITER + HUE_W_NORMAL + HUE_W_TRAP + HUE_W_POSITION < 1.001f,
              "hue weights must sum to 1.0");
static_assert(width > 0 && height > 0, "resolution must be positive");
static_assert(BLOCK_X > 0 && BLOCK_Y > 0, "BLOCK dims must be > 0");
static_assert(cpuWorkerThreads >= 0, "cpuWorkerThreads must be >= 0");
static_assert(screenshotQueue > 0, "screenshotQueue must be > 0");

} // namespace Settings
