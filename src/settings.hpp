///// Otter: Central config; every value documented (purpose, range, default).
///// Schneefuchs: No hidden macros; single source of truth for compile-time defaults.
///// Maus: Runtime copies live in TerminalConfig; logs ASCII-only.
///// Datei: src/settings.hpp

#pragma once

// ============================================================================
// Central project settings – compile-time defaults for the terminal core.
// Policy: All runtime LOG/DEBUG output must be English and ASCII-only.
// Runtime-adjustable values are copied into TerminalConfig at startup.
// ============================================================================

namespace kachel::Settings {

// ============================== Logging / Perf ===============================

    // debugLogging
    // Targeted diagnostic output (event translation, resize steps, GL objects).
    // Range: {false, true} | Default: false
    inline constexpr bool debugLogging = false;

    // performanceLogging
    // Condensed [FPS]/[LOOP] pacing logs every perfLogEvery rendered frames.
    // Range: {false, true} | Default: true
    inline constexpr bool performanceLogging = true;

    // perfLogEvery
    // Cadence of the pacing log in rendered frames.
    // Range: 30..600 | Default: 120
    inline constexpr int perfLogEvery = 120;

// ============================== Framerate / VSync ============================

    // frameSleepMs
    // Target frame budget in milliseconds (33 ms ~ 30 Hz).
    // Range: 1..1000 | Default: 33
    inline constexpr int frameSleepMs = 33;

    // maxSleepMs
    // Upper bound for a single post-frame sleep, regardless of the budget.
    // Range: 1..1000 | Default: 33
    inline constexpr int maxSleepMs = 33;

    // preferVSync
    // Swap interval 1 when true; the frame budget still gates rendering.
    // Range: {false, true} | Default: false
    inline constexpr bool preferVSync = false;

// ============================== Terminal behaviour ===========================

    // resizeScaling
    // Recompute console grid dimensions from the available area after a resize.
    // Range: {false, true} | Default: true
    inline constexpr bool resizeScaling = true;

    // useEvents
    // Structured event handling: queue application events and deliver
    // CloseRequested instead of quitting immediately.
    // Range: {false, true} | Default: false
    inline constexpr bool useEvents = false;

// ============================== Post-processing ==============================

    inline constexpr bool  postScanlines   = false;  // {false,true}
    inline constexpr bool  postScreenburn  = false;  // {false,true}
    inline constexpr float screenBurnR     = 0.0f;   // 0..1
    inline constexpr float screenBurnG     = 1.0f;   // 0..1
    inline constexpr float screenBurnB     = 1.0f;   // 0..1

// ============================== Start / Window ===============================

    inline constexpr int         width       = 800;  // px
    inline constexpr int         height      = 600;  // px
    inline constexpr const char* windowTitle = "Kachel Terminal";

    // Tile size of the demo font (the font pipeline itself lives elsewhere).
    inline constexpr int demoTileWidth  = 8;   // px
    inline constexpr int demoTileHeight = 8;   // px

// ============================== Sanity checks ================================

static_assert(frameSleepMs > 0, "frameSleepMs must be > 0");
static_assert(maxSleepMs > 0, "maxSleepMs must be > 0");
static_assert(perfLogEvery > 0, "perfLogEvery must be > 0");
static_assert(width > 0 && height > 0, "window size must be positive");
static_assert(demoTileWidth > 0 && demoTileHeight > 0, "tile size must be positive");

} // namespace kachel::Settings
