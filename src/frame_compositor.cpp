///// Otter: tock – feste Reihenfolge: Backings, Timing, Rebuild, Bind, Clear, Tick, Draw, Post, Capture.
///// Schneefuchs: Fehlt das Composite-Target, wird direkt ins Default-Target gerendert (einmal geloggt).
///// Maus: Screenshot-Wunsch wird immer geloescht, Erfolg oder nicht.
///// Datei: src/frame_compositor.cpp

#include "frame_compositor.hpp"
#include "frame_capture.hpp"
#include "kachel_log.hpp"
#include "settings.hpp"

#include <vector>

namespace kachel {

FrameReport FrameCompositor::tock(GameState& game, std::uint64_t nowMs) {
    FrameReport report{};

    if (!consoles_.syncBackings()) {
        KACHEL_LOG_HOST("[TOCK] some console backings are missing");
    }

    stats_.onTock(nowMs);
    term_.setFrameTiming(stats_.fps(), stats_.frameTimeMs());

    consoles_.rebuildDirty();

    // Post-processing needs a live composite target; without one we degrade
    // to direct rendering for this frame.
    const bool wantPost = term_.postScanlines;
    CompositeTarget* target = rc_.backingBuffer.get();
    const bool usePost = wantPost && target != nullptr;
    if (wantPost && !target) {
        if (!missingTargetLogged_) {
            KACHEL_LOG_HOST("[TOCK] post-processing requested but no composite target - rendering direct");
            missingTargetLogged_ = true;
        }
    } else if (target) {
        missingTargetLogged_ = false;
    }

    if (usePost) {
        gfx_.bindCompositeTarget(*target);
    } else {
        gfx_.bindDefaultTarget();
    }

    gfx_.clear(0.0f, 0.0f, 0.0f, 1.0f);

    game.tick(term_);

    consoles_.drawAll(gfx_);

    if (rc_.customDraw) {
        rc_.customDraw->draw(gfx_);
    }

    // The callback may have swapped the target out; re-read it.
    target = rc_.backingBuffer.get();
    if (usePost && target) {
        gfx_.bindDefaultTarget();
        PostProcessParams params{};
        // widthPixels/heightPixels are physical, i.e. already scaled pixels.
        params.screenWidth     = static_cast<float>(term_.widthPixels());
        params.screenHeight    = static_cast<float>(term_.heightPixels());
        params.screenBurn      = term_.postScreenburn;
        params.screenBurnColor = term_.screenBurnColor;
        gfx_.drawPostProcess(*target, params);
        report.composited = true;
    }

    if (rc_.screenshotRequest) {
        const std::string path = *rc_.screenshotRequest;
        rc_.screenshotRequest.reset();
        report.screenshotAttempted = true;
        report.screenshotSaved     = captureScreenshot(path);
    }

    return report;
}

bool FrameCompositor::captureScreenshot(const std::string& path) {
    const int w = static_cast<int>(term_.widthPixels());
    const int h = static_cast<int>(term_.heightPixels());
    if (w <= 0 || h <= 0) {
        KACHEL_LOG_HOST("[SCREENSHOT] ERROR: invalid frame size %d x %d for %s", w, h, path.c_str());
        return false;
    }

    std::vector<std::uint8_t> rgba;
    if (!gfx_.readDefaultPixels(PixelSize{ static_cast<std::uint32_t>(w), static_cast<std::uint32_t>(h) }, rgba)) {
        KACHEL_LOG_HOST("[SCREENSHOT] ERROR: read-back failed (%d x %d)", w, h);
        return false;
    }

    FrameCapture::flipVertical(rgba, w, h);

    if (!FrameCapture::writeBmp24(path, w, h, rgba)) {
        KACHEL_LOG_HOST("[SCREENSHOT] ERROR: failed to write %s", path.c_str());
        return false;
    }
    KACHEL_LOG_HOST("[SCREENSHOT] saved %d x %d to %s", w, h, path.c_str());
    return true;
}

} // namespace kachel
