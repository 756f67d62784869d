///// Otter: FPS/Frametime-Schaetzung im Sekunden-/Millisekundenraster.
///// Schneefuchs: Ganzzahlige Zeitbasis, keine Drift durch Float-Akkumulation.
///// Datei: src/frame_stats.cpp

#include "frame_stats.hpp"

namespace kachel {

void FrameStats::start(std::uint64_t nowMs) noexcept {
    prevSeconds_ = nowMs / 1000u;
    prevMs_      = nowMs;
    frames_      = 0;
}

void FrameStats::onTock(std::uint64_t nowMs) noexcept {
    ++frames_;
    ++totalFrames_;

    const std::uint64_t nowSeconds = nowMs / 1000u;
    if (nowSeconds > prevSeconds_) {
        fps_ = static_cast<float>(frames_) / static_cast<float>(nowSeconds - prevSeconds_);
        frames_      = 0;
        prevSeconds_ = nowSeconds;
        ++fpsUpdates_;
    }

    if (nowMs > prevMs_) {
        frameTimeMs_ = static_cast<float>(nowMs - prevMs_);
        prevMs_      = nowMs;
    }
}

} // namespace kachel
