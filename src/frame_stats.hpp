///// Otter: Frame-Timing – FPS einmal pro voller Sekunde, Frametime pro vergangener Millisekunde.
///// Schneefuchs: Zeitbasis sind Millisekunden seit Loop-Start (injiziert, testbar).
///// Maus: lastTockMs() ist gleichzeitig die Referenz fuer das Frame-Budget im Scheduler.
///// Datei: src/frame_stats.hpp

#pragma once

#include <cstdint>

namespace kachel {

class FrameStats {
public:
    // Resets the reference instants to nowMs (loop start).
    void start(std::uint64_t nowMs) noexcept;

    // Counts one rendered frame at nowMs. The FPS estimate is recomputed only
    // when a new whole second has begun since the last recomputation:
    // fps = frames since then / whole seconds elapsed. The frame time is
    // recomputed only when at least one whole millisecond has passed.
    void onTock(std::uint64_t nowMs) noexcept;

    [[nodiscard]] float         fps()          const noexcept { return fps_; }
    [[nodiscard]] float         frameTimeMs()  const noexcept { return frameTimeMs_; }
    [[nodiscard]] std::uint64_t lastTockMs()   const noexcept { return prevMs_; }
    [[nodiscard]] std::uint64_t totalFrames()  const noexcept { return totalFrames_; }
    [[nodiscard]] std::uint64_t fpsUpdates()   const noexcept { return fpsUpdates_; }

private:
    std::uint64_t prevSeconds_ = 0;
    std::uint64_t prevMs_      = 0;
    std::uint64_t frames_      = 0;
    std::uint64_t totalFrames_ = 0;
    std::uint64_t fpsUpdates_  = 0;
    float         fps_         = 0.0f;
    float         frameTimeMs_ = 0.0f;
};

} // namespace kachel
