///// Otter: Main loop; budget pacing with spin sleep; resize coalesced to one pass per frame.
///// Schneefuchs: Startup-Resize ist fatal, In-Loop-Resize degradiert (Frame wird ausgelassen).
///// Maus: Sparse pacing log; one line per event class; ASCII-only.
///// Datei: src/main_loop.cpp

#include "main_loop.hpp"
#include "kachel_log.hpp"
#include "settings.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <variant>

namespace kachel {

MainLoop::MainLoop(DisplaySurface& surface, GraphicsDevice& gfx, RenderContext& rc, InputState& input,
                   ConsoleRegistry& consoles, Terminal& term, pace::Clock& clock)
    : surface_(surface)
    , rc_(rc)
    , input_(input)
    , consoles_(consoles)
    , term_(term)
    , clock_(clock)
    , coordinator_(gfx, rc, scaler_, input, consoles, term)
    , translator_(surface.windowId(), surface, input, term, pending_, coordinator_)
    , compositor_(gfx, rc, consoles, term, stats_) {}

bool MainLoop::startup() {
    if (!consoles_.syncBackings()) {
        KACHEL_LOG_HOST("[FATAL] console backings could not be created");
        return false;
    }

    // The window may already differ from the requested size (tiling WMs, X11).
    const PixelSize inner = surface_.innerSize();
    const double    scale = surface_.scaleFactor();
    if (!coordinator_.apply(inner, scale, true)) {
        KACHEL_LOG_HOST("[FATAL] startup resize %ux%u scale=%.3f failed", inner.width, inner.height, scale);
        return false;
    }

    stats_.start(clock_.elapsedMs());
    KACHEL_LOG_HOST("[LOOP] started physical=%ux%u scale=%.3f available=%ux%u budget=%llums",
                    inner.width, inner.height, scale,
                    scaler_.availableWidth(), scaler_.availableHeight(),
                    static_cast<unsigned long long>(rc_.budgetMs()));
    return true;
}

int MainLoop::run(GameState& game) {
    if (!startup()) return EXIT_FAILURE;

    std::vector<NativeEvent> batch;
    while (!term_.quitting()) {
        batch.clear();
        surface_.pumpEvents(batch);
        processBatch(batch, game);
    }

    KACHEL_LOG_HOST("[LOOP] quit after %llu frames", static_cast<unsigned long long>(rendered_));
    return EXIT_SUCCESS;
}

void MainLoop::processBatch(const std::vector<NativeEvent>& batch, GameState& game) {
    for (const NativeEvent& ev : batch) {
        if (term_.quitting()) return;
        if (std::holds_alternative<native::RedrawEventsCleared>(ev.payload)) {
            (void)onEventsCleared(game);
        } else {
            (void)translator_.translate(ev);
        }
    }
}

IterationOutcome MainLoop::onEventsCleared(GameState& game) {
    IterationOutcome out{};
    const std::uint64_t frameStart = clock_.elapsedMs();
    const std::uint64_t budget     = rc_.budgetMs();

    if (surface_.innerSize().width == 0) {
        out.hidden = true;
    } else {
        const std::uint64_t elapsed = frameStart - std::min(frameStart, stats_.lastTockMs());
        if (elapsed >= budget) {
            // Render at the settled geometry, never an intermediate one.
            if (auto resize = pending_.take()) {
                if (coordinator_.apply(resize->physicalSize, resize->dpiScale, resize->notify)) {
                    out.resizeApplied = true;
                } else {
                    KACHEL_LOG_HOST("[LOOP] resize %ux%u failed - skipping frame",
                                    resize->physicalSize.width, resize->physicalSize.height);
                    out.resizeFailed = true;
                }
            }

            if (!out.resizeFailed) {
                out.frame = compositor_.tock(game, clock_.elapsedMs());
                surface_.swapBuffers();
                input_.clearFrameState();
                out.rendered = true;
                ++rendered_;
            }
        }
    }

    const std::uint64_t now  = clock_.elapsedMs();
    const std::uint64_t cost = now - std::min(now, frameStart);
    if (cost < budget) {
        const std::uint64_t delay = std::min<std::uint64_t>(static_cast<std::uint64_t>(Settings::maxSleepMs),
                                                            budget - cost);
        clock_.sleepFor(std::chrono::milliseconds(static_cast<long long>(delay)));
        out.sleptMs = delay;
    }

    if (out.rendered) logPacing(cost, budget, out.sleptMs);
    return out;
}

void MainLoop::logPacing(std::uint64_t costMs, std::uint64_t budgetMs, std::uint64_t sleptMs) {
    if constexpr (Settings::performanceLogging) {
        if (rendered_ % static_cast<std::uint64_t>(Settings::perfLogEvery) == 0) {
            KACHEL_LOG_HOST("[FPS] frame=%llu fps=%.1f frame=%.1fms cost=%llums budget=%llums sleep=%llums",
                            static_cast<unsigned long long>(rendered_),
                            static_cast<double>(stats_.fps()),
                            static_cast<double>(stats_.frameTimeMs()),
                            static_cast<unsigned long long>(costMs),
                            static_cast<unsigned long long>(budgetMs),
                            static_cast<unsigned long long>(sleptMs));
        }
    } else {
        (void)costMs; (void)budgetMs; (void)sleptMs;
    }
}

} // namespace kachel
