///// Otter: Frame-Scheduler – Budget-Gating, Resize vor dem Rendern, praezises Schlafen.
///// Schneefuchs: Reihenfolge pro Iteration: Events, Resize, Render, Present, Input-Clear.
///// Maus: Quit-Flag ist die einzige Abbruchstelle; ein begonnener Frame laeuft zu Ende.
///// Datei: src/main_loop.hpp

#pragma once

#include <cstdint>
#include <vector>

#include "console_registry.hpp"
#include "display_surface.hpp"
#include "event_translator.hpp"
#include "frame_compositor.hpp"
#include "frame_limiter.hpp"
#include "frame_stats.hpp"
#include "graphics_device.hpp"
#include "input_state.hpp"
#include "pending_resize.hpp"
#include "render_context.hpp"
#include "resize_coordinator.hpp"
#include "screen_scaler.hpp"
#include "terminal.hpp"

namespace kachel {

struct IterationOutcome {
    bool          hidden        = false; // zero-width window, nothing rendered
    bool          rendered      = false;
    bool          resizeApplied = false;
    bool          resizeFailed  = false;
    std::uint64_t sleptMs       = 0;
    FrameReport   frame;
};

class MainLoop {
public:
    MainLoop(DisplaySurface& surface, GraphicsDevice& gfx, RenderContext& rc, InputState& input,
             ConsoleRegistry& consoles, Terminal& term, pace::Clock& clock);

    MainLoop(const MainLoop&) = delete;
    MainLoop& operator=(const MainLoop&) = delete;

    // Startup + loop until the terminal quits. EXIT_SUCCESS on a clean quit,
    // EXIT_FAILURE when startup fails.
    [[nodiscard]] int run(GameState& game);

    // Console backings and the mandatory initial resize.
    [[nodiscard]] bool startup();

    // Handles one pumped batch: translates events, runs an iteration on each
    // RedrawEventsCleared, stops as soon as the quit flag is seen.
    void processBatch(const std::vector<NativeEvent>& batch, GameState& game);

    // One scheduler iteration ("events cleared").
    IterationOutcome onEventsCleared(GameState& game);

    [[nodiscard]] ResizeSlot&         pendingResize() noexcept { return pending_; }
    [[nodiscard]] const ScreenScaler& scaler() const noexcept { return scaler_; }
    [[nodiscard]] const FrameStats&   stats() const noexcept { return stats_; }
    [[nodiscard]] ResizeCoordinator&  coordinator() noexcept { return coordinator_; }
    [[nodiscard]] EventTranslator&    translator() noexcept { return translator_; }
    [[nodiscard]] std::uint64_t       renderedFrames() const noexcept { return rendered_; }

private:
    void logPacing(std::uint64_t costMs, std::uint64_t budgetMs, std::uint64_t sleptMs);

    DisplaySurface&  surface_;
    RenderContext&   rc_;
    InputState&      input_;
    ConsoleRegistry& consoles_;
    Terminal&        term_;
    pace::Clock&     clock_;

    ScreenScaler      scaler_;
    ResizeSlot        pending_;
    FrameStats        stats_;
    ResizeCoordinator coordinator_;
    EventTranslator   translator_;
    FrameCompositor   compositor_;

    std::uint64_t rendered_ = 0;
};

} // namespace kachel
