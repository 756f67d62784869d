///// Otter: Ein Frame (tock) – Konsolen, Callback, optionaler Post-Pass, Screenshot.
///// Schneefuchs: Nie parallel zu sich selbst oder zum ResizeCoordinator aufgerufen.
///// Maus: Screenshot-Fehler beenden nur den Screenshot, nie den Frame.
///// Datei: src/frame_compositor.hpp

#pragma once

#include <cstdint>
#include <string>

#include "console_registry.hpp"
#include "frame_stats.hpp"
#include "graphics_device.hpp"
#include "render_context.hpp"
#include "terminal.hpp"

namespace kachel {

struct FrameReport {
    bool composited          = false; // post-process pass ran
    bool screenshotAttempted = false;
    bool screenshotSaved     = false;
};

class FrameCompositor {
public:
    FrameCompositor(GraphicsDevice& gfx, RenderContext& rc, ConsoleRegistry& consoles,
                    Terminal& term, FrameStats& stats) noexcept
        : gfx_(gfx), rc_(rc), consoles_(consoles), term_(term), stats_(stats) {}

    FrameReport tock(GameState& game, std::uint64_t nowMs);

private:
    [[nodiscard]] bool captureScreenshot(const std::string& path);

    GraphicsDevice&  gfx_;
    RenderContext&   rc_;
    ConsoleRegistry& consoles_;
    Terminal&        term_;
    FrameStats&      stats_;

    bool missingTargetLogged_ = false;
};

} // namespace kachel
