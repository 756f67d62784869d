///// Otter: Langlebiger Render-Zustand – Composite-Target, Frame-Budget, Screenshot-Wunsch.
///// Schneefuchs: Besitzer ist der Host (main); Kern bekommt Referenzen, keine Globals.
///// Maus: backingBuffer wird nur vom ResizeCoordinator ersetzt.
///// Datei: src/render_context.hpp

#pragma once

#include <algorithm>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "graphics_device.hpp"
#include "term_config.hpp"

namespace kachel {

class CustomDraw;

struct RenderContext {
    explicit RenderContext(const TerminalConfig& cfg)
        : frameSleepMs(cfg.frameSleepMs), resizeScaling(cfg.resizeScaling) {}

    // Frame budget in ms; std::nullopt = uncapped.
    std::optional<int> frameSleepMs;
    bool               resizeScaling = true;

    // Offscreen composite target sized to the physical window.
    std::unique_ptr<CompositeTarget> backingBuffer;

    // Path of a requested screenshot; cleared after the attempt.
    std::optional<std::string> screenshotRequest;

    // Optional application hook for raw draws after the consoles.
    CustomDraw* customDraw = nullptr;

    [[nodiscard]] std::uint64_t budgetMs() const noexcept {
        return frameSleepMs ? static_cast<std::uint64_t>(std::max(0, *frameSleepMs)) : 0u;
    }
};

} // namespace kachel
