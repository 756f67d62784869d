///// Otter: Resize/Rescale – einziger Pfad, der Viewport und Composite-Target anfasst.
///// Schneefuchs: Reihenfolge ist tragend: Font-Max, DPI, Scaler, Notify, Viewport, Target, Grids.
///// Maus: Null-Groessen werden fuer GPU-Ressourcen auf 1x1 geklemmt.
///// Datei: src/resize_coordinator.hpp

#pragma once

#include "console_registry.hpp"
#include "graphics_device.hpp"
#include "input_state.hpp"
#include "kachel_types.hpp"
#include "render_context.hpp"
#include "screen_scaler.hpp"
#include "terminal.hpp"

namespace kachel {

class ResizeCoordinator {
public:
    ResizeCoordinator(GraphicsDevice& gfx, RenderContext& rc, ScreenScaler& scaler,
                      InputState& input, ConsoleRegistry& consoles, Terminal& term) noexcept
        : gfx_(gfx), rc_(rc), scaler_(scaler), input_(input), consoles_(consoles), term_(term) {}

    // Recomputes geometry and GPU resources for the new physical size/scale.
    // The terminal pixel size and console placement always follow the new
    // framebuffer. notify: also emit a Resized event and, with resize scaling
    // on, re-flow console grids.
    // Returns false when the composite target could not be rebuilt; the old
    // target is gone either way.
    [[nodiscard]] bool apply(PixelSize physical, double dpiScale, bool notify);

    [[nodiscard]] unsigned long long passes() const noexcept { return passes_; }

private:
    GraphicsDevice&  gfx_;
    RenderContext&   rc_;
    ScreenScaler&    scaler_;
    InputState&      input_;
    ConsoleRegistry& consoles_;
    Terminal&        term_;

    unsigned long long passes_ = 0;
};

} // namespace kachel
