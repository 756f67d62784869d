// Wires the real core against the fakes, the same way main() wires the GL pieces.

#pragma once

#include <memory>
#include <optional>

#include "main_loop.hpp"
#include "test_fakes.hpp"

namespace kachel::test {

inline TerminalConfig makeConfig(bool useEvents, std::optional<int> budgetMs = 33) {
    TerminalConfig cfg;
    cfg.useEvents     = useEvents;
    cfg.frameSleepMs  = budgetMs;
    cfg.resizeScaling = true;
    cfg.postScanlines = false;
    return cfg;
}

struct Harness {
    explicit Harness(const TerminalConfig& c, PixelSize size = PixelSize{ 800, 600 }, double scale = 1.0)
        : cfg(c)
        , surface(size, scale)
        , rc(cfg)
        , input(cfg.useEvents)
        , term(rc, input, consoles, cfg)
        , loop(surface, gfx, rc, input, consoles, term, clock) {
        FontDescriptor font;
        font.tileWidth  = 8;
        font.tileHeight = 8;
        const std::size_t idx = consoles.addFont(font);
        auto c0 = std::make_unique<FakeConsole>(idx, PixelSize{ 80, 50 });
        console = c0.get();
        consoles.addConsole(std::move(c0));
    }

    TerminalConfig     cfg;
    FakeSurface        surface;
    FakeGraphicsDevice gfx;
    RenderContext      rc;
    InputState         input;
    ConsoleRegistry    consoles;
    Terminal           term;
    ManualClock        clock;
    MainLoop           loop;
    FakeConsole*       console = nullptr;
};

} // namespace kachel::test
