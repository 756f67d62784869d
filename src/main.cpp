///// Otter: Demo-Host – Fenster, GL-Geraet, eine Kachel-Konsole, Main-Loop.
///// Schneefuchs: Reihenfolge fix: Config -> Surface -> Device -> Kern -> run(); keine Globals.
///// Maus: S = Scanlines, B = Screen-Burn, F12 = Screenshot, Escape = Ende.
///// Datei: src/main.cpp

#include "pch.hpp"
#include "console_registry.hpp"
#include "frame_limiter.hpp"
#include "gl_graphics_device.hpp"
#include "glfw_surface.hpp"
#include "input_state.hpp"
#include "kachel_log.hpp"
#include "main_loop.hpp"
#include "render_context.hpp"
#include "settings.hpp"
#include "term_config.hpp"
#include "terminal.hpp"
#include "tile_console.hpp"

#include <cstdlib>
#include <memory>
#include <type_traits>
#include <variant>

using namespace kachel;

namespace {

class DemoState final : public GameState {
public:
    DemoState(TileConsole& console, const FontDescriptor& font, bool verbose)
        : console_(console), font_(font), verbose_(verbose) {}

    void tick(Terminal& term) override {
        drainEvents(term);

        const PixelSize grid = console_.charSize();
        if (grid != lastGrid_) {
            KACHEL_LOG_HOST("[DEMO] grid %ux%u (window %ux%u px)",
                            grid.width, grid.height, term.widthPixels(), term.heightPixels());
            lastGrid_ = grid;
        }

        if (const auto key = term.input().lastKey()) {
            switch (*key) {
                case GLFW_KEY_ESCAPE: term.quit(); break;
                case GLFW_KEY_S:      term.postScanlines  = !term.postScanlines;  break;
                case GLFW_KEY_B:      term.postScreenburn = !term.postScreenburn; break;
                case GLFW_KEY_F12:    term.screenshot("kachel_screenshot.bmp"); break;
                default: break;
            }
        }

        paint(term);
    }

private:
    // Structured mode: the application owns the close decision.
    void drainEvents(Terminal& term) {
        while (auto e = term.input().popEvent()) {
            if (std::holds_alternative<event::CloseRequested>(*e)) {
                term.quit();
            }
            if (!verbose_) continue;
            std::visit([](const auto& ev) {
                using T = std::decay_t<decltype(ev)>;
                if constexpr (std::is_same_v<T, event::Resized>) {
                    KACHEL_LOG_HOST("[DEMO] event Resized %dx%d dpi=%.2f", ev.newSize.x, ev.newSize.y, ev.dpiScaleFactor);
                } else if constexpr (std::is_same_v<T, event::KeyboardInput>) {
                    KACHEL_LOG_HOST("[DEMO] event Key key=%d sc=%d pressed=%d", ev.key, ev.scancode, ev.pressed ? 1 : 0);
                } else if constexpr (std::is_same_v<T, event::MouseClick>) {
                    KACHEL_LOG_HOST("[DEMO] event MouseClick button=%zu pressed=%d", ev.button, ev.pressed ? 1 : 0);
                } else if constexpr (std::is_same_v<T, event::CloseRequested>) {
                    KACHEL_LOG_HOST("[DEMO] event CloseRequested");
                } else {
                    KACHEL_LOG_HOST("[DEMO] event");
                }
            }, *e);
        }
    }

    void paint(Terminal& term) {
        const PixelSize grid = console_.charSize();
        console_.cls();
        if (grid.width == 0 || grid.height == 0) return;

        const ColorRGB frame{ 0.0f, 0.55f, 0.55f };
        for (std::uint32_t x = 0; x < grid.width; ++x) {
            console_.set(x, 0, frame);
            console_.set(x, grid.height - 1, frame);
        }
        for (std::uint32_t y = 0; y < grid.height; ++y) {
            console_.set(0, y, frame);
            console_.set(grid.width - 1, y, frame);
        }

        const PointI m = term.input().mouseLogical();
        if (m.x >= 0 && m.y >= 0 && font_.tileWidth && font_.tileHeight) {
            const ColorRGB hot = term.input().leftClick() ? ColorRGB{ 1.0f, 1.0f, 1.0f }
                                                          : ColorRGB{ 1.0f, 0.8f, 0.1f };
            console_.set(static_cast<std::uint32_t>(m.x) / font_.tileWidth,
                         static_cast<std::uint32_t>(m.y) / font_.tileHeight, hot);
        }
    }

    TileConsole&   console_;
    FontDescriptor font_;
    bool           verbose_;
    PixelSize      lastGrid_{};
};

} // namespace

int main(int argc, char** argv)
{
    TerminalConfig cfg;
    if (!parseCommandLine(argc, argv, cfg)) {
        KACHEL_LOG_HOST("[BOOT] some arguments were ignored");
    }
    if (cfg.debug) {
        KACHEL_LOG_HOST("[BOOT] size=%dx%d budget=%d scanlines=%d burn=%d events=%d resizeScaling=%d",
                        cfg.width, cfg.height, cfg.frameSleepMs ? *cfg.frameSleepMs : 0,
                        cfg.postScanlines ? 1 : 0, cfg.postScreenburn ? 1 : 0,
                        cfg.useEvents ? 1 : 0, cfg.resizeScaling ? 1 : 0);
    }

    GlfwSurface surface;
    if (!surface.open(cfg)) {
        KACHEL_LOG_HOST("[FATAL] window/GL initialization failed - aborting");
        return EXIT_FAILURE;
    }

    GlGraphicsDevice gfx;
    if (!gfx.init()) {
        KACHEL_LOG_HOST("[FATAL] graphics device initialization failed - aborting");
        return EXIT_FAILURE;
    }

    RenderContext   rc(cfg);
    InputState      input(cfg.useEvents);
    ConsoleRegistry consoles;

    FontDescriptor font;
    font.tileWidth  = Settings::demoTileWidth;
    font.tileHeight = Settings::demoTileHeight;
    const std::size_t fontIdx = consoles.addFont(font);

    auto console = std::make_unique<TileConsole>(fontIdx,
        static_cast<std::uint32_t>(cfg.width)  / font.tileWidth,
        static_cast<std::uint32_t>(cfg.height) / font.tileHeight);
    TileConsole& consoleRef = *console;
    consoles.addConsole(std::move(console));

    Terminal term(rc, input, consoles, cfg);

    pace::SteadyClock clock;
    MainLoop loop(surface, gfx, rc, input, consoles, term, clock);

    DemoState demo(consoleRef, font, cfg.debug);
    const int exitCode = loop.run(demo);

    KACHEL_LOG_HOST("[EXIT] %s after %llu frames",
                    exitCode == EXIT_SUCCESS ? "Clean shutdown" : "Startup failed",
                    static_cast<unsigned long long>(loop.renderedFrames()));
    Log::flushLogs();
    return exitCode;
}
