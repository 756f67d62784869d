///// Otter: Anwendungs-Handle pro Frame – Quit, Screenshot, Post-Flags, Eingabe, Konsolen.
///// Schneefuchs: Keine Buffer-Swaps und keine Target-Groessen von hier aus.
///// Maus: GameState/CustomDraw sind die beiden Faehigkeiten der Anwendung.
///// Datei: src/terminal.hpp

#pragma once

#include <cstdint>
#include <string>

#include "console_registry.hpp"
#include "input_state.hpp"
#include "kachel_types.hpp"
#include "render_context.hpp"
#include "term_config.hpp"

namespace kachel {

class GraphicsOps;

class Terminal {
public:
    Terminal(RenderContext& rc, InputState& input, ConsoleRegistry& consoles, const TerminalConfig& cfg);

    Terminal(const Terminal&) = delete;
    Terminal& operator=(const Terminal&) = delete;

    // Ends the main loop; the current frame still completes.
    void quit() noexcept { quitting_ = true; }
    [[nodiscard]] bool quitting() const noexcept { return quitting_; }

    [[nodiscard]] float fps()         const noexcept { return fps_; }
    [[nodiscard]] float frameTimeMs() const noexcept { return frameTimeMs_; }
    void setFrameTiming(float fps, float frameTimeMs) noexcept;

    // Physical framebuffer size as last applied by the resize coordinator.
    [[nodiscard]] std::uint32_t widthPixels()  const noexcept { return widthPixels_; }
    [[nodiscard]] std::uint32_t heightPixels() const noexcept { return heightPixels_; }
    void resizePixels(std::uint32_t width, std::uint32_t height) noexcept;

    // Saves the next presented frame as BMP to path.
    void screenshot(const std::string& path);

    [[nodiscard]] InputState&      input()    noexcept { return input_; }
    [[nodiscard]] ConsoleRegistry& consoles() noexcept { return consoles_; }

    // Post-processing, read by the compositor every frame.
    bool     postScanlines  = false;
    bool     postScreenburn = false;
    ColorRGB screenBurnColor;

private:
    RenderContext&   rc_;
    InputState&      input_;
    ConsoleRegistry& consoles_;

    bool          quitting_     = false;
    float         fps_          = 0.0f;
    float         frameTimeMs_  = 0.0f;
    std::uint32_t widthPixels_  = 0;
    std::uint32_t heightPixels_ = 0;
};

// Per-frame application logic.
class GameState {
public:
    virtual ~GameState() = default;
    virtual void tick(Terminal& term) = 0;
};

// Optional raw draw hook, invoked after the consoles have been drawn.
class CustomDraw {
public:
    virtual ~CustomDraw() = default;
    virtual void draw(GraphicsOps& gfx) = 0;
};

} // namespace kachel
