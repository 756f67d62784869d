///// Otter: Terminal-Handle – duenne Fassade ueber RenderContext/InputState/Registry.
///// Datei: src/terminal.cpp

#include "terminal.hpp"
#include "kachel_log.hpp"
#include "settings.hpp"

namespace kachel {

Terminal::Terminal(RenderContext& rc, InputState& input, ConsoleRegistry& consoles, const TerminalConfig& cfg)
    : postScanlines(cfg.postScanlines)
    , postScreenburn(cfg.postScreenburn)
    , screenBurnColor(cfg.screenBurnColor)
    , rc_(rc)
    , input_(input)
    , consoles_(consoles) {
    input_.setUseEvents(cfg.useEvents);
}

void Terminal::setFrameTiming(float fps, float frameTimeMs) noexcept {
    fps_         = fps;
    frameTimeMs_ = frameTimeMs;
}

void Terminal::resizePixels(std::uint32_t width, std::uint32_t height) noexcept {
    widthPixels_  = width;
    heightPixels_ = height;
}

void Terminal::screenshot(const std::string& path) {
    if constexpr (Settings::debugLogging) {
        KACHEL_LOG_HOST("[SCREENSHOT] requested path=%s", path.c_str());
    }
    rc_.screenshotRequest = path;
}

} // namespace kachel
