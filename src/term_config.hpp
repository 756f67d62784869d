///// Otter: Laufzeit-Konfiguration; Defaults kommen aus Settings, CLI darf ueberschreiben.
///// Schneefuchs: Plain struct, keine Logik ausser parseCommandLine; Header/Source synchron.
///// Maus: frameSleepMs == nullopt bedeutet "uncapped".
///// Datei: src/term_config.hpp

#pragma once

#include <optional>
#include <string>

#include "kachel_types.hpp"
#include "settings.hpp"

namespace kachel {

struct TerminalConfig {
    int         width  = Settings::width;
    int         height = Settings::height;
    std::string title  = Settings::windowTitle;
    bool        vsync  = Settings::preferVSync;

    // Frame budget in ms; std::nullopt renders as fast as events allow.
    std::optional<int> frameSleepMs = Settings::frameSleepMs;

    bool     resizeScaling   = Settings::resizeScaling;
    bool     useEvents       = Settings::useEvents;
    bool     postScanlines   = Settings::postScanlines;
    bool     postScreenburn  = Settings::postScreenburn;
    ColorRGB screenBurnColor{ Settings::screenBurnR, Settings::screenBurnG, Settings::screenBurnB };

    bool debug = false; // "-d": verbose runtime diagnostics in the demo
};

// Applies command line flags on top of cfg. Returns false if any argument was
// not understood (it is logged and skipped, the rest is still applied).
//   -d | --debug, --uncapped, --fps <n>, --scanlines, --screenburn,
//   --events, --no-resize-scaling, --size <w>x<h>
[[nodiscard]] bool parseCommandLine(int argc, const char* const* argv, TerminalConfig& cfg);

} // namespace kachel
