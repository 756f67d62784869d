///// Otter: ScreenScaler – Snap auf ganze Kacheln, Gutter mittig.
///// Schneefuchs: NaN/<=0-Skalen werden 1.0; Ueberlauf-sicher in double gerechnet.
///// Datei: src/screen_scaler.cpp

#include "screen_scaler.hpp"
#include "kachel_log.hpp"
#include "settings.hpp"

#include <algorithm>
#include <cmath>

namespace kachel {

namespace {
    inline std::uint32_t toLogical(std::uint32_t physical, double scale) noexcept {
        const double l = std::floor(static_cast<double>(physical) / scale);
        const double clamped = std::min(l, static_cast<double>(physical));
        return static_cast<std::uint32_t>(std::max(0.0, clamped));
    }

    inline std::uint32_t snapToTiles(std::uint32_t logical, std::uint32_t tile) noexcept {
        if (tile == 0 || logical < tile) return logical;
        return logical - (logical % tile);
    }
} // namespace

void ScreenScaler::changePhysicalSizeSmooth(PixelSize physical, double scale, PixelSize fontMax) noexcept {
    if (!std::isfinite(scale) || scale <= 0.0) scale = 1.0;

    physical_ = physical;
    scale_    = scale;
    logical_  = PixelSize{ toLogical(physical.width, scale), toLogical(physical.height, scale) };

    available_ = PixelSize{ snapToTiles(logical_.width,  fontMax.width),
                            snapToTiles(logical_.height, fontMax.height) };

    gutterLeft_ = (logical_.width  - available_.width)  / 2;
    gutterTop_  = (logical_.height - available_.height) / 2;

    if constexpr (Settings::debugLogging) {
        KACHEL_LOG_HOST("[SCALER] physical=%ux%u scale=%.3f logical=%ux%u available=%ux%u gutter=%u,%u",
                        physical_.width, physical_.height, scale_,
                        logical_.width, logical_.height,
                        available_.width, available_.height, gutterLeft_, gutterTop_);
    }
}

} // namespace kachel
