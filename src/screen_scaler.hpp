///// Otter: Abgeleitete Geometrie – physische Groesse, DPI, verfuegbare logische Flaeche.
///// Schneefuchs: Deterministisch aus (physical, scale, tile); idempotent, kein Verlauf.
///// Maus: available <= physical immer; Restflaeche (Gutter) zentriert.
///// Datei: src/screen_scaler.hpp

#pragma once

#include <cstdint>

#include "kachel_types.hpp"

namespace kachel {

class ScreenScaler {
public:
    // Re-derives the available drawing area from the new physical size and
    // scale. The logical size (physical / scale, never above physical) is cut
    // down to whole multiples of fontMax so no fractional tile is visible; the
    // remainder becomes a gutter split evenly on both sides. The grid only
    // grows once a whole extra tile fits, so growing by a few pixels moves
    // nothing on screen. A zero fontMax axis disables snapping on that axis.
    void changePhysicalSizeSmooth(PixelSize physical, double scale, PixelSize fontMax) noexcept;

    [[nodiscard]] PixelSize     physicalSize()    const noexcept { return physical_; }
    [[nodiscard]] double        scaleFactor()     const noexcept { return scale_; }
    [[nodiscard]] PixelSize     logicalSize()     const noexcept { return logical_; }
    [[nodiscard]] std::uint32_t availableWidth()  const noexcept { return available_.width; }
    [[nodiscard]] std::uint32_t availableHeight() const noexcept { return available_.height; }
    [[nodiscard]] PixelSize     available()       const noexcept { return available_; }
    [[nodiscard]] std::uint32_t gutterLeft()      const noexcept { return gutterLeft_; }
    [[nodiscard]] std::uint32_t gutterTop()       const noexcept { return gutterTop_; }

private:
    PixelSize     physical_;
    double        scale_ = 1.0;
    PixelSize     logical_;
    PixelSize     available_;
    std::uint32_t gutterLeft_ = 0;
    std::uint32_t gutterTop_  = 0;
};

} // namespace kachel
