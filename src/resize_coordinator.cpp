///// Otter: Resize-Pass – sieben Schritte in fester Reihenfolge, ein Log pro Pass.
///// Schneefuchs: Altes Target wird vor dem Neubau verworfen; Fehler -> false, kein throw.
///// Maus: Resized-Event traegt die Groesse im per resizeScaling gewaehlten Pixelraum.
///// Datei: src/resize_coordinator.cpp

#include "resize_coordinator.hpp"
#include "kachel_log.hpp"
#include "settings.hpp"

#include <algorithm>

namespace kachel {

namespace {
    inline PixelSize clampForGpu(PixelSize s) noexcept {
        return PixelSize{ std::max<std::uint32_t>(1u, s.width), std::max<std::uint32_t>(1u, s.height) };
    }
} // namespace

bool ResizeCoordinator::apply(PixelSize physical, double dpiScale, bool notify) {
    ++passes_;

    // 1) Largest tile among active fonts bounds the smoothing.
    const PixelSize fontMax = consoles_.largestActiveFont();

    // 2) Future pointer translation uses the new scale.
    input_.setScaleFactor(dpiScale);

    // 3) Available drawing area.
    scaler_.changePhysicalSizeSmooth(physical, input_.scaleFactor(), fontMax);

    consoles_.setPlacement(ConsolePlacement{ scaler_.scaleFactor(), scaler_.gutterLeft(), scaler_.gutterTop() });

    // 4) Terminal follows the framebuffer on every pass; only the event waits for notify.
    term_.resizePixels(physical.width, physical.height);
    if (notify) {
        const PixelSize domain = rc_.resizeScaling ? scaler_.available() : scaler_.logicalSize();
        input_.pushEvent(event::Resized{
            PointI{ static_cast<int>(domain.width), static_cast<int>(domain.height) },
            static_cast<float>(scaler_.scaleFactor()) });
    }

    // 5) Viewport covers the full physical window.
    const PixelSize gpuSize = clampForGpu(physical);
    gfx_.setViewport(gpuSize);

    // 6) Rebuild the composite target; the old one must not survive.
    rc_.backingBuffer.reset();
    rc_.backingBuffer = gfx_.buildCompositeTarget(gpuSize);
    if (!rc_.backingBuffer) {
        KACHEL_LOG_HOST("[RESIZE] ERROR: composite target %ux%u could not be built",
                        gpuSize.width, gpuSize.height);
        return false;
    }

    // 7) Re-flow console grids.
    if (rc_.resizeScaling && notify) {
        consoles_.applyAutoScale(scaler_.availableWidth(), scaler_.availableHeight());
    }

    if constexpr (Settings::debugLogging) {
        KACHEL_LOG_HOST("[RESIZE] pass=%llu physical=%ux%u scale=%.3f available=%ux%u fontMax=%ux%u notify=%d",
                        passes_, physical.width, physical.height, scaler_.scaleFactor(),
                        scaler_.availableWidth(), scaler_.availableHeight(),
                        fontMax.width, fontMax.height, notify ? 1 : 0);
    }
    return true;
}

} // namespace kachel
