///// Otter: Native Fenster-Naht – Groesse, DPI, Swap, Event-Pumpe.
///// Schneefuchs: GLFW-Implementierung in glfw_surface.*; Tests nutzen eine Fake-Surface.
///// Datei: src/display_surface.hpp

#pragma once

#include <vector>

#include "kachel_types.hpp"
#include "native_event.hpp"

namespace kachel {

class DisplaySurface {
public:
    virtual ~DisplaySurface() = default;

    [[nodiscard]] virtual WindowId  windowId() const = 0;
    // Drawable size in physical pixels.
    [[nodiscard]] virtual PixelSize innerSize() const = 0;
    [[nodiscard]] virtual double    scaleFactor() const = 0;

    virtual void swapBuffers() = 0;

    // Appends every native event since the last pump, followed by one
    // RedrawEventsCleared.
    virtual void pumpEvents(std::vector<NativeEvent>& out) = 0;
};

} // namespace kachel
