///// Otter: Schmale Grafik-Naht – GraphicsOps fuer Anwendungscode, GraphicsDevice fuer den Kern.
///// Schneefuchs: Keine GL-Header hier; GL-Implementierung in gl_graphics_device.*.
///// Maus: Nur der ResizeCoordinator baut Composite-Targets und setzt den Viewport.
///// Datei: src/graphics_device.hpp

#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "kachel_types.hpp"

namespace kachel {

// Offscreen render target (framebuffer + color texture) owned by RenderContext.
class CompositeTarget {
public:
    virtual ~CompositeTarget() = default;
    [[nodiscard]] virtual PixelSize size() const noexcept = 0;
};

struct PostProcessParams {
    float    screenWidth  = 0.0f; // scaled pixels
    float    screenHeight = 0.0f;
    bool     screenBurn   = false;
    ColorRGB screenBurnColor;
};

// What application custom-draw code may touch.
class GraphicsOps {
public:
    virtual ~GraphicsOps() = default;

    [[nodiscard]] virtual PixelSize framebufferSize() const = 0;
    virtual void clear(float r, float g, float b, float a) = 0;
    virtual void setScissor(int x, int y, int w, int h) = 0;
    virtual void disableScissor() = 0;
};

class GraphicsDevice : public GraphicsOps {
public:
    virtual void setViewport(PixelSize size) = 0;

    // Returns nullptr when the target could not be allocated or is incomplete.
    [[nodiscard]] virtual std::unique_ptr<CompositeTarget> buildCompositeTarget(PixelSize size) = 0;

    virtual void bindCompositeTarget(CompositeTarget& target) = 0;
    virtual void bindDefaultTarget() = 0;

    // Full-screen quad sampling target's texture through the post-process program.
    virtual void drawPostProcess(CompositeTarget& target, const PostProcessParams& params) = 0;

    // Reads the default framebuffer as tightly packed RGBA8, bottom row first.
    [[nodiscard]] virtual bool readDefaultPixels(PixelSize size, std::vector<std::uint8_t>& rgba) = 0;
};

} // namespace kachel
