///// Otter: Konsolen/Fonts als externe Kollaborateure – schmale Schnittstelle.
///// Schneefuchs: Registry besitzt Konsolen (unique_ptr) und Font-Deskriptoren.
///// Maus: applyAutoScale: grid = floor(available / tile) je Konsole und Font.
///// Datei: src/console_registry.hpp

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "graphics_device.hpp"
#include "kachel_types.hpp"

namespace kachel {

struct FontDescriptor {
    std::uint32_t tileWidth  = 8;
    std::uint32_t tileHeight = 8;
    unsigned int  textureId  = 0;
};

// Where the console grid lands on the physical framebuffer: logical units
// times scale, grid origin shifted by the centering gutter (logical pixels).
struct ConsolePlacement {
    double        scale   = 1.0;
    std::uint32_t originX = 0;
    std::uint32_t originY = 0;
};

class ConsoleBackend {
public:
    virtual ~ConsoleBackend() = default;

    [[nodiscard]] virtual std::size_t fontIndex() const = 0;
    [[nodiscard]] virtual PixelSize   charSize() const = 0;
    virtual void setCharSize(std::uint32_t width, std::uint32_t height) = 0;

    // Creates GPU backing for the console if missing. false = could not.
    [[nodiscard]] virtual bool ensureBacking() = 0;
    virtual void rebuildIfDirty() = 0;
    virtual void draw(GraphicsOps& gfx, const FontDescriptor& font, const ConsolePlacement& place) = 0;
};

class ConsoleRegistry {
public:
    std::size_t addFont(const FontDescriptor& font);
    std::size_t addConsole(std::unique_ptr<ConsoleBackend> console);

    [[nodiscard]] const std::vector<FontDescriptor>& fonts() const noexcept { return fonts_; }
    [[nodiscard]] std::size_t     consoleCount() const noexcept { return consoles_.size(); }
    [[nodiscard]] ConsoleBackend& console(std::size_t i) { return *consoles_.at(i); }

    // Largest tile width and height among fonts used by consoles; {0,0} if none.
    [[nodiscard]] PixelSize largestActiveFont() const;

    // Reconciles backing resources with the console list; false if any failed.
    [[nodiscard]] bool syncBackings();
    void rebuildDirty();
    void drawAll(GraphicsOps& gfx);

    // Updated by every resize pass, scale-only ones included.
    void setPlacement(const ConsolePlacement& place) noexcept { placement_ = place; }
    [[nodiscard]] const ConsolePlacement& placement() const noexcept { return placement_; }

    // Pushes floor(available / tile) into every console with a valid font.
    void applyAutoScale(std::uint32_t availableWidth, std::uint32_t availableHeight);

private:
    [[nodiscard]] const FontDescriptor* fontFor(const ConsoleBackend& c) const noexcept;

    std::vector<FontDescriptor>                  fonts_;
    std::vector<std::unique_ptr<ConsoleBackend>> consoles_;
    ConsolePlacement                             placement_;
};

} // namespace kachel
