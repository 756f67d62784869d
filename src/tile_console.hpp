///// Otter: Einfache Kachel-Konsole – Farbe pro Zelle, gezeichnet per Scissor-Clear.
///// Schneefuchs: Braucht keinen Font-Atlas; Groesse folgt setCharSize (Auto-Scale).
///// Maus: rebuildIfDirty sammelt die sichtbaren Zellen; draw iteriert nur diese.
///// Datei: src/tile_console.hpp

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "console_registry.hpp"

namespace kachel {

class TileConsole final : public ConsoleBackend {
public:
    TileConsole(std::size_t fontIndex, std::uint32_t width, std::uint32_t height);

    [[nodiscard]] std::size_t fontIndex() const override { return fontIndex_; }
    [[nodiscard]] PixelSize   charSize() const override { return size_; }
    void setCharSize(std::uint32_t width, std::uint32_t height) override;

    [[nodiscard]] bool ensureBacking() override { return true; }
    void rebuildIfDirty() override;
    void draw(GraphicsOps& gfx, const FontDescriptor& font, const ConsolePlacement& place) override;

    // Black cells are not drawn. Out-of-range coordinates are ignored.
    void set(std::uint32_t x, std::uint32_t y, ColorRGB color);
    void cls();

    [[nodiscard]] ColorRGB at(std::uint32_t x, std::uint32_t y) const;
    [[nodiscard]] bool     dirty() const noexcept { return dirty_; }
    [[nodiscard]] std::size_t litCells() const noexcept { return lit_.size(); }

private:
    struct LitCell { std::uint32_t x, y; ColorRGB color; };

    std::size_t           fontIndex_;
    PixelSize             size_;
    std::vector<ColorRGB> cells_;
    std::vector<LitCell>  lit_;
    bool                  dirty_ = true;
};

} // namespace kachel
