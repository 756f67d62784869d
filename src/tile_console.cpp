///// Otter: Kachel-Konsole – Zellraster, Dirty-Flag, Scissor-Rechtecke von oben nach unten.
///// Schneefuchs: GL-Scissor zaehlt von unten; Zeile 0 liegt am oberen Rand.
///// Maus: Kacheln in logischen Pixeln, mal DPI-Skala, ab Gutter-Ursprung.
///// Datei: src/tile_console.cpp

#include "tile_console.hpp"

#include <cmath>
#include <utility>

namespace kachel {

namespace {
bool isBlack(const ColorRGB& c) noexcept {
    return c.r <= 0.0f && c.g <= 0.0f && c.b <= 0.0f;
}
} // namespace

TileConsole::TileConsole(std::size_t fontIndex, std::uint32_t width, std::uint32_t height)
    : fontIndex_(fontIndex)
    , size_{ width, height }
    , cells_(static_cast<std::size_t>(width) * height) {}

void TileConsole::setCharSize(std::uint32_t width, std::uint32_t height) {
    if (width == size_.width && height == size_.height) return;

    std::vector<ColorRGB> next(static_cast<std::size_t>(width) * height);
    const std::uint32_t keepW = width  < size_.width  ? width  : size_.width;
    const std::uint32_t keepH = height < size_.height ? height : size_.height;
    for (std::uint32_t y = 0; y < keepH; ++y) {
        for (std::uint32_t x = 0; x < keepW; ++x) {
            next[static_cast<std::size_t>(y) * width + x] =
                cells_[static_cast<std::size_t>(y) * size_.width + x];
        }
    }
    cells_ = std::move(next);
    size_  = PixelSize{ width, height };
    dirty_ = true;
}

void TileConsole::set(std::uint32_t x, std::uint32_t y, ColorRGB color) {
    if (x >= size_.width || y >= size_.height) return;
    cells_[static_cast<std::size_t>(y) * size_.width + x] = color;
    dirty_ = true;
}

void TileConsole::cls() {
    for (auto& c : cells_) c = ColorRGB{};
    dirty_ = true;
}

ColorRGB TileConsole::at(std::uint32_t x, std::uint32_t y) const {
    if (x >= size_.width || y >= size_.height) return ColorRGB{};
    return cells_[static_cast<std::size_t>(y) * size_.width + x];
}

void TileConsole::rebuildIfDirty() {
    if (!dirty_) return;
    lit_.clear();
    for (std::uint32_t y = 0; y < size_.height; ++y) {
        for (std::uint32_t x = 0; x < size_.width; ++x) {
            const ColorRGB& c = cells_[static_cast<std::size_t>(y) * size_.width + x];
            if (!isBlack(c)) lit_.push_back(LitCell{ x, y, c });
        }
    }
    dirty_ = false;
}

void TileConsole::draw(GraphicsOps& gfx, const FontDescriptor& font, const ConsolePlacement& place) {
    if (lit_.empty()) return;
    const PixelSize fb = gfx.framebufferSize();
    const double scale = (std::isfinite(place.scale) && place.scale > 0.0) ? place.scale : 1.0;

    // Edges are rounded individually so neighbouring tiles share them exactly.
    const auto edge = [scale](std::uint32_t origin, std::uint32_t cell, std::uint32_t tile) {
        const double logical = static_cast<double>(origin) + static_cast<double>(cell) * tile;
        return static_cast<int>(std::lround(logical * scale));
    };

    for (const LitCell& cell : lit_) {
        const int x0 = edge(place.originX, cell.x,     font.tileWidth);
        const int x1 = edge(place.originX, cell.x + 1, font.tileWidth);
        const int y0 = edge(place.originY, cell.y,     font.tileHeight);
        const int y1 = edge(place.originY, cell.y + 1, font.tileHeight);
        gfx.setScissor(x0, static_cast<int>(fb.height) - y1, x1 - x0, y1 - y0);
        gfx.clear(cell.color.r, cell.color.g, cell.color.b, 1.0f);
    }
    gfx.disableScissor();
}

} // namespace kachel
