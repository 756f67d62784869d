///// Otter: Kleine Werttypen fuer Geometrie und Farbe; keine Abhaengigkeiten.
///// Schneefuchs: Trivial kopierbar; Vergleichsoperatoren fuer Tests und Coalescing.
///// Datei: src/kachel_types.hpp

#pragma once

#include <cstdint>

namespace kachel {

// Native window identity (the GLFWwindow pointer value for the GLFW surface).
using WindowId = std::uintptr_t;

struct PixelSize {
    std::uint32_t width  = 0;
    std::uint32_t height = 0;
};

inline bool operator==(const PixelSize& a, const PixelSize& b) noexcept {
    return a.width == b.width && a.height == b.height;
}
inline bool operator!=(const PixelSize& a, const PixelSize& b) noexcept { return !(a == b); }

struct PointI {
    int x = 0;
    int y = 0;
};

inline bool operator==(const PointI& a, const PointI& b) noexcept { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const PointI& a, const PointI& b) noexcept { return !(a == b); }

struct ColorRGB {
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
};

} // namespace kachel
