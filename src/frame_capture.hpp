///// Otter: Screenshot-Helfer – vertikaler Flip und BMP-24-Writer, ohne GL.
///// Schneefuchs: GL liefert Zeilen unten-zuerst; Bilddateien beginnen oben.
///// Maus: Fehler -> false; Aufrufer loggt und macht weiter.

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace kachel::FrameCapture {

// Reverses the row order of a tightly packed RGBA8 image in place.
void flipVertical(std::vector<std::uint8_t>& rgba, int width, int height);

// Writes a top-down RGBA8 image as 24-bit BMP (4-byte aligned rows).
[[nodiscard]] bool writeBmp24(const std::string& path, int width, int height,
                              const std::vector<std::uint8_t>& topDownRgba);

} // namespace kachel::FrameCapture
