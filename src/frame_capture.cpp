//MAUS
// Implementation: Screenshot persistence for the compositor.
// 🦦 Otter: BMP-24, little-endian header, bottom-up rows as the format expects.
// 🦊 Schneefuchs: MSVC-safe fopen_s; no partial files are reported as success.

#include "frame_capture.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>

namespace kachel::FrameCapture {

namespace {
    inline void put16(std::uint8_t* p, std::uint16_t v) noexcept {
        p[0] = static_cast<std::uint8_t>(v & 0xFF);
        p[1] = static_cast<std::uint8_t>((v >> 8) & 0xFF);
    }
    inline void put32(std::uint8_t* p, std::uint32_t v) noexcept {
        p[0] = static_cast<std::uint8_t>(v & 0xFF);
        p[1] = static_cast<std::uint8_t>((v >> 8) & 0xFF);
        p[2] = static_cast<std::uint8_t>((v >> 16) & 0xFF);
        p[3] = static_cast<std::uint8_t>((v >> 24) & 0xFF);
    }
} // namespace

void flipVertical(std::vector<std::uint8_t>& rgba, int width, int height) {
    if (width <= 0 || height <= 1) return;
    const std::size_t stride = static_cast<std::size_t>(width) * 4u;
    if (rgba.size() < stride * static_cast<std::size_t>(height)) return;

    for (int top = 0, bottom = height - 1; top < bottom; ++top, --bottom) {
        auto a = rgba.begin() + static_cast<std::ptrdiff_t>(stride * static_cast<std::size_t>(top));
        auto b = rgba.begin() + static_cast<std::ptrdiff_t>(stride * static_cast<std::size_t>(bottom));
        std::swap_ranges(a, a + static_cast<std::ptrdiff_t>(stride), b);
    }
}

bool writeBmp24(const std::string& path, int width, int height,
                const std::vector<std::uint8_t>& topDownRgba) {
    if (width <= 0 || height <= 0 || path.empty()) return false;
    const std::size_t srcStride = static_cast<std::size_t>(width) * 4u;
    if (topDownRgba.size() < srcStride * static_cast<std::size_t>(height)) return false;

    const std::uint32_t rowStrideBGR  = static_cast<std::uint32_t>(((width * 3 + 3) / 4) * 4);
    const std::uint32_t pixelDataSize = rowStrideBGR * static_cast<std::uint32_t>(height);
    const std::uint32_t fileSize      = 54u + pixelDataSize;

    std::uint8_t hdr[54];
    std::memset(hdr, 0, sizeof(hdr));
    hdr[0] = 'B'; hdr[1] = 'M';
    put32(&hdr[2],  fileSize);
    put32(&hdr[10], 54u);                                  // pixel data offset
    put32(&hdr[14], 40u);                                  // BITMAPINFOHEADER
    put32(&hdr[18], static_cast<std::uint32_t>(width));
    put32(&hdr[22], static_cast<std::uint32_t>(height));  // positive -> bottom-up
    put16(&hdr[26], 1u);                                   // planes
    put16(&hdr[28], 24u);                                  // bpp
    put32(&hdr[34], pixelDataSize);

    FILE* f = nullptr;
#if defined(_MSC_VER)
    if (fopen_s(&f, path.c_str(), "wb") != 0 || !f) return false;
#else
    f = std::fopen(path.c_str(), "wb");
    if (!f) return false;
#endif

    if (std::fwrite(hdr, 1, sizeof(hdr), f) != sizeof(hdr)) { std::fclose(f); return false; }

    std::vector<std::uint8_t> row(rowStrideBGR, 0);
    // BMP stores the bottom row first.
    for (int y = height - 1; y >= 0; --y) {
        const std::uint8_t* src = topDownRgba.data() + static_cast<std::size_t>(y) * srcStride;
        std::uint8_t* dst = row.data();
        for (int x = 0; x < width; ++x) {
            *dst++ = src[4 * x + 2]; // B
            *dst++ = src[4 * x + 1]; // G
            *dst++ = src[4 * x + 0]; // R
        }
        if (std::fwrite(row.data(), 1, rowStrideBGR, f) != rowStrideBGR) { std::fclose(f); return false; }
    }
    return std::fclose(f) == 0;
}

} // namespace kachel::FrameCapture
