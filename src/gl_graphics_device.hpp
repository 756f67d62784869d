///// Otter: OpenGL-Implementierung der Grafik-Naht; besitzt Post-Programm + FSQ.
///// Schneefuchs: init() nach glewInit; Uniform-Locations einmalig gecacht.
///// Maus: Kein GL-Aufruf ausserhalb dieses Typs und der Composite-Targets.
///// Datei: src/gl_graphics_device.hpp

#pragma once

#include <GL/glew.h>

#include "graphics_device.hpp"

namespace kachel {

class GlGraphicsDevice final : public GraphicsDevice {
public:
    GlGraphicsDevice() = default;
    ~GlGraphicsDevice() override;

    GlGraphicsDevice(const GlGraphicsDevice&) = delete;
    GlGraphicsDevice& operator=(const GlGraphicsDevice&) = delete;

    // Compiles the post-process program and the fullscreen quad.
    // Requires a current GL context.
    [[nodiscard]] bool init();

    [[nodiscard]] PixelSize framebufferSize() const override { return viewport_; }
    void clear(float r, float g, float b, float a) override;
    void setScissor(int x, int y, int w, int h) override;
    void disableScissor() override;

    void setViewport(PixelSize size) override;
    [[nodiscard]] std::unique_ptr<CompositeTarget> buildCompositeTarget(PixelSize size) override;
    void bindCompositeTarget(CompositeTarget& target) override;
    void bindDefaultTarget() override;
    void drawPostProcess(CompositeTarget& target, const PostProcessParams& params) override;
    [[nodiscard]] bool readDefaultPixels(PixelSize size, std::vector<std::uint8_t>& rgba) override;

private:
    void release() noexcept;

    PixelSize viewport_;

    GLuint program_ = 0;
    GLuint vao_ = 0, vbo_ = 0, ebo_ = 0;

    GLint uScreenTexture_   = -1;
    GLint uScreenSize_      = -1;
    GLint uScreenBurn_      = -1;
    GLint uScreenBurnColor_ = -1;
};

} // namespace kachel
