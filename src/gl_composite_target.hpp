///// Otter: RAII fuer Framebuffer + RGBA8-Textur; move-only.
///// Schneefuchs: build() prueft Vollstaendigkeit; nullptr statt halbem Target.
///// Maus: Keine glDelete* im Client-Code.
///// Datei: src/gl_composite_target.hpp

#pragma once

#include <GL/glew.h>
#include <memory>

#include "graphics_device.hpp"

namespace kachel {

class GlCompositeTarget final : public CompositeTarget {
public:
    // Allocates framebuffer + texture of the given size; nullptr on failure.
    [[nodiscard]] static std::unique_ptr<GlCompositeTarget> build(PixelSize size);

    ~GlCompositeTarget() override;

    GlCompositeTarget(const GlCompositeTarget&) = delete;
    GlCompositeTarget& operator=(const GlCompositeTarget&) = delete;
    GlCompositeTarget(GlCompositeTarget&& other) noexcept;
    GlCompositeTarget& operator=(GlCompositeTarget&& other) noexcept;

    [[nodiscard]] PixelSize size() const noexcept override { return size_; }
    [[nodiscard]] GLuint    fbo() const noexcept { return fbo_; }
    [[nodiscard]] GLuint    texture() const noexcept { return texture_; }

    void bind() const;
    static void bindDefault();

private:
    GlCompositeTarget() = default;
    void free() noexcept;

    GLuint    fbo_     = 0;
    GLuint    texture_ = 0;
    PixelSize size_;
};

} // namespace kachel
