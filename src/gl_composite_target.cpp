///// Otter: Composite-Target – FBO + Textur mit sauberem State-Restore.
///// Schneefuchs: glCheckFramebufferStatus vor Rueckgabe; Fehler geloggt, kein throw.
///// Datei: src/gl_composite_target.cpp

#include "pch.hpp"
#include "gl_composite_target.hpp"
#include "kachel_log.hpp"
#include "opengl_utils.hpp"
#include "settings.hpp"

#include <utility>

namespace kachel {

std::unique_ptr<GlCompositeTarget> GlCompositeTarget::build(PixelSize size) {
    if (size.width == 0 || size.height == 0) {
        KACHEL_LOG_HOST("[GL] composite target: degenerate size %ux%u", size.width, size.height);
        return nullptr;
    }

    std::unique_ptr<GlCompositeTarget> t(new GlCompositeTarget());
    t->size_ = size;

    GLint prevFbo = 0, prevTex = 0;
    glGetIntegerv(GL_FRAMEBUFFER_BINDING, &prevFbo);
    glGetIntegerv(GL_TEXTURE_BINDING_2D, &prevTex);

    glGenFramebuffers(1, &t->fbo_);
    glGenTextures(1, &t->texture_);
    if (t->fbo_ == 0 || t->texture_ == 0) {
        KACHEL_LOG_HOST("[GL] composite target: glGen* failed (fbo=%u tex=%u)", t->fbo_, t->texture_);
        return nullptr; // dtor frees what was created
    }

    glBindTexture(GL_TEXTURE_2D, t->texture_);
    glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA8,
                 static_cast<GLsizei>(size.width), static_cast<GLsizei>(size.height),
                 0, GL_RGBA, GL_UNSIGNED_BYTE, nullptr);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);

    glBindFramebuffer(GL_FRAMEBUFFER, t->fbo_);
    glFramebufferTexture2D(GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT0, GL_TEXTURE_2D, t->texture_, 0);
    const GLenum status = glCheckFramebufferStatus(GL_FRAMEBUFFER);

    glBindFramebuffer(GL_FRAMEBUFFER, static_cast<GLuint>(prevFbo));
    glBindTexture(GL_TEXTURE_2D, static_cast<GLuint>(prevTex));

    const bool glClean = OpenGLUtils::checkGlError("GlCompositeTarget::build");
    if (status != GL_FRAMEBUFFER_COMPLETE || !glClean) {
        KACHEL_LOG_HOST("[GL] composite target %ux%u incomplete (status=0x%04X)",
                        size.width, size.height, status);
        return nullptr;
    }

    if constexpr (Settings::debugLogging) {
        KACHEL_LOG_HOST("[GL] composite target fbo=%u tex=%u %ux%u",
                        t->fbo_, t->texture_, size.width, size.height);
    }
    return t;
}

GlCompositeTarget::~GlCompositeTarget() {
    free();
}

GlCompositeTarget::GlCompositeTarget(GlCompositeTarget&& other) noexcept
    : fbo_(std::exchange(other.fbo_, 0))
    , texture_(std::exchange(other.texture_, 0))
    , size_(std::exchange(other.size_, PixelSize{})) {}

GlCompositeTarget& GlCompositeTarget::operator=(GlCompositeTarget&& other) noexcept {
    if (this != &other) {
        free();
        fbo_     = std::exchange(other.fbo_, 0);
        texture_ = std::exchange(other.texture_, 0);
        size_    = std::exchange(other.size_, PixelSize{});
    }
    return *this;
}

void GlCompositeTarget::bind() const {
    glBindFramebuffer(GL_FRAMEBUFFER, fbo_);
}

void GlCompositeTarget::bindDefault() {
    glBindFramebuffer(GL_FRAMEBUFFER, 0);
}

void GlCompositeTarget::free() noexcept {
    if (texture_) {
        glDeleteTextures(1, &texture_);
        texture_ = 0;
    }
    if (fbo_) {
        glDeleteFramebuffers(1, &fbo_);
        fbo_ = 0;
    }
}

} // namespace kachel
