///// Otter: GL-Grafikgeraet – Viewport, Clear, Scissor, FBO-Binding, Post-Pass, Readback.
///// Schneefuchs: Post-Pass ohne Depth/Blend; State vor dem Draw explizit gesetzt.
///// Maus: Readback mit PACK_ALIGNMENT 1; Fehler ueber checkGlError.
///// Datei: src/gl_graphics_device.cpp

#include "pch.hpp"
#include "gl_graphics_device.hpp"
#include "gl_composite_target.hpp"
#include "kachel_log.hpp"
#include "opengl_utils.hpp"
#include "post_shaders.hpp"
#include "settings.hpp"

namespace kachel {

GlGraphicsDevice::~GlGraphicsDevice() {
    release();
}

bool GlGraphicsDevice::init() {
    program_ = OpenGLUtils::createProgramFromSource(PostShaders::ScanlinesVS, PostShaders::ScanlinesFS);
    if (program_ == 0) {
        KACHEL_LOG_HOST("[GL] post-process program failed to build");
        return false;
    }
    if (!OpenGLUtils::createFullscreenQuad(&vao_, &vbo_, &ebo_)) {
        KACHEL_LOG_HOST("[GL] fullscreen quad failed to build");
        release();
        return false;
    }

    uScreenTexture_   = glGetUniformLocation(program_, "screenTexture");
    uScreenSize_      = glGetUniformLocation(program_, "screenSize");
    uScreenBurn_      = glGetUniformLocation(program_, "screenBurn");
    uScreenBurnColor_ = glGetUniformLocation(program_, "screenBurnColor");

    if constexpr (Settings::debugLogging) {
        KACHEL_LOG_HOST("[GL] post program=%u vao=%u uTex=%d uSize=%d uBurn=%d uBurnColor=%d",
                        program_, vao_, uScreenTexture_, uScreenSize_, uScreenBurn_, uScreenBurnColor_);
    }
    return OpenGLUtils::checkGlError("GlGraphicsDevice::init");
}

void GlGraphicsDevice::clear(float r, float g, float b, float a) {
    glClearColor(r, g, b, a);
    glClear(GL_COLOR_BUFFER_BIT);
}

void GlGraphicsDevice::setScissor(int x, int y, int w, int h) {
    glEnable(GL_SCISSOR_TEST);
    glScissor(x, y, w, h);
}

void GlGraphicsDevice::disableScissor() {
    glDisable(GL_SCISSOR_TEST);
}

void GlGraphicsDevice::setViewport(PixelSize size) {
    viewport_ = size;
    glViewport(0, 0, static_cast<GLsizei>(size.width), static_cast<GLsizei>(size.height));
}

std::unique_ptr<CompositeTarget> GlGraphicsDevice::buildCompositeTarget(PixelSize size) {
    return GlCompositeTarget::build(size);
}

void GlGraphicsDevice::bindCompositeTarget(CompositeTarget& target) {
    static_cast<GlCompositeTarget&>(target).bind();
}

void GlGraphicsDevice::bindDefaultTarget() {
    GlCompositeTarget::bindDefault();
}

void GlGraphicsDevice::drawPostProcess(CompositeTarget& target, const PostProcessParams& params) {
    const auto& gl = static_cast<GlCompositeTarget&>(target);

    glDisable(GL_DEPTH_TEST);
    glDisable(GL_BLEND);
    glDisable(GL_SCISSOR_TEST);

    glUseProgram(program_);
    glUniform1i(uScreenTexture_, 0);
    glUniform3f(uScreenSize_, params.screenWidth, params.screenHeight, 0.0f);
    glUniform1i(uScreenBurn_, params.screenBurn ? 1 : 0);
    glUniform3f(uScreenBurnColor_, params.screenBurnColor.r, params.screenBurnColor.g, params.screenBurnColor.b);

    glActiveTexture(GL_TEXTURE0);
    glBindTexture(GL_TEXTURE_2D, gl.texture());
    glBindVertexArray(vao_);
    glDrawElements(GL_TRIANGLES, 6, GL_UNSIGNED_INT, nullptr);
    glBindVertexArray(0);
    glBindTexture(GL_TEXTURE_2D, 0);
    glUseProgram(0);

    if constexpr (Settings::debugLogging) {
        OpenGLUtils::checkGlError("GlGraphicsDevice::drawPostProcess");
    }
}

bool GlGraphicsDevice::readDefaultPixels(PixelSize size, std::vector<std::uint8_t>& rgba) {
    if (size.width == 0 || size.height == 0) return false;

    rgba.assign(static_cast<std::size_t>(size.width) * size.height * 4u, 0);

    glBindFramebuffer(GL_FRAMEBUFFER, 0);
    glPixelStorei(GL_PACK_ALIGNMENT, 1);
    glReadBuffer(GL_BACK);
    glReadPixels(0, 0, static_cast<GLsizei>(size.width), static_cast<GLsizei>(size.height),
                 GL_RGBA, GL_UNSIGNED_BYTE, rgba.data());

    return OpenGLUtils::checkGlError("GlGraphicsDevice::readDefaultPixels");
}

void GlGraphicsDevice::release() noexcept {
    if (ebo_) { glDeleteBuffers(1, &ebo_); ebo_ = 0; }
    if (vbo_) { glDeleteBuffers(1, &vbo_); vbo_ = 0; }
    if (vao_) { glDeleteVertexArrays(1, &vao_); vao_ = 0; }
    if (program_) { glDeleteProgram(program_); program_ = 0; }
}

} // namespace kachel
