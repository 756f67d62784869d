///// Otter: GL-Helfer – Programm aus Quelltext, Fullscreen-Quad, Fehler-Drain.
///// Schneefuchs: Debug-Gruppen als Scope-Objekt; jeder Ausstieg poppt automatisch.
///// Maus: Fehler beenden nicht; 0/false zurueck, Info-Log komplett geloggt.
///// Datei: src/opengl_utils.cpp

#include "pch.hpp"
#include "opengl_utils.hpp"
#include "kachel_log.hpp"

#include <cstdint>
#include <string>

namespace kachel::OpenGLUtils {

namespace {

// Push/pop a GL debug group for the lifetime of the scope (no-op without KHR_debug).
class DebugScope {
public:
    explicit DebugScope(const char* label) {
        if (glPushDebugGroup) {
            glPushDebugGroup(GL_DEBUG_SOURCE_APPLICATION, 0, -1, label);
            pushed_ = true;
        }
    }
    ~DebugScope() {
        if (pushed_ && glPopDebugGroup) glPopDebugGroup();
    }
    DebugScope(const DebugScope&) = delete;
    DebugScope& operator=(const DebugScope&) = delete;

private:
    bool pushed_ = false;
};

using GetIv      = void (GLAPIENTRY*)(GLuint, GLenum, GLint*);
using GetInfoLog = void (GLAPIENTRY*)(GLuint, GLsizei, GLsizei*, GLchar*);

// Full info log for a shader or program object; empty if there is none.
std::string infoLog(GLuint object, GetIv getIv, GetInfoLog getLog) {
    GLint len = 0;
    getIv(object, GL_INFO_LOG_LENGTH, &len);
    if (len <= 1) return {};
    std::string text(static_cast<std::size_t>(len), '\0');
    GLsizei written = 0;
    getLog(object, len, &written, text.data());
    text.resize(written > 0 ? static_cast<std::size_t>(written) : 0u);
    return text;
}

GLuint compileStage(GLenum stage, const char* src) {
    const char* name = (stage == GL_VERTEX_SHADER) ? "vertex" : "fragment";
    if (!src || !*src) {
        KACHEL_LOG_HOST("[ShaderError] %s source is empty", name);
        return 0;
    }

    const GLuint shader = glCreateShader(stage);
    if (shader == 0) {
        KACHEL_LOG_HOST("[ShaderError] glCreateShader(%s) returned 0", name);
        return 0;
    }
    glShaderSource(shader, 1, &src, nullptr);
    glCompileShader(shader);

    GLint compiled = GL_FALSE;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &compiled);
    const std::string log = infoLog(shader, glGetShaderiv, glGetShaderInfoLog);
    if (compiled != GL_TRUE) {
        KACHEL_LOG_HOST("[ShaderError] %s stage failed: %s", name, log.empty() ? "(no info log)" : log.c_str());
        glDeleteShader(shader);
        return 0;
    }
    if (!log.empty()) {
        KACHEL_LOG_HOST("[ShaderInfo] %s stage: %s", name, log.c_str());
    }
    return shader;
}

} // namespace

bool checkGlError(const char* where) {
    bool clean = true;
    for (GLenum err = glGetError(); err != GL_NO_ERROR; err = glGetError()) {
        KACHEL_LOG_HOST("[GL-ERROR] %s -> 0x%04X", where, err);
        clean = false;
    }
    return clean;
}

GLuint createProgramFromSource(const char* vertexSrc, const char* fragmentSrc) {
    DebugScope scope("kachel: build program");

    const GLuint vs = compileStage(GL_VERTEX_SHADER, vertexSrc);
    if (vs == 0) return 0;
    const GLuint fs = compileStage(GL_FRAGMENT_SHADER, fragmentSrc);
    if (fs == 0) {
        glDeleteShader(vs);
        return 0;
    }

    const GLuint program = glCreateProgram();
    if (program != 0) {
        glAttachShader(program, vs);
        glAttachShader(program, fs);
        glLinkProgram(program);
        glDetachShader(program, vs);
        glDetachShader(program, fs);
    } else {
        KACHEL_LOG_HOST("[ShaderError] glCreateProgram returned 0");
    }
    glDeleteShader(vs);
    glDeleteShader(fs);
    if (program == 0) return 0;

    GLint linked = GL_FALSE;
    glGetProgramiv(program, GL_LINK_STATUS, &linked);
    if (linked != GL_TRUE) {
        const std::string log = infoLog(program, glGetProgramiv, glGetProgramInfoLog);
        KACHEL_LOG_HOST("[ShaderError] link failed: %s", log.empty() ? "(no info log)" : log.c_str());
        glDeleteProgram(program);
        return 0;
    }

    checkGlError("createProgramFromSource");
    return program;
}

bool createFullscreenQuad(GLuint* outVAO, GLuint* outVBO, GLuint* outEBO) {
    if (!outVAO || !outVBO || !outEBO) {
        KACHEL_LOG_HOST("[GL-ERROR] createFullscreenQuad: null output");
        return false;
    }
    DebugScope scope("kachel: fullscreen quad");

    // x, y, u, v
    static constexpr GLfloat kCorners[] = {
        -1.0f, -1.0f,  0.0f, 0.0f,
         1.0f, -1.0f,  1.0f, 0.0f,
         1.0f,  1.0f,  1.0f, 1.0f,
        -1.0f,  1.0f,  0.0f, 1.0f,
    };
    static constexpr GLuint kIndices[] = { 0, 1, 2, 2, 3, 0 };

    GLint prevVAO = 0, prevVBO = 0;
    glGetIntegerv(GL_VERTEX_ARRAY_BINDING, &prevVAO);
    glGetIntegerv(GL_ARRAY_BUFFER_BINDING, &prevVBO);

    GLuint vao = 0, vbo = 0, ebo = 0;
    glGenVertexArrays(1, &vao);
    glGenBuffers(1, &vbo);
    glGenBuffers(1, &ebo);
    if (vao == 0 || vbo == 0 || ebo == 0) {
        KACHEL_LOG_HOST("[GL-ERROR] createFullscreenQuad: generation failed (vao=%u vbo=%u ebo=%u)", vao, vbo, ebo);
        if (vao) glDeleteVertexArrays(1, &vao);
        if (vbo) glDeleteBuffers(1, &vbo);
        if (ebo) glDeleteBuffers(1, &ebo);
        *outVAO = *outVBO = *outEBO = 0;
        return false;
    }

    glBindVertexArray(vao);
    glBindBuffer(GL_ARRAY_BUFFER, vbo);
    glBufferData(GL_ARRAY_BUFFER, sizeof(kCorners), kCorners, GL_STATIC_DRAW);
    glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, ebo); // recorded in the VAO
    glBufferData(GL_ELEMENT_ARRAY_BUFFER, sizeof(kIndices), kIndices, GL_STATIC_DRAW);

    constexpr GLsizei stride = 4 * sizeof(GLfloat);
    glEnableVertexAttribArray(0);
    glVertexAttribPointer(0, 2, GL_FLOAT, GL_FALSE, stride, nullptr);
    glEnableVertexAttribArray(1);
    glVertexAttribPointer(1, 2, GL_FLOAT, GL_FALSE, stride,
                          reinterpret_cast<const void*>(static_cast<std::uintptr_t>(2 * sizeof(GLfloat))));

    glBindVertexArray(static_cast<GLuint>(prevVAO));
    glBindBuffer(GL_ARRAY_BUFFER, static_cast<GLuint>(prevVBO));

    *outVAO = vao;
    *outVBO = vbo;
    *outEBO = ebo;
    return checkGlError("createFullscreenQuad");
}

} // namespace kachel::OpenGLUtils
