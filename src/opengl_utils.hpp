///// Otter: OpenGL-Utils (Header) – schlank; nur GLuint-Typ, klare API.
///// Schneefuchs: Header/Source synchron; deterministisch; ASCII-only; keine Seiteneffekte.
///// Maus: Fehler beenden nicht; Funktionen liefern 0/false und loggen.
///// Datei: src/opengl_utils.hpp

#pragma once

#include <GL/glew.h>

namespace kachel::OpenGLUtils {

// Program from vertex/fragment sources. Returns 0 on failure (logged).
[[nodiscard]] GLuint createProgramFromSource(const char* vertexSrc, const char* fragmentSrc);

// Fullscreen quad (VAO/VBO/EBO), position(2) + texcoord(2), six indices.
// Returns false and zeroes the outputs on failure.
[[nodiscard]] bool createFullscreenQuad(GLuint* outVAO, GLuint* outVBO, GLuint* outEBO);

// Drains glGetError; logs every pending error. Returns true if there was none.
bool checkGlError(const char* where);

} // namespace kachel::OpenGLUtils
