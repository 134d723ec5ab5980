///// Otter: OpenGL utils - shader program build, RGBA8 texture, unpack PBO, full-surface uploads.
///// Schneefuchs: Header only needs GLuint; every helper restores the GL bindings it touches.
///// Maus: Failures return 0 and log; nothing here throws or exits.
///// Datei: src/opengl_utils.hpp

#pragma once

#include <GL/glew.h> // GLuint

namespace OpenGLUtils {

// Builds a program from vertex/fragment sources; 0 on failure (full info log written).
[[nodiscard]] GLuint createProgramFromSource(const char* vertexSrc, const char* fragmentSrc) noexcept;

// Immutable RGBA8 texture, one mip level, linear filtering, clamp to edge; 0 on failure.
[[nodiscard]] GLuint createTexture(int width, int height) noexcept;

// GL_PIXEL_UNPACK_BUFFER of width*height*4 bytes (stream draw, CUDA interop target); 0 on failure.
[[nodiscard]] GLuint createPBO(int width, int height) noexcept;

// Full-surface texture update from the bound-by-us unpack PBO.
void updateTextureFromPBO(GLuint pbo, GLuint tex, int width, int height) noexcept;

// Full-surface texture update from tightly packed host RGBA8 pixels.
void updateTextureFromHost(const unsigned char* rgba8, GLuint tex, int width, int height) noexcept;

} // namespace OpenGLUtils
