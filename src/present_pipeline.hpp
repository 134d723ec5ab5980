///// Otter: Presentation - draws the frame texture with one full-screen triangle.
///// Schneefuchs: Header/source in sync; minimal include (GLuint); ASCII-only.
///// Maus: init() reports failure as false; the caller decides to abort.
///// Datei: src/present_pipeline.hpp

#pragma once
#include <GL/glew.h> // GLuint

namespace PresentPipeline {

// Builds the blit program and the empty VAO the core profile requires.
[[nodiscard]] bool init();

// Releases program and VAO.
void cleanup();

// Draws tex over the whole viewport; row 0 of the texture is the top of the image.
void drawFullscreenTriangle(GLuint tex);

} // namespace PresentPipeline
