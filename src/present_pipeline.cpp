///// Otter: Full-screen triangle blit (GLSL 430 core), vertex positions from gl_VertexID.
///// Schneefuchs: Depth/cull disabled for the blit and restored afterwards; no per-frame allocations.
///// Maus: Optional GL timer query behind performanceLogging; [TIME] line at the PERF cadence.
///// Datei: src/present_pipeline.cpp

#include "present_pipeline.hpp"
#include "opengl_utils.hpp"
#include "bulb_log.hpp"
#include "settings.hpp"

namespace PresentPipeline {

namespace {
    GLuint sProgram   = 0;
    GLint  sUTex      = -1;
    GLuint sDummyVAO  = 0;
    GLuint sTimeQuery = 0;
    int    sDrawCount = 0;

    // The frame buffer stores the top row first; flip v so it lands at the top of the window.
    const char* kVS = R"(#version 430 core
out vec2 v_uv;
void main() {
    vec2 p = vec2((gl_VertexID==1)?3.0:-1.0, (gl_VertexID==2)?3.0:-1.0);
    vec2 uv = (p+1.0)*0.5;
    v_uv = vec2(uv.x, 1.0-uv.y);
    gl_Position = vec4(p,0,1);
}
)";

    const char* kFS = R"(#version 430 core
layout(location=0) out vec4 o_color;
in vec2 v_uv;
uniform sampler2D uTex;
void main() {
    o_color = texture(uTex, v_uv);
}
)";
} // namespace

bool init() {
    if (sProgram) return true;

    sProgram = OpenGLUtils::createProgramFromSource(kVS, kFS);
    if (!sProgram) {
        BULB_LOG_HOST("[PIPELINE] blit program build failed");
        return false;
    }

    glUseProgram(sProgram);
    sUTex = glGetUniformLocation(sProgram, "uTex");
    if (sUTex >= 0) glUniform1i(sUTex, 0);
    glUseProgram(0);

    glGenVertexArrays(1, &sDummyVAO);

    if constexpr (Settings::performanceLogging) {
        glGenQueries(1, &sTimeQuery);
    }
    if constexpr (Settings::debugLogging) {
        BULB_LOG_HOST("[PIPELINE] init done program=%u vao=%u", sProgram, sDummyVAO);
    }
    return true;
}

void drawFullscreenTriangle(GLuint tex) {
    if (!sProgram) return;

    const GLboolean prevDepth = glIsEnabled(GL_DEPTH_TEST);
    const GLboolean prevCull  = glIsEnabled(GL_CULL_FACE);
    glDisable(GL_DEPTH_TEST);
    glDisable(GL_CULL_FACE);

    glUseProgram(sProgram);
    glActiveTexture(GL_TEXTURE0);
    glBindTexture(GL_TEXTURE_2D, tex);
    glBindVertexArray(sDummyVAO);

    const bool timed = sTimeQuery != 0 && (++sDrawCount % Settings::PERF_LOG_EVERY) == 0;
    if (timed) glBeginQuery(GL_TIME_ELAPSED, sTimeQuery);

    glDrawArrays(GL_TRIANGLES, 0, 3);

    if (timed) {
        glEndQuery(GL_TIME_ELAPSED);
        GLuint64 ns = 0;
        glGetQueryObjectui64v(sTimeQuery, GL_QUERY_RESULT, &ns);
        BULB_LOG_HOST("[TIME] blit gpu=%.3f ms", static_cast<double>(ns) / 1.0e6);
    }

    glBindVertexArray(0);
    glBindTexture(GL_TEXTURE_2D, 0);
    glUseProgram(0);
    if (prevCull)  glEnable(GL_CULL_FACE);
    if (prevDepth) glEnable(GL_DEPTH_TEST);
}

void cleanup() {
    if (sTimeQuery) { glDeleteQueries(1, &sTimeQuery); sTimeQuery = 0; }
    if (sDummyVAO)  { glDeleteVertexArrays(1, &sDummyVAO); sDummyVAO = 0; }
    if (sProgram)   { glDeleteProgram(sProgram); sProgram = 0; }
    sUTex = -1;
    if constexpr (Settings::debugLogging) {
        BULB_LOG_HOST("[CLEANUP] PresentPipeline resources released");
    }
}

} // namespace PresentPipeline
