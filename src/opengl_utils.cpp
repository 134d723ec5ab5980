///// Otter: OpenGL utils - shader compile/link with full info logs; texture/PBO creation and uploads.
///// Schneefuchs: Deterministic, ASCII-only; state saved and restored around every bind.
///// Maus: Errors do not terminate; functions return 0 and log clearly (BULB_LOG_HOST only).
///// Datei: src/opengl_utils.cpp

#include "opengl_utils.hpp"
#include "bulb_log.hpp"
#include "settings.hpp"

#include <string>

namespace OpenGLUtils {

namespace {
    inline void logGlError(const char* where) {
        const GLenum err = glGetError();
        if (err != GL_NO_ERROR) {
            BULB_LOG_HOST("[GL-ERROR] %s -> 0x%04X", where, static_cast<unsigned>(err));
        }
    }

    inline std::string getShaderInfoLog(GLuint shader) {
        GLint len = 0;
        glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &len);
        if (len <= 1) return {};
        std::string log(static_cast<size_t>(len), '\0');
        GLsizei written = 0;
        glGetShaderInfoLog(shader, len, &written, log.data());
        if (written >= 0 && written < len) log.resize(static_cast<size_t>(written));
        return log;
    }

    inline std::string getProgramInfoLog(GLuint prog) {
        GLint len = 0;
        glGetProgramiv(prog, GL_INFO_LOG_LENGTH, &len);
        if (len <= 1) return {};
        std::string log(static_cast<size_t>(len), '\0');
        GLsizei written = 0;
        glGetProgramInfoLog(prog, len, &written, log.data());
        if (written >= 0 && written < len) log.resize(static_cast<size_t>(written));
        return log;
    }

    GLuint compileShader(GLenum type, const char* src) {
        const char* kind = (type == GL_VERTEX_SHADER) ? "Vertex" : "Fragment";
        if (!src || !*src) {
            BULB_LOG_HOST("[ShaderError] empty/null source (%s)", kind);
            return 0;
        }
        GLuint s = glCreateShader(type);
        if (!s) {
            BULB_LOG_HOST("[ShaderError] glCreateShader failed (%s)", kind);
            return 0;
        }
        glShaderSource(s, 1, &src, nullptr);
        glCompileShader(s);

        GLint ok = GL_FALSE;
        glGetShaderiv(s, GL_COMPILE_STATUS, &ok);
        if (ok != GL_TRUE) {
            const std::string log = getShaderInfoLog(s);
            BULB_LOG_HOST("[ShaderError] Compilation failed (%s): %s", kind,
                          log.empty() ? "(no info log)" : log.c_str());
            glDeleteShader(s);
            return 0;
        }
        return s;
    }

    inline size_t rgba8Bytes(int w, int h) {
        return static_cast<size_t>(w) * static_cast<size_t>(h) * 4u;
    }

    // Unpack state touched by the uploads; restored on scope exit.
    struct UnpackStateGuard {
        GLint pbo = 0, align = 0, rowLen = 0, activeTex = 0, tex0 = 0;
        UnpackStateGuard() {
            glGetIntegerv(GL_PIXEL_UNPACK_BUFFER_BINDING, &pbo);
            glGetIntegerv(GL_UNPACK_ALIGNMENT, &align);
            glGetIntegerv(GL_UNPACK_ROW_LENGTH, &rowLen);
            glGetIntegerv(GL_ACTIVE_TEXTURE, &activeTex);
            glActiveTexture(GL_TEXTURE0);
            glGetIntegerv(GL_TEXTURE_BINDING_2D, &tex0);
        }
        ~UnpackStateGuard() {
            glBindTexture(GL_TEXTURE_2D, static_cast<GLuint>(tex0));
            glActiveTexture(static_cast<GLenum>(activeTex));
            glPixelStorei(GL_UNPACK_ALIGNMENT, align);
            glPixelStorei(GL_UNPACK_ROW_LENGTH, rowLen);
            glBindBuffer(GL_PIXEL_UNPACK_BUFFER, static_cast<GLuint>(pbo));
        }
    };
} // namespace

GLuint createProgramFromSource(const char* vertexSrc, const char* fragmentSrc) noexcept {
    GLuint v = compileShader(GL_VERTEX_SHADER, vertexSrc);
    if (v == 0) return 0;
    GLuint f = compileShader(GL_FRAGMENT_SHADER, fragmentSrc);
    if (f == 0) { glDeleteShader(v); return 0; }

    GLuint prog = glCreateProgram();
    if (!prog) {
        BULB_LOG_HOST("[ShaderError] glCreateProgram failed");
        glDeleteShader(v); glDeleteShader(f);
        return 0;
    }
    glAttachShader(prog, v);
    glAttachShader(prog, f);
    glLinkProgram(prog);

    GLint ok = GL_FALSE;
    glGetProgramiv(prog, GL_LINK_STATUS, &ok);
    glDetachShader(prog, v);
    glDetachShader(prog, f);
    glDeleteShader(v);
    glDeleteShader(f);

    if (ok != GL_TRUE) {
        const std::string log = getProgramInfoLog(prog);
        BULB_LOG_HOST("[ShaderError] Program link failed: %s", log.empty() ? "(no info log)" : log.c_str());
        glDeleteProgram(prog);
        return 0;
    }
    logGlError("createProgramFromSource end");
    return prog;
}

GLuint createTexture(int width, int height) noexcept {
    if (width <= 0 || height <= 0) {
        BULB_LOG_HOST("[GL-TEX] invalid size w=%d h=%d", width, height);
        return 0;
    }
    GLint maxTex = 0;
    glGetIntegerv(GL_MAX_TEXTURE_SIZE, &maxTex);
    if (maxTex > 0 && (width > maxTex || height > maxTex)) {
        BULB_LOG_HOST("[GL-TEX] %dx%d exceeds GL_MAX_TEXTURE_SIZE=%d", width, height, maxTex);
        return 0;
    }

    GLint prevActive = 0, prevTex0 = 0;
    glGetIntegerv(GL_ACTIVE_TEXTURE, &prevActive);
    glActiveTexture(GL_TEXTURE0);
    glGetIntegerv(GL_TEXTURE_BINDING_2D, &prevTex0);

    GLuint tex = 0;
    glGenTextures(1, &tex);
    glBindTexture(GL_TEXTURE_2D, tex);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S,     GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T,     GL_CLAMP_TO_EDGE);
    glTexStorage2D(GL_TEXTURE_2D, 1, GL_RGBA8, width, height);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_BASE_LEVEL, 0);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAX_LEVEL,  0);

    glBindTexture(GL_TEXTURE_2D, static_cast<GLuint>(prevTex0));
    glActiveTexture(static_cast<GLenum>(prevActive));

    if constexpr (Settings::debugLogging) {
        BULB_LOG_HOST("[GL-TEX] created RGBA8 %dx%d id=%u", width, height, tex);
    }
    logGlError("createTexture end");
    return tex;
}

GLuint createPBO(int width, int height) noexcept {
    if (width <= 0 || height <= 0) {
        BULB_LOG_HOST("[GL-PBO] invalid size w=%d h=%d", width, height);
        return 0;
    }
    GLint prevPBO = 0;
    glGetIntegerv(GL_PIXEL_UNPACK_BUFFER_BINDING, &prevPBO);

    GLuint pbo = 0;
    glGenBuffers(1, &pbo);
    glBindBuffer(GL_PIXEL_UNPACK_BUFFER, pbo);
    glBufferData(GL_PIXEL_UNPACK_BUFFER, static_cast<GLsizeiptr>(rgba8Bytes(width, height)),
                 nullptr, GL_STREAM_DRAW);

    GLint64 realSize = 0;
    glGetBufferParameteri64v(GL_PIXEL_UNPACK_BUFFER, GL_BUFFER_SIZE, &realSize);
    glBindBuffer(GL_PIXEL_UNPACK_BUFFER, static_cast<GLuint>(prevPBO));

    if (realSize < static_cast<GLint64>(rgba8Bytes(width, height))) {
        BULB_LOG_HOST("[GL-PBO] allocation short: real=%lld", static_cast<long long>(realSize));
        glDeleteBuffers(1, &pbo);
        return 0;
    }
    if constexpr (Settings::debugLogging) {
        BULB_LOG_HOST("[GL-PBO] created unpack PBO=%u bytes=%lld", pbo, static_cast<long long>(realSize));
    }
    return pbo;
}

void updateTextureFromPBO(GLuint pbo, GLuint tex, int width, int height) noexcept {
    if (!pbo || !tex || width <= 0 || height <= 0) {
        BULB_LOG_HOST("[GL-UPLOAD] invalid args pbo=%u tex=%u w=%d h=%d", pbo, tex, width, height);
        return;
    }
    UnpackStateGuard guard;
    glBindBuffer(GL_PIXEL_UNPACK_BUFFER, pbo);
    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
    glPixelStorei(GL_UNPACK_ROW_LENGTH, 0);
    glBindTexture(GL_TEXTURE_2D, tex);
    glTexSubImage2D(GL_TEXTURE_2D, 0, 0, 0, width, height, GL_RGBA, GL_UNSIGNED_BYTE, nullptr);
    if constexpr (Settings::debugLogging) {
        logGlError("updateTextureFromPBO");
    }
}

void updateTextureFromHost(const unsigned char* rgba8, GLuint tex, int width, int height) noexcept {
    if (!rgba8 || !tex || width <= 0 || height <= 0) {
        BULB_LOG_HOST("[GL-UPLOAD] invalid host upload tex=%u w=%d h=%d", tex, width, height);
        return;
    }
    UnpackStateGuard guard;
    glBindBuffer(GL_PIXEL_UNPACK_BUFFER, 0);
    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
    glPixelStorei(GL_UNPACK_ROW_LENGTH, 0);
    glBindTexture(GL_TEXTURE_2D, tex);
    glTexSubImage2D(GL_TEXTURE_2D, 0, 0, 0, width, height, GL_RGBA, GL_UNSIGNED_BYTE, rgba8);
    if constexpr (Settings::debugLogging) {
        logGlError("updateTextureFromHost");
    }
}

} // namespace OpenGLUtils
