#pragma once

/**
 * GL entry points
 *
 * Every OpenGL ES function the bridge calls goes through this table of
 * function pointers. The runtime fills it from SDL_GL_GetProcAddress; the
 * capability detection then installs extension or core entry points into the
 * optional slots (vertex arrays, instancing, queries, draw buffers) so the
 * rest of the bridge calls one name regardless of where it came from.
 *
 * A null optional slot means the capability is unavailable and the call is
 * a no-op.
 */

#include <SDL3/SDL_opengles2.h>
#include <cstdint>
#include <functional>

namespace hostbridge {
namespace gl {

// Enums used by the bridge itself that the GLES2 header does not carry
constexpr GLenum kGlQueryResult = 0x8866;
constexpr GLenum kGlQueryResultAvailable = 0x8867;
constexpr GLenum kGlTimeElapsed = 0x88BF;
constexpr GLenum kGlRed = 0x1903;
constexpr GLenum kGlRg = 0x8227;
constexpr GLenum kGlHalfFloat = 0x140B;
constexpr GLenum kGlHalfFloatOes = 0x8D61;

struct GlApi {
    // State
    void (*clearColor)(GLfloat, GLfloat, GLfloat, GLfloat) = nullptr;
    void (*clearDepthf)(GLfloat) = nullptr;
    void (*clearStencil)(GLint) = nullptr;
    void (*clear)(GLbitfield) = nullptr;
    void (*colorMask)(GLboolean, GLboolean, GLboolean, GLboolean) = nullptr;
    void (*viewport)(GLint, GLint, GLsizei, GLsizei) = nullptr;
    void (*scissor)(GLint, GLint, GLsizei, GLsizei) = nullptr;
    void (*enable)(GLenum) = nullptr;
    void (*disable)(GLenum) = nullptr;
    void (*blendFunc)(GLenum, GLenum) = nullptr;
    void (*blendFuncSeparate)(GLenum, GLenum, GLenum, GLenum) = nullptr;
    void (*blendEquationSeparate)(GLenum, GLenum) = nullptr;
    void (*blendColor)(GLfloat, GLfloat, GLfloat, GLfloat) = nullptr;
    void (*depthFunc)(GLenum) = nullptr;
    void (*depthMask)(GLboolean) = nullptr;
    void (*frontFace)(GLenum) = nullptr;
    void (*cullFace)(GLenum) = nullptr;
    void (*stencilFuncSeparate)(GLenum, GLenum, GLint, GLuint) = nullptr;
    void (*stencilMaskSeparate)(GLenum, GLuint) = nullptr;
    void (*stencilOpSeparate)(GLenum, GLenum, GLenum, GLenum) = nullptr;
    void (*pixelStorei)(GLenum, GLint) = nullptr;
    GLenum (*getError)() = nullptr;
    void (*finish)() = nullptr;
    void (*flush)() = nullptr;
    void (*getIntegerv)(GLenum, GLint*) = nullptr;
    const GLubyte* (*getString)(GLenum) = nullptr;

    // Textures
    void (*genTextures)(GLsizei, GLuint*) = nullptr;
    void (*deleteTextures)(GLsizei, const GLuint*) = nullptr;
    void (*bindTexture)(GLenum, GLuint) = nullptr;
    void (*activeTexture)(GLenum) = nullptr;
    void (*texImage2D)(GLenum, GLint, GLint, GLsizei, GLsizei, GLint, GLenum, GLenum, const void*) = nullptr;
    void (*texSubImage2D)(GLenum, GLint, GLint, GLint, GLsizei, GLsizei, GLenum, GLenum, const void*) = nullptr;
    void (*texParameteri)(GLenum, GLenum, GLint) = nullptr;
    void (*generateMipmap)(GLenum) = nullptr;
    void (*copyTexImage2D)(GLenum, GLint, GLenum, GLint, GLint, GLsizei, GLsizei, GLint) = nullptr;
    void (*readPixels)(GLint, GLint, GLsizei, GLsizei, GLenum, GLenum, void*) = nullptr;

    // Buffers
    void (*genBuffers)(GLsizei, GLuint*) = nullptr;
    void (*deleteBuffers)(GLsizei, const GLuint*) = nullptr;
    void (*bindBuffer)(GLenum, GLuint) = nullptr;
    void (*bufferData)(GLenum, GLsizeiptr, const void*, GLenum) = nullptr;
    void (*bufferSubData)(GLenum, GLintptr, GLsizeiptr, const void*) = nullptr;

    // Framebuffers and renderbuffers
    void (*genFramebuffers)(GLsizei, GLuint*) = nullptr;
    void (*deleteFramebuffers)(GLsizei, const GLuint*) = nullptr;
    void (*bindFramebuffer)(GLenum, GLuint) = nullptr;
    void (*framebufferTexture2D)(GLenum, GLenum, GLenum, GLuint, GLint) = nullptr;
    void (*genRenderbuffers)(GLsizei, GLuint*) = nullptr;
    void (*deleteRenderbuffers)(GLsizei, const GLuint*) = nullptr;
    void (*bindRenderbuffer)(GLenum, GLuint) = nullptr;
    void (*renderbufferStorage)(GLenum, GLenum, GLsizei, GLsizei) = nullptr;
    void (*framebufferRenderbuffer)(GLenum, GLenum, GLenum, GLuint) = nullptr;

    // Shaders and programs
    GLuint (*createShader)(GLenum) = nullptr;
    void (*shaderSource)(GLuint, GLsizei, const GLchar* const*, const GLint*) = nullptr;
    void (*compileShader)(GLuint) = nullptr;
    void (*getShaderiv)(GLuint, GLenum, GLint*) = nullptr;
    void (*getShaderInfoLog)(GLuint, GLsizei, GLsizei*, GLchar*) = nullptr;
    void (*deleteShader)(GLuint) = nullptr;
    GLuint (*createProgram)() = nullptr;
    void (*attachShader)(GLuint, GLuint) = nullptr;
    void (*detachShader)(GLuint, GLuint) = nullptr;
    void (*linkProgram)(GLuint) = nullptr;
    void (*getProgramiv)(GLuint, GLenum, GLint*) = nullptr;
    void (*getProgramInfoLog)(GLuint, GLsizei, GLsizei*, GLchar*) = nullptr;
    void (*deleteProgram)(GLuint) = nullptr;
    void (*useProgram)(GLuint) = nullptr;
    GLint (*getAttribLocation)(GLuint, const GLchar*) = nullptr;
    GLint (*getUniformLocation)(GLuint, const GLchar*) = nullptr;
    void (*getActiveUniform)(GLuint, GLuint, GLsizei, GLsizei*, GLint*, GLenum*, GLchar*) = nullptr;

    // Uniforms
    void (*uniform1f)(GLint, GLfloat) = nullptr;
    void (*uniform1i)(GLint, GLint) = nullptr;
    void (*uniform1fv)(GLint, GLsizei, const GLfloat*) = nullptr;
    void (*uniform2fv)(GLint, GLsizei, const GLfloat*) = nullptr;
    void (*uniform3fv)(GLint, GLsizei, const GLfloat*) = nullptr;
    void (*uniform4fv)(GLint, GLsizei, const GLfloat*) = nullptr;
    void (*uniform1iv)(GLint, GLsizei, const GLint*) = nullptr;
    void (*uniform2iv)(GLint, GLsizei, const GLint*) = nullptr;
    void (*uniform3iv)(GLint, GLsizei, const GLint*) = nullptr;
    void (*uniform4iv)(GLint, GLsizei, const GLint*) = nullptr;
    void (*uniformMatrix4fv)(GLint, GLsizei, GLboolean, const GLfloat*) = nullptr;

    // Vertex input and draws
    void (*enableVertexAttribArray)(GLuint) = nullptr;
    void (*disableVertexAttribArray)(GLuint) = nullptr;
    void (*vertexAttribPointer)(GLuint, GLint, GLenum, GLboolean, GLsizei, const void*) = nullptr;
    void (*drawArrays)(GLenum, GLint, GLsizei) = nullptr;
    void (*drawElements)(GLenum, GLsizei, GLenum, const void*) = nullptr;

    // Optional: installed by capability detection
    void (*genVertexArrays)(GLsizei, GLuint*) = nullptr;
    void (*deleteVertexArrays)(GLsizei, const GLuint*) = nullptr;
    void (*bindVertexArray)(GLuint) = nullptr;
    void (*vertexAttribDivisor)(GLuint, GLuint) = nullptr;
    void (*drawArraysInstanced)(GLenum, GLint, GLsizei, GLsizei) = nullptr;
    void (*drawElementsInstanced)(GLenum, GLsizei, GLenum, const void*, GLsizei) = nullptr;
    void (*vertexAttribIPointer)(GLuint, GLint, GLenum, GLsizei, const void*) = nullptr;
    void (*genQueries)(GLsizei, GLuint*) = nullptr;
    void (*deleteQueries)(GLsizei, const GLuint*) = nullptr;
    void (*beginQuery)(GLenum, GLuint) = nullptr;
    void (*endQuery)(GLenum) = nullptr;
    void (*getQueryObjectiv)(GLuint, GLenum, GLint*) = nullptr;
    void (*getQueryObjectui64v)(GLuint, GLenum, uint64_t*) = nullptr;
    void (*drawBuffers)(GLsizei, const GLenum*) = nullptr;
};

/**
 * Resolves an entry point by name (nullptr when missing).
 */
using ProcLoader = std::function<void*(const char* name)>;

/**
 * Fill the core GLES 2.0 slots. Returns false (and logs the first missing
 * name) if any core entry point could not be resolved.
 */
bool loadCoreFunctions(GlApi& api, const ProcLoader& load);

/**
 * Bytes covered by a tightly packed w x h image of the given format/type.
 */
size_t textureSize(GLenum format, GLenum type, GLsizei width, GLsizei height);

}  // namespace gl
}  // namespace hostbridge
