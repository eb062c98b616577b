#include "hostbridge/gl/gl_api.h"
#include <iostream>

namespace hostbridge {
namespace gl {

namespace {

template <typename Fn>
bool loadInto(Fn& slot, const ProcLoader& load, const char* name) {
    slot = reinterpret_cast<Fn>(load(name));
    if (!slot) {
        std::cerr << "[GL] Missing core entry point: " << name << std::endl;
        return false;
    }
    return true;
}

}  // namespace

bool loadCoreFunctions(GlApi& api, const ProcLoader& load) {
    bool ok = true;
#define HOSTBRIDGE_GL_LOAD(slot, name) ok = loadInto(api.slot, load, name) && ok

    HOSTBRIDGE_GL_LOAD(clearColor, "glClearColor");
    HOSTBRIDGE_GL_LOAD(clearDepthf, "glClearDepthf");
    HOSTBRIDGE_GL_LOAD(clearStencil, "glClearStencil");
    HOSTBRIDGE_GL_LOAD(clear, "glClear");
    HOSTBRIDGE_GL_LOAD(colorMask, "glColorMask");
    HOSTBRIDGE_GL_LOAD(viewport, "glViewport");
    HOSTBRIDGE_GL_LOAD(scissor, "glScissor");
    HOSTBRIDGE_GL_LOAD(enable, "glEnable");
    HOSTBRIDGE_GL_LOAD(disable, "glDisable");
    HOSTBRIDGE_GL_LOAD(blendFunc, "glBlendFunc");
    HOSTBRIDGE_GL_LOAD(blendFuncSeparate, "glBlendFuncSeparate");
    HOSTBRIDGE_GL_LOAD(blendEquationSeparate, "glBlendEquationSeparate");
    HOSTBRIDGE_GL_LOAD(blendColor, "glBlendColor");
    HOSTBRIDGE_GL_LOAD(depthFunc, "glDepthFunc");
    HOSTBRIDGE_GL_LOAD(depthMask, "glDepthMask");
    HOSTBRIDGE_GL_LOAD(frontFace, "glFrontFace");
    HOSTBRIDGE_GL_LOAD(cullFace, "glCullFace");
    HOSTBRIDGE_GL_LOAD(stencilFuncSeparate, "glStencilFuncSeparate");
    HOSTBRIDGE_GL_LOAD(stencilMaskSeparate, "glStencilMaskSeparate");
    HOSTBRIDGE_GL_LOAD(stencilOpSeparate, "glStencilOpSeparate");
    HOSTBRIDGE_GL_LOAD(pixelStorei, "glPixelStorei");
    HOSTBRIDGE_GL_LOAD(getError, "glGetError");
    HOSTBRIDGE_GL_LOAD(finish, "glFinish");
    HOSTBRIDGE_GL_LOAD(flush, "glFlush");
    HOSTBRIDGE_GL_LOAD(getIntegerv, "glGetIntegerv");
    HOSTBRIDGE_GL_LOAD(getString, "glGetString");

    HOSTBRIDGE_GL_LOAD(genTextures, "glGenTextures");
    HOSTBRIDGE_GL_LOAD(deleteTextures, "glDeleteTextures");
    HOSTBRIDGE_GL_LOAD(bindTexture, "glBindTexture");
    HOSTBRIDGE_GL_LOAD(activeTexture, "glActiveTexture");
    HOSTBRIDGE_GL_LOAD(texImage2D, "glTexImage2D");
    HOSTBRIDGE_GL_LOAD(texSubImage2D, "glTexSubImage2D");
    HOSTBRIDGE_GL_LOAD(texParameteri, "glTexParameteri");
    HOSTBRIDGE_GL_LOAD(generateMipmap, "glGenerateMipmap");
    HOSTBRIDGE_GL_LOAD(copyTexImage2D, "glCopyTexImage2D");
    HOSTBRIDGE_GL_LOAD(readPixels, "glReadPixels");

    HOSTBRIDGE_GL_LOAD(genBuffers, "glGenBuffers");
    HOSTBRIDGE_GL_LOAD(deleteBuffers, "glDeleteBuffers");
    HOSTBRIDGE_GL_LOAD(bindBuffer, "glBindBuffer");
    HOSTBRIDGE_GL_LOAD(bufferData, "glBufferData");
    HOSTBRIDGE_GL_LOAD(bufferSubData, "glBufferSubData");

    HOSTBRIDGE_GL_LOAD(genFramebuffers, "glGenFramebuffers");
    HOSTBRIDGE_GL_LOAD(deleteFramebuffers, "glDeleteFramebuffers");
    HOSTBRIDGE_GL_LOAD(bindFramebuffer, "glBindFramebuffer");
    HOSTBRIDGE_GL_LOAD(framebufferTexture2D, "glFramebufferTexture2D");
    HOSTBRIDGE_GL_LOAD(genRenderbuffers, "glGenRenderbuffers");
    HOSTBRIDGE_GL_LOAD(deleteRenderbuffers, "glDeleteRenderbuffers");
    HOSTBRIDGE_GL_LOAD(bindRenderbuffer, "glBindRenderbuffer");
    HOSTBRIDGE_GL_LOAD(renderbufferStorage, "glRenderbufferStorage");
    HOSTBRIDGE_GL_LOAD(framebufferRenderbuffer, "glFramebufferRenderbuffer");

    HOSTBRIDGE_GL_LOAD(createShader, "glCreateShader");
    HOSTBRIDGE_GL_LOAD(shaderSource, "glShaderSource");
    HOSTBRIDGE_GL_LOAD(compileShader, "glCompileShader");
    HOSTBRIDGE_GL_LOAD(getShaderiv, "glGetShaderiv");
    HOSTBRIDGE_GL_LOAD(getShaderInfoLog, "glGetShaderInfoLog");
    HOSTBRIDGE_GL_LOAD(deleteShader, "glDeleteShader");
    HOSTBRIDGE_GL_LOAD(createProgram, "glCreateProgram");
    HOSTBRIDGE_GL_LOAD(attachShader, "glAttachShader");
    HOSTBRIDGE_GL_LOAD(detachShader, "glDetachShader");
    HOSTBRIDGE_GL_LOAD(linkProgram, "glLinkProgram");
    HOSTBRIDGE_GL_LOAD(getProgramiv, "glGetProgramiv");
    HOSTBRIDGE_GL_LOAD(getProgramInfoLog, "glGetProgramInfoLog");
    HOSTBRIDGE_GL_LOAD(deleteProgram, "glDeleteProgram");
    HOSTBRIDGE_GL_LOAD(useProgram, "glUseProgram");
    HOSTBRIDGE_GL_LOAD(getAttribLocation, "glGetAttribLocation");
    HOSTBRIDGE_GL_LOAD(getUniformLocation, "glGetUniformLocation");
    HOSTBRIDGE_GL_LOAD(getActiveUniform, "glGetActiveUniform");

    HOSTBRIDGE_GL_LOAD(uniform1f, "glUniform1f");
    HOSTBRIDGE_GL_LOAD(uniform1i, "glUniform1i");
    HOSTBRIDGE_GL_LOAD(uniform1fv, "glUniform1fv");
    HOSTBRIDGE_GL_LOAD(uniform2fv, "glUniform2fv");
    HOSTBRIDGE_GL_LOAD(uniform3fv, "glUniform3fv");
    HOSTBRIDGE_GL_LOAD(uniform4fv, "glUniform4fv");
    HOSTBRIDGE_GL_LOAD(uniform1iv, "glUniform1iv");
    HOSTBRIDGE_GL_LOAD(uniform2iv, "glUniform2iv");
    HOSTBRIDGE_GL_LOAD(uniform3iv, "glUniform3iv");
    HOSTBRIDGE_GL_LOAD(uniform4iv, "glUniform4iv");
    HOSTBRIDGE_GL_LOAD(uniformMatrix4fv, "glUniformMatrix4fv");

    HOSTBRIDGE_GL_LOAD(enableVertexAttribArray, "glEnableVertexAttribArray");
    HOSTBRIDGE_GL_LOAD(disableVertexAttribArray, "glDisableVertexAttribArray");
    HOSTBRIDGE_GL_LOAD(vertexAttribPointer, "glVertexAttribPointer");
    HOSTBRIDGE_GL_LOAD(drawArrays, "glDrawArrays");
    HOSTBRIDGE_GL_LOAD(drawElements, "glDrawElements");

#undef HOSTBRIDGE_GL_LOAD
    return ok;
}

size_t textureSize(GLenum format, GLenum type, GLsizei width, GLsizei height) {
    if (width <= 0 || height <= 0) return 0;

    size_t channels;
    switch (format) {
        case GL_ALPHA:
        case GL_LUMINANCE:
        case GL_DEPTH_COMPONENT:
        case kGlRed:
            channels = 1;
            break;
        case GL_LUMINANCE_ALPHA:
        case kGlRg:
            channels = 2;
            break;
        case GL_RGBA:
            channels = 4;
            break;
        case GL_RGB:
        default:
            channels = 3;
            break;
    }

    size_t bytesPerPixel;
    switch (type) {
        // Packed formats store a whole pixel in one short
        case GL_UNSIGNED_SHORT_5_6_5:
        case GL_UNSIGNED_SHORT_4_4_4_4:
        case GL_UNSIGNED_SHORT_5_5_5_1:
            bytesPerPixel = 2;
            break;
        case GL_UNSIGNED_SHORT:
        case kGlHalfFloat:
        case kGlHalfFloatOes:
            bytesPerPixel = channels * 2;
            break;
        case GL_UNSIGNED_INT:
        case GL_FLOAT:
            bytesPerPixel = channels * 4;
            break;
        default:
            bytesPerPixel = channels;
            break;
    }
    return static_cast<size_t>(width) * static_cast<size_t>(height) * bytesPerPixel;
}

}  // namespace gl
}  // namespace hostbridge
