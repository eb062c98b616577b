#pragma once

/**
 * GL Bridge
 *
 * The "gl" call-table group. Guest code calls GLES-shaped functions with
 * small integer object ids; each object kind has its own handle table that
 * maps those ids to native GL names. Id 0 always means "no object".
 *
 * Uniform locations are also ids: at link time every active uniform (and
 * every element of a uniform array) gets an id in the uniform table, and
 * glGetUniformLocation resolves "name" or "name[i]" against that cache.
 *
 * All entry points come from the GlApi attached with attachContext(); until
 * then (or after detachContext()) every call is a no-op.
 */

#include "hostbridge/bridge/call_table.h"
#include "hostbridge/bridge/handle_table.h"
#include "hostbridge/gl/capabilities.h"
#include "hostbridge/gl/gl_api.h"
#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>

namespace hostbridge {
namespace bridge {
class GuestMemory;
}

namespace gl {

/**
 * Uniforms of one linked program, keyed by base name (array suffix removed).
 */
struct ProgramInfo {
    struct Uniform {
        GLint size = 1;
        int32_t baseId = 0;  // element i has id baseId + i
    };
    std::map<std::string, Uniform> uniforms;
};

class GlBridge {
public:
    static constexpr uint32_t kVersion = 1;

    struct Options {
        bool transpileShaders = false;  // rewrite shaders even without the guest asking
        bool debug = false;
    };

    GlBridge(bridge::GuestMemory& memory, Options options);

    /**
     * Start using a context. The report must come from detectCapabilities()
     * run on the same GlApi.
     */
    void attachContext(const GlApi& api, CapabilityReport capabilities);

    /**
     * Forget every object of the current context (context lost or shut down).
     */
    void detachContext();

    bool hasContext() const { return attached_; }
    const CapabilityReport& capabilities() const { return capabilities_; }
    int contextMajor() const { return capabilities_.contextMajor; }

    /**
     * Guest request to rewrite GLSL ES 1.00 shaders (set_emscripten_shader_hack).
     */
    void setShaderHack(bool enabled) { shaderHack_ = enabled; }
    bool shaderHack() const { return shaderHack_; }

    /**
     * Whether glShaderSource rewrites shader text for this context.
     */
    bool transpilesShaders() const;

    void registerFunctions(bridge::CallTable& table);

    const ProgramInfo* programInfo(int32_t program) const;

    /**
     * Native GL name behind a guest id (0 when unknown).
     */
    GLuint nativeTexture(int32_t id) const;
    GLuint nativeBuffer(int32_t id) const;
    GLuint nativeProgram(int32_t id) const;
    GLuint nativeShader(int32_t id) const;

    size_t liveTextureCount() const { return textures_.liveCount(); }
    size_t liveBufferCount() const { return buffers_.liveCount(); }

private:
    using NameTable = bridge::HandleTable<GLuint>;
    using GenFn = void (*)(GLsizei, GLuint*);
    using DeleteFn = void (*)(GLsizei, const GLuint*);

    void genObjects(NameTable& table, GenFn gen, int32_t count, uint32_t outPtr, const char* caller);
    void deleteObjects(NameTable& table, DeleteFn del, int32_t count, uint32_t idsPtr, const char* caller);
    /**
     * Native name for a guest id. Id 0 resolves to 0; freed or unknown ids
     * are logged and return false so the call is skipped.
     */
    bool resolve(NameTable& table, int32_t id, GLuint& name, const char* caller);

    /**
     * Native location for a uniform id, or -1 (silently for negative ids).
     */
    GLint resolveUniform(int32_t location, const char* caller);
    void releaseUniforms(int32_t program);

    /**
     * Guest id currently holding a native name (reverse lookup for glGet).
     */
    int32_t guestIdFor(NameTable& table, GLuint name);

    void populateUniformTable(int32_t program, GLuint native);
    int32_t uniformLocation(int32_t program, const std::string& name);

    std::string readShaderSource(int32_t count, uint32_t stringsPtr, uint32_t lengthsPtr);
    void writeInfoLog(const std::string& log, int32_t maxLength, uint32_t lengthPtr, uint32_t bufferPtr,
                      const char* caller);
    std::string shaderInfoLog(GLuint shader);
    std::string programInfoLog(GLuint program);

    void getIntegerv(GLenum pname, uint32_t outPtr);
    int32_t getString(GLenum name);

    bridge::GuestMemory& memory_;
    Options options_;
    GlApi api_;
    CapabilityReport capabilities_;
    bool attached_ = false;
    bool shaderHack_ = false;

    NameTable textures_{"texture"};
    NameTable buffers_{"buffer"};
    NameTable framebuffers_{"framebuffer"};
    NameTable renderbuffers_{"renderbuffer"};
    NameTable programs_{"program"};
    NameTable shaders_{"shader"};
    NameTable vertexArrays_{"vertex array"};
    NameTable queries_{"query"};
    bridge::HandleTable<GLint> uniforms_{"uniform location"};

    std::unordered_map<int32_t, ProgramInfo> programInfos_;
    std::unordered_map<int32_t, GLenum> shaderTypes_;
};

}  // namespace gl
}  // namespace hostbridge
