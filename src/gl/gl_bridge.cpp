/**
 * GL Bridge
 *
 * GLES entry points exposed to the guest with integer object ids.
 */

#include "hostbridge/gl/gl_bridge.h"
#include "hostbridge/bridge/guest_memory.h"
#include "hostbridge/gl/shader_transpiler.h"
#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <vector>

namespace hostbridge {
namespace gl {

using bridge::Args;
using guest::Value;

namespace {

int32_t i32(const Args& args, size_t index) { return bridge::arg(args, index).asI32(); }
uint32_t u32(const Args& args, size_t index) { return bridge::arg(args, index).asU32(); }
float f32(const Args& args, size_t index) { return bridge::arg(args, index).asF32(); }

const void* offsetPointer(const Args& args, size_t index) {
    return reinterpret_cast<const void*>(static_cast<uintptr_t>(bridge::arg(args, index).asU32()));
}

// glGetIntegerv results with more than one value
int integerCount(GLenum pname) {
    switch (pname) {
        case GL_VIEWPORT:
        case GL_SCISSOR_BOX:
        case GL_COLOR_WRITEMASK:
        case GL_BLEND_COLOR:
        case GL_COLOR_CLEAR_VALUE:
            return 4;
        case GL_MAX_VIEWPORT_DIMS:
        case GL_ALIASED_POINT_SIZE_RANGE:
        case GL_ALIASED_LINE_WIDTH_RANGE:
        case GL_DEPTH_RANGE:
            return 2;
        default:
            return 1;
    }
}

constexpr GLenum kVertexArrayBinding = 0x85B5;

}  // namespace

GlBridge::GlBridge(bridge::GuestMemory& memory, Options options)
    : memory_(memory)
    , options_(options) {}

void GlBridge::attachContext(const GlApi& api, CapabilityReport capabilities) {
    if (attached_) {
        detachContext();
    }
    api_ = api;
    capabilities_ = std::move(capabilities);
    attached_ = true;
}

void GlBridge::detachContext() {
    textures_.clear();
    buffers_.clear();
    framebuffers_.clear();
    renderbuffers_.clear();
    programs_.clear();
    shaders_.clear();
    vertexArrays_.clear();
    queries_.clear();
    uniforms_.clear();
    programInfos_.clear();
    shaderTypes_.clear();
    api_ = GlApi();
    attached_ = false;
}

bool GlBridge::transpilesShaders() const {
    return (shaderHack_ || options_.transpileShaders) && capabilities_.contextMajor >= 3;
}

const ProgramInfo* GlBridge::programInfo(int32_t program) const {
    auto it = programInfos_.find(program);
    return it == programInfos_.end() ? nullptr : &it->second;
}

GLuint GlBridge::nativeTexture(int32_t id) const {
    return textures_.isLive(id) ? *textures_.lookup(id) : 0;
}

GLuint GlBridge::nativeBuffer(int32_t id) const {
    return buffers_.isLive(id) ? *buffers_.lookup(id) : 0;
}

GLuint GlBridge::nativeProgram(int32_t id) const {
    return programs_.isLive(id) ? *programs_.lookup(id) : 0;
}

GLuint GlBridge::nativeShader(int32_t id) const {
    return shaders_.isLive(id) ? *shaders_.lookup(id) : 0;
}

// ============================================================================
// Object helpers
// ============================================================================

void GlBridge::genObjects(NameTable& table, GenFn gen, int32_t count, uint32_t outPtr, const char* caller) {
    if (count <= 0) return;
    // Validate the destination before the driver creates anything
    if (!memory_.arrayBytes(outPtr, static_cast<size_t>(count), sizeof(int32_t), caller)) return;

    std::vector<GLuint> names(static_cast<size_t>(count), 0);
    if (gen) {
        gen(count, names.data());
    }

    std::vector<int32_t> ids(names.size(), 0);
    for (size_t i = 0; i < names.size(); i++) {
        if (names[i] == 0) {
            if (gen) {
                std::cerr << "[GL] " << caller << ": driver returned no object, context may be lost" << std::endl;
            }
            continue;
        }
        ids[i] = table.allocate(names[i]);
    }
    memory_.writeArray(outPtr, ids.data(), ids.size(), caller);
}

void GlBridge::deleteObjects(NameTable& table, DeleteFn del, int32_t count, uint32_t idsPtr, const char* caller) {
    if (count <= 0) return;

    auto ids = memory_.readArray<int32_t>(idsPtr, static_cast<size_t>(count), caller);
    for (int32_t id : ids) {
        // Deleting 0 or an already deleted object is silently ignored
        if (!table.isLive(id)) continue;
        GLuint name = *table.lookup(id, caller);
        if (del) {
            del(1, &name);
        }
        table.free(id);
    }
}

bool GlBridge::resolve(NameTable& table, int32_t id, GLuint& name, const char* caller) {
    if (id == 0) {
        name = 0;
        return true;
    }
    GLuint* found = table.lookup(id, caller);
    if (!found) return false;
    name = *found;
    return true;
}

GLint GlBridge::resolveUniform(int32_t location, const char* caller) {
    if (location < 0) return -1;
    GLint* found = uniforms_.lookup(location, caller);
    return found ? *found : -1;
}

int32_t GlBridge::guestIdFor(NameTable& table, GLuint name) {
    if (name == 0) return 0;
    int32_t result = 0;
    table.forEachLive([&](int32_t id, GLuint& native) {
        if (native == name) result = id;
    });
    return result;
}

// ============================================================================
// Programs and uniforms
// ============================================================================

void GlBridge::releaseUniforms(int32_t program) {
    auto it = programInfos_.find(program);
    if (it == programInfos_.end()) return;
    for (const auto& entry : it->second.uniforms) {
        for (GLint i = 0; i < entry.second.size; i++) {
            uniforms_.free(entry.second.baseId + i);
        }
    }
    programInfos_.erase(it);
}

void GlBridge::populateUniformTable(int32_t program, GLuint native) {
    // Relinking replaces every entry of the previous link
    releaseUniforms(program);

    ProgramInfo info;
    GLint activeCount = 0;
    GLint maxLength = 0;
    api_.getProgramiv(native, GL_ACTIVE_UNIFORMS, &activeCount);
    api_.getProgramiv(native, GL_ACTIVE_UNIFORM_MAX_LENGTH, &maxLength);

    std::vector<GLchar> nameBuffer(static_cast<size_t>(std::max(maxLength, 1)) + 1, 0);
    for (GLint i = 0; i < activeCount; i++) {
        GLsizei length = 0;
        GLint size = 0;
        GLenum type = 0;
        api_.getActiveUniform(native, static_cast<GLuint>(i), static_cast<GLsizei>(nameBuffer.size()),
                              &length, &size, &type, nameBuffer.data());

        std::string name(nameBuffer.data(), static_cast<size_t>(std::max(length, 0)));
        if (!name.empty() && name.back() == ']') {
            name = name.substr(0, name.rfind('['));
        }

        GLint location = api_.getUniformLocation(native, name.c_str());
        if (location < 0) continue;

        ProgramInfo::Uniform uniform;
        uniform.size = std::max(size, 1);
        uniform.baseId = uniforms_.allocate(location);
        for (GLint element = 1; element < uniform.size; element++) {
            std::string elementName = name + "[" + std::to_string(element) + "]";
            uniforms_.allocate(api_.getUniformLocation(native, elementName.c_str()));
        }
        info.uniforms[name] = uniform;
    }

    if (options_.debug) {
        std::cout << "[GL] Program " << program << " linked with " << info.uniforms.size() << " uniforms" << std::endl;
    }
    programInfos_[program] = std::move(info);
}

int32_t GlBridge::uniformLocation(int32_t program, const std::string& fullName) {
    std::string name = fullName;
    long index = 0;
    if (!name.empty() && name.back() == ']') {
        size_t open = name.rfind('[');
        if (open == std::string::npos) return -1;
        if (open + 1 < name.size() && name[open + 1] != ']') {
            index = std::strtol(name.c_str() + open + 1, nullptr, 10);
        }
        name = name.substr(0, open);
    }

    const ProgramInfo* info = programInfo(program);
    if (!info) return -1;
    auto it = info->uniforms.find(name);
    if (it == info->uniforms.end()) return -1;
    if (index < 0 || index >= it->second.size) return -1;
    return it->second.baseId + static_cast<int32_t>(index);
}

std::string GlBridge::readShaderSource(int32_t count, uint32_t stringsPtr, uint32_t lengthsPtr) {
    std::string source;
    for (int32_t i = 0; i < count; i++) {
        uint32_t offset = static_cast<uint32_t>(i) * 4;
        uint32_t strPtr = 0;
        if (!memory_.readValue(stringsPtr + offset, strPtr, "glShaderSource")) break;

        int32_t length = -1;
        if (lengthsPtr != 0 && !memory_.readValue(lengthsPtr + offset, length, "glShaderSource")) break;

        if (length < 0) {
            source += memory_.readCString(strPtr, "glShaderSource");
        } else {
            auto bytes = memory_.copyBytes(strPtr, static_cast<size_t>(length), "glShaderSource");
            source.append(bytes.begin(), bytes.end());
        }
    }
    return source;
}

std::string GlBridge::shaderInfoLog(GLuint shader) {
    GLint length = 0;
    api_.getShaderiv(shader, GL_INFO_LOG_LENGTH, &length);
    if (length <= 1) return std::string();
    std::vector<GLchar> buffer(static_cast<size_t>(length), 0);
    GLsizei written = 0;
    api_.getShaderInfoLog(shader, length, &written, buffer.data());
    return std::string(buffer.data(), static_cast<size_t>(std::max(written, 0)));
}

std::string GlBridge::programInfoLog(GLuint program) {
    GLint length = 0;
    api_.getProgramiv(program, GL_INFO_LOG_LENGTH, &length);
    if (length <= 1) return std::string();
    std::vector<GLchar> buffer(static_cast<size_t>(length), 0);
    GLsizei written = 0;
    api_.getProgramInfoLog(program, length, &written, buffer.data());
    return std::string(buffer.data(), static_cast<size_t>(std::max(written, 0)));
}

void GlBridge::writeInfoLog(const std::string& log, int32_t maxLength, uint32_t lengthPtr, uint32_t bufferPtr,
                            const char* caller) {
    int32_t written = 0;
    if (maxLength > 0 && bufferPtr != 0) {
        written = static_cast<int32_t>(std::min(log.size(), static_cast<size_t>(maxLength - 1)));
        std::vector<uint8_t> out(log.begin(), log.begin() + written);
        out.push_back(0);
        if (!memory_.write(bufferPtr, out.data(), out.size(), caller)) {
            written = 0;
        }
    }
    if (lengthPtr != 0) {
        memory_.writeValue(lengthPtr, written, caller);
    }
}

// ============================================================================
// Queries
// ============================================================================

void GlBridge::getIntegerv(GLenum pname, uint32_t outPtr) {
    if (outPtr == 0) {
        std::cerr << "[GL] glGetIntegerv(0x" << std::hex << pname << std::dec << ") called with null out pointer" << std::endl;
        return;
    }

    // Object bindings report the guest id, not the driver name
    NameTable* bindingTable = nullptr;
    switch (pname) {
        case GL_TEXTURE_BINDING_2D:
        case GL_TEXTURE_BINDING_CUBE_MAP:
            bindingTable = &textures_;
            break;
        case GL_ARRAY_BUFFER_BINDING:
        case GL_ELEMENT_ARRAY_BUFFER_BINDING:
            bindingTable = &buffers_;
            break;
        case GL_CURRENT_PROGRAM:
            bindingTable = &programs_;
            break;
        case GL_FRAMEBUFFER_BINDING:
            bindingTable = &framebuffers_;
            break;
        case GL_RENDERBUFFER_BINDING:
            bindingTable = &renderbuffers_;
            break;
        case kVertexArrayBinding:
            bindingTable = &vertexArrays_;
            break;
        default:
            break;
    }

    if (bindingTable) {
        GLint native = 0;
        api_.getIntegerv(pname, &native);
        int32_t id = guestIdFor(*bindingTable, static_cast<GLuint>(native));
        memory_.writeValue(outPtr, id, "glGetIntegerv");
        return;
    }

    if (pname == GL_COMPRESSED_TEXTURE_FORMATS) {
        GLint count = 0;
        api_.getIntegerv(GL_NUM_COMPRESSED_TEXTURE_FORMATS, &count);
        std::vector<GLint> formats(static_cast<size_t>(std::max(count, 0)) + 1, 0);
        api_.getIntegerv(pname, formats.data());
        memory_.writeArray(outPtr, formats.data(), static_cast<size_t>(std::max(count, 0)), "glGetIntegerv");
        return;
    }

    GLint values[4] = {0, 0, 0, 0};
    api_.getIntegerv(pname, values);
    memory_.writeArray(outPtr, values, static_cast<size_t>(integerCount(pname)), "glGetIntegerv");
}

int32_t GlBridge::getString(GLenum name) {
    const GLubyte* value = api_.getString(name);
    if (!value) {
        std::cerr << "[GL] glGetString(0x" << std::hex << name << std::dec << ") returned nothing" << std::endl;
        return 0;
    }

    guest::Instance* instance = memory_.instance();
    if (!instance) return 0;

    const char* text = reinterpret_cast<const char*>(value);
    size_t length = std::strlen(text);
    auto result = instance->call("allocate_vec_u8", {Value::fromI32(static_cast<int32_t>(length + 1))});
    if (!result || result->isNone()) {
        std::cerr << "[GL] glGetString: guest could not allocate " << (length + 1) << " bytes" << std::endl;
        return 0;
    }

    uint32_t ptr = result->asU32();
    if (!memory_.write(ptr, text, length + 1, "glGetString")) return 0;
    return static_cast<int32_t>(ptr);
}

// ============================================================================
// Call table
// ============================================================================

void GlBridge::registerFunctions(bridge::CallTable& table) {
    // Every GL call is a no-op until a context is attached
    auto def = [this, &table](const char* name, std::function<Value(const Args&)> fn) {
        table.set(name, [this, fn](const Args& args) -> Value {
            if (!attached_) return Value::none();
            return fn(args);
        });
    };

    // ------------------------------------------------------------------------
    // State
    // ------------------------------------------------------------------------

    def("glClearColor", [this](const Args& a) {
        api_.clearColor(f32(a, 0), f32(a, 1), f32(a, 2), f32(a, 3));
        return Value::none();
    });
    def("glClearDepthf", [this](const Args& a) {
        api_.clearDepthf(f32(a, 0));
        return Value::none();
    });
    def("glClearStencil", [this](const Args& a) {
        api_.clearStencil(i32(a, 0));
        return Value::none();
    });
    def("glClear", [this](const Args& a) {
        api_.clear(u32(a, 0));
        return Value::none();
    });
    def("glColorMask", [this](const Args& a) {
        api_.colorMask(i32(a, 0) != 0, i32(a, 1) != 0, i32(a, 2) != 0, i32(a, 3) != 0);
        return Value::none();
    });
    def("glViewport", [this](const Args& a) {
        api_.viewport(i32(a, 0), i32(a, 1), i32(a, 2), i32(a, 3));
        return Value::none();
    });
    def("glScissor", [this](const Args& a) {
        api_.scissor(i32(a, 0), i32(a, 1), i32(a, 2), i32(a, 3));
        return Value::none();
    });
    def("glEnable", [this](const Args& a) {
        api_.enable(u32(a, 0));
        return Value::none();
    });
    def("glDisable", [this](const Args& a) {
        api_.disable(u32(a, 0));
        return Value::none();
    });
    def("glBlendFunc", [this](const Args& a) {
        api_.blendFunc(u32(a, 0), u32(a, 1));
        return Value::none();
    });
    def("glBlendFuncSeparate", [this](const Args& a) {
        api_.blendFuncSeparate(u32(a, 0), u32(a, 1), u32(a, 2), u32(a, 3));
        return Value::none();
    });
    def("glBlendEquationSeparate", [this](const Args& a) {
        api_.blendEquationSeparate(u32(a, 0), u32(a, 1));
        return Value::none();
    });
    def("glBlendColor", [this](const Args& a) {
        api_.blendColor(f32(a, 0), f32(a, 1), f32(a, 2), f32(a, 3));
        return Value::none();
    });
    def("glDepthFunc", [this](const Args& a) {
        api_.depthFunc(u32(a, 0));
        return Value::none();
    });
    def("glDepthMask", [this](const Args& a) {
        api_.depthMask(i32(a, 0) != 0);
        return Value::none();
    });
    def("glFrontFace", [this](const Args& a) {
        api_.frontFace(u32(a, 0));
        return Value::none();
    });
    def("glCullFace", [this](const Args& a) {
        api_.cullFace(u32(a, 0));
        return Value::none();
    });
    def("glStencilFuncSeparate", [this](const Args& a) {
        api_.stencilFuncSeparate(u32(a, 0), u32(a, 1), i32(a, 2), u32(a, 3));
        return Value::none();
    });
    def("glStencilMaskSeparate", [this](const Args& a) {
        api_.stencilMaskSeparate(u32(a, 0), u32(a, 1));
        return Value::none();
    });
    def("glStencilOpSeparate", [this](const Args& a) {
        api_.stencilOpSeparate(u32(a, 0), u32(a, 1), u32(a, 2), u32(a, 3));
        return Value::none();
    });
    def("glPixelStorei", [this](const Args& a) {
        api_.pixelStorei(u32(a, 0), i32(a, 1));
        return Value::none();
    });
    def("glGetError", [this](const Args&) {
        return Value::fromI32(static_cast<int32_t>(api_.getError()));
    });
    def("glFinish", [this](const Args&) {
        api_.finish();
        return Value::none();
    });
    def("glFlush", [this](const Args&) {
        api_.flush();
        return Value::none();
    });
    def("glGetIntegerv", [this](const Args& a) {
        getIntegerv(u32(a, 0), u32(a, 1));
        return Value::none();
    });
    def("glGetString", [this](const Args& a) {
        return Value::fromI32(getString(u32(a, 0)));
    });

    // ------------------------------------------------------------------------
    // Textures
    // ------------------------------------------------------------------------

    def("glGenTextures", [this](const Args& a) {
        genObjects(textures_, api_.genTextures, i32(a, 0), u32(a, 1), "glGenTextures");
        return Value::none();
    });
    def("glDeleteTextures", [this](const Args& a) {
        deleteObjects(textures_, api_.deleteTextures, i32(a, 0), u32(a, 1), "glDeleteTextures");
        return Value::none();
    });
    def("glBindTexture", [this](const Args& a) {
        GLuint name = 0;
        if (resolve(textures_, i32(a, 1), name, "glBindTexture")) {
            api_.bindTexture(u32(a, 0), name);
        }
        return Value::none();
    });
    def("glActiveTexture", [this](const Args& a) {
        api_.activeTexture(u32(a, 0));
        return Value::none();
    });
    def("glTexImage2D", [this](const Args& a) {
        GLsizei width = i32(a, 3);
        GLsizei height = i32(a, 4);
        GLenum format = u32(a, 6);
        GLenum type = u32(a, 7);
        uint32_t pixelsPtr = u32(a, 8);
        const uint8_t* pixels = nullptr;
        if (pixelsPtr != 0) {
            pixels = memory_.bytes(pixelsPtr, textureSize(format, type, width, height), "glTexImage2D");
            if (!pixels) return Value::none();
        }
        api_.texImage2D(u32(a, 0), i32(a, 1), i32(a, 2), width, height, i32(a, 5), format, type, pixels);
        return Value::none();
    });
    def("glTexSubImage2D", [this](const Args& a) {
        GLsizei width = i32(a, 4);
        GLsizei height = i32(a, 5);
        GLenum format = u32(a, 6);
        GLenum type = u32(a, 7);
        uint32_t pixelsPtr = u32(a, 8);
        const uint8_t* pixels = nullptr;
        if (pixelsPtr != 0) {
            pixels = memory_.bytes(pixelsPtr, textureSize(format, type, width, height), "glTexSubImage2D");
            if (!pixels) return Value::none();
        }
        api_.texSubImage2D(u32(a, 0), i32(a, 1), i32(a, 2), i32(a, 3), width, height, format, type, pixels);
        return Value::none();
    });
    def("glTexParameteri", [this](const Args& a) {
        api_.texParameteri(u32(a, 0), u32(a, 1), i32(a, 2));
        return Value::none();
    });
    def("glGenerateMipmap", [this](const Args& a) {
        api_.generateMipmap(u32(a, 0));
        return Value::none();
    });
    def("glCopyTexImage2D", [this](const Args& a) {
        api_.copyTexImage2D(u32(a, 0), i32(a, 1), u32(a, 2), i32(a, 3), i32(a, 4), i32(a, 5), i32(a, 6), i32(a, 7));
        return Value::none();
    });
    def("glReadPixels", [this](const Args& a) {
        GLsizei width = i32(a, 2);
        GLsizei height = i32(a, 3);
        GLenum format = u32(a, 4);
        GLenum type = u32(a, 5);
        uint8_t* out = memory_.bytes(u32(a, 6), textureSize(format, type, width, height), "glReadPixels");
        if (out) {
            api_.readPixels(i32(a, 0), i32(a, 1), width, height, format, type, out);
        }
        return Value::none();
    });

    // ------------------------------------------------------------------------
    // Buffers
    // ------------------------------------------------------------------------

    def("glGenBuffers", [this](const Args& a) {
        genObjects(buffers_, api_.genBuffers, i32(a, 0), u32(a, 1), "glGenBuffers");
        return Value::none();
    });
    def("glDeleteBuffers", [this](const Args& a) {
        deleteObjects(buffers_, api_.deleteBuffers, i32(a, 0), u32(a, 1), "glDeleteBuffers");
        return Value::none();
    });
    def("glBindBuffer", [this](const Args& a) {
        GLuint name = 0;
        if (resolve(buffers_, i32(a, 1), name, "glBindBuffer")) {
            api_.bindBuffer(u32(a, 0), name);
        }
        return Value::none();
    });
    def("glBufferData", [this](const Args& a) {
        GLsizeiptr size = static_cast<GLsizeiptr>(bridge::arg(a, 1).asI64());
        uint32_t dataPtr = u32(a, 2);
        const uint8_t* data = nullptr;
        // A null pointer only allocates storage
        if (dataPtr != 0) {
            data = memory_.bytes(dataPtr, static_cast<size_t>(size), "glBufferData");
            if (!data) return Value::none();
        }
        api_.bufferData(u32(a, 0), size, data, u32(a, 3));
        return Value::none();
    });
    def("glBufferSubData", [this](const Args& a) {
        GLintptr offset = static_cast<GLintptr>(bridge::arg(a, 1).asI64());
        GLsizeiptr size = static_cast<GLsizeiptr>(bridge::arg(a, 2).asI64());
        const uint8_t* data = memory_.bytes(u32(a, 3), static_cast<size_t>(size), "glBufferSubData");
        if (data) {
            api_.bufferSubData(u32(a, 0), offset, size, data);
        }
        return Value::none();
    });

    // ------------------------------------------------------------------------
    // Framebuffers and renderbuffers
    // ------------------------------------------------------------------------

    def("glGenFramebuffers", [this](const Args& a) {
        genObjects(framebuffers_, api_.genFramebuffers, i32(a, 0), u32(a, 1), "glGenFramebuffers");
        return Value::none();
    });
    def("glDeleteFramebuffers", [this](const Args& a) {
        deleteObjects(framebuffers_, api_.deleteFramebuffers, i32(a, 0), u32(a, 1), "glDeleteFramebuffers");
        return Value::none();
    });
    def("glBindFramebuffer", [this](const Args& a) {
        GLuint name = 0;
        if (resolve(framebuffers_, i32(a, 1), name, "glBindFramebuffer")) {
            api_.bindFramebuffer(u32(a, 0), name);
        }
        return Value::none();
    });
    def("glFramebufferTexture2D", [this](const Args& a) {
        GLuint texture = 0;
        if (resolve(textures_, i32(a, 3), texture, "glFramebufferTexture2D")) {
            api_.framebufferTexture2D(u32(a, 0), u32(a, 1), u32(a, 2), texture, i32(a, 4));
        }
        return Value::none();
    });
    def("glGenRenderbuffers", [this](const Args& a) {
        genObjects(renderbuffers_, api_.genRenderbuffers, i32(a, 0), u32(a, 1), "glGenRenderbuffers");
        return Value::none();
    });
    def("glDeleteRenderbuffers", [this](const Args& a) {
        deleteObjects(renderbuffers_, api_.deleteRenderbuffers, i32(a, 0), u32(a, 1), "glDeleteRenderbuffers");
        return Value::none();
    });
    def("glBindRenderbuffer", [this](const Args& a) {
        GLuint name = 0;
        if (resolve(renderbuffers_, i32(a, 1), name, "glBindRenderbuffer")) {
            api_.bindRenderbuffer(u32(a, 0), name);
        }
        return Value::none();
    });
    def("glRenderbufferStorage", [this](const Args& a) {
        api_.renderbufferStorage(u32(a, 0), u32(a, 1), i32(a, 2), i32(a, 3));
        return Value::none();
    });
    def("glFramebufferRenderbuffer", [this](const Args& a) {
        GLuint renderbuffer = 0;
        if (resolve(renderbuffers_, i32(a, 3), renderbuffer, "glFramebufferRenderbuffer")) {
            api_.framebufferRenderbuffer(u32(a, 0), u32(a, 1), u32(a, 2), renderbuffer);
        }
        return Value::none();
    });

    // ------------------------------------------------------------------------
    // Vertex arrays (optional)
    // ------------------------------------------------------------------------

    def("glGenVertexArrays", [this](const Args& a) {
        genObjects(vertexArrays_, api_.genVertexArrays, i32(a, 0), u32(a, 1), "glGenVertexArrays");
        return Value::none();
    });
    def("glDeleteVertexArrays", [this](const Args& a) {
        deleteObjects(vertexArrays_, api_.deleteVertexArrays, i32(a, 0), u32(a, 1), "glDeleteVertexArrays");
        return Value::none();
    });
    def("glBindVertexArray", [this](const Args& a) {
        GLuint name = 0;
        if (api_.bindVertexArray && resolve(vertexArrays_, i32(a, 0), name, "glBindVertexArray")) {
            api_.bindVertexArray(name);
        }
        return Value::none();
    });

    // ------------------------------------------------------------------------
    // Timer queries (optional)
    // ------------------------------------------------------------------------

    def("glGenQueries", [this](const Args& a) {
        genObjects(queries_, api_.genQueries, i32(a, 0), u32(a, 1), "glGenQueries");
        return Value::none();
    });
    def("glDeleteQueries", [this](const Args& a) {
        deleteObjects(queries_, api_.deleteQueries, i32(a, 0), u32(a, 1), "glDeleteQueries");
        return Value::none();
    });
    def("glBeginQuery", [this](const Args& a) {
        GLuint name = 0;
        if (api_.beginQuery && resolve(queries_, i32(a, 1), name, "glBeginQuery")) {
            api_.beginQuery(u32(a, 0), name);
        }
        return Value::none();
    });
    def("glEndQuery", [this](const Args& a) {
        if (api_.endQuery) {
            api_.endQuery(u32(a, 0));
        }
        return Value::none();
    });
    def("glGetQueryObjectiv", [this](const Args& a) {
        GLuint name = 0;
        if (!api_.getQueryObjectiv || !resolve(queries_, i32(a, 0), name, "glGetQueryObjectiv")) {
            return Value::none();
        }
        GLint result = 0;
        api_.getQueryObjectiv(name, u32(a, 1), &result);
        memory_.writeValue(u32(a, 2), result, "glGetQueryObjectiv");
        return Value::none();
    });
    def("glGetQueryObjectui64v", [this](const Args& a) {
        GLuint name = 0;
        if (!api_.getQueryObjectui64v || !resolve(queries_, i32(a, 0), name, "glGetQueryObjectui64v")) {
            return Value::none();
        }
        uint64_t result = 0;
        api_.getQueryObjectui64v(name, u32(a, 1), &result);
        memory_.writeValue(u32(a, 2), result, "glGetQueryObjectui64v");
        return Value::none();
    });
    def("glDrawBuffers", [this](const Args& a) {
        if (!api_.drawBuffers) return Value::none();
        int32_t count = i32(a, 0);
        if (count <= 0) return Value::none();
        auto buffers = memory_.readArray<GLenum>(u32(a, 1), static_cast<size_t>(count), "glDrawBuffers");
        if (!buffers.empty()) {
            api_.drawBuffers(static_cast<GLsizei>(buffers.size()), buffers.data());
        }
        return Value::none();
    });

    // ------------------------------------------------------------------------
    // Shaders
    // ------------------------------------------------------------------------

    def("glCreateShader", [this](const Args& a) {
        GLenum type = u32(a, 0);
        GLuint native = api_.createShader(type);
        if (native == 0) {
            std::cerr << "[GL] glCreateShader(0x" << std::hex << type << std::dec << ") failed" << std::endl;
            return Value::fromI32(0);
        }
        int32_t id = shaders_.allocate(native);
        shaderTypes_[id] = type;
        return Value::fromI32(id);
    });
    def("glShaderSource", [this](const Args& a) {
        int32_t id = i32(a, 0);
        GLuint native = 0;
        if (!resolve(shaders_, id, native, "glShaderSource") || native == 0) return Value::none();

        std::string source = readShaderSource(i32(a, 1), u32(a, 2), u32(a, 3));
        if (transpilesShaders()) {
            ShaderStage stage = shaderTypes_[id] == GL_VERTEX_SHADER ? ShaderStage::Vertex : ShaderStage::Fragment;
            source = transpileShader(source, stage, ShaderDialect::Glsl300es);
        }

        const GLchar* text = source.c_str();
        GLint length = static_cast<GLint>(source.size());
        api_.shaderSource(native, 1, &text, &length);
        return Value::none();
    });
    def("glCompileShader", [this](const Args& a) {
        int32_t id = i32(a, 0);
        GLuint native = 0;
        if (!resolve(shaders_, id, native, "glCompileShader") || native == 0) return Value::none();

        api_.compileShader(native);
        GLint status = GL_FALSE;
        api_.getShaderiv(native, GL_COMPILE_STATUS, &status);
        if (status != GL_TRUE) {
            std::cerr << "[Shader] Shader " << id << " failed to compile: " << shaderInfoLog(native) << std::endl;
        }
        return Value::none();
    });
    def("glGetShaderiv", [this](const Args& a) {
        GLuint native = 0;
        if (!resolve(shaders_, i32(a, 0), native, "glGetShaderiv") || native == 0) return Value::none();

        GLenum pname = u32(a, 1);
        GLint value = 0;
        if (pname == GL_INFO_LOG_LENGTH) {
            value = static_cast<GLint>(shaderInfoLog(native).size() + 1);
        } else {
            api_.getShaderiv(native, pname, &value);
        }
        memory_.writeValue(u32(a, 2), value, "glGetShaderiv");
        return Value::none();
    });
    def("glGetShaderInfoLog", [this](const Args& a) {
        GLuint native = 0;
        if (!resolve(shaders_, i32(a, 0), native, "glGetShaderInfoLog") || native == 0) return Value::none();
        writeInfoLog(shaderInfoLog(native), i32(a, 1), u32(a, 2), u32(a, 3), "glGetShaderInfoLog");
        return Value::none();
    });
    def("glDeleteShader", [this](const Args& a) {
        int32_t id = i32(a, 0);
        if (!shaders_.isLive(id)) return Value::none();
        api_.deleteShader(*shaders_.lookup(id));
        shaders_.free(id);
        shaderTypes_.erase(id);
        return Value::none();
    });

    // ------------------------------------------------------------------------
    // Programs
    // ------------------------------------------------------------------------

    def("glCreateProgram", [this](const Args&) {
        GLuint native = api_.createProgram();
        if (native == 0) {
            std::cerr << "[GL] glCreateProgram failed" << std::endl;
            return Value::fromI32(0);
        }
        return Value::fromI32(programs_.allocate(native));
    });
    def("glAttachShader", [this](const Args& a) {
        GLuint program = 0;
        GLuint shader = 0;
        if (resolve(programs_, i32(a, 0), program, "glAttachShader") &&
            resolve(shaders_, i32(a, 1), shader, "glAttachShader")) {
            api_.attachShader(program, shader);
        }
        return Value::none();
    });
    def("glDetachShader", [this](const Args& a) {
        GLuint program = 0;
        GLuint shader = 0;
        if (resolve(programs_, i32(a, 0), program, "glDetachShader") &&
            resolve(shaders_, i32(a, 1), shader, "glDetachShader")) {
            api_.detachShader(program, shader);
        }
        return Value::none();
    });
    def("glLinkProgram", [this](const Args& a) {
        int32_t id = i32(a, 0);
        GLuint native = 0;
        if (!resolve(programs_, id, native, "glLinkProgram") || native == 0) return Value::none();

        api_.linkProgram(native);
        GLint status = GL_FALSE;
        api_.getProgramiv(native, GL_LINK_STATUS, &status);
        if (status != GL_TRUE) {
            std::cerr << "[Shader] Program " << id << " failed to link: " << programInfoLog(native) << std::endl;
        }
        populateUniformTable(id, native);
        return Value::none();
    });
    def("glGetProgramiv", [this](const Args& a) {
        GLuint native = 0;
        if (!resolve(programs_, i32(a, 0), native, "glGetProgramiv") || native == 0) return Value::none();

        GLenum pname = u32(a, 1);
        GLint value = 0;
        if (pname == GL_INFO_LOG_LENGTH) {
            value = static_cast<GLint>(programInfoLog(native).size() + 1);
        } else {
            api_.getProgramiv(native, pname, &value);
        }
        memory_.writeValue(u32(a, 2), value, "glGetProgramiv");
        return Value::none();
    });
    def("glGetProgramInfoLog", [this](const Args& a) {
        GLuint native = 0;
        if (!resolve(programs_, i32(a, 0), native, "glGetProgramInfoLog") || native == 0) return Value::none();
        writeInfoLog(programInfoLog(native), i32(a, 1), u32(a, 2), u32(a, 3), "glGetProgramInfoLog");
        return Value::none();
    });
    def("glDeleteProgram", [this](const Args& a) {
        int32_t id = i32(a, 0);
        if (!programs_.isLive(id)) return Value::none();
        api_.deleteProgram(*programs_.lookup(id));
        releaseUniforms(id);
        programs_.free(id);
        return Value::none();
    });
    def("glUseProgram", [this](const Args& a) {
        GLuint native = 0;
        if (resolve(programs_, i32(a, 0), native, "glUseProgram")) {
            api_.useProgram(native);
        }
        return Value::none();
    });
    def("glGetAttribLocation", [this](const Args& a) {
        GLuint native = 0;
        if (!resolve(programs_, i32(a, 0), native, "glGetAttribLocation") || native == 0) {
            return Value::fromI32(-1);
        }
        std::string name = memory_.readCString(u32(a, 1), "glGetAttribLocation");
        return Value::fromI32(api_.getAttribLocation(native, name.c_str()));
    });
    def("glGetUniformLocation", [this](const Args& a) {
        int32_t program = i32(a, 0);
        GLuint native = 0;
        if (!resolve(programs_, program, native, "glGetUniformLocation") || native == 0) {
            return Value::fromI32(-1);
        }
        std::string name = memory_.readCString(u32(a, 1), "glGetUniformLocation");
        return Value::fromI32(uniformLocation(program, name));
    });

    // ------------------------------------------------------------------------
    // Uniforms
    // ------------------------------------------------------------------------

    def("glUniform1f", [this](const Args& a) {
        GLint location = resolveUniform(i32(a, 0), "glUniform1f");
        if (location >= 0) api_.uniform1f(location, f32(a, 1));
        return Value::none();
    });
    def("glUniform1i", [this](const Args& a) {
        GLint location = resolveUniform(i32(a, 0), "glUniform1i");
        if (location >= 0) api_.uniform1i(location, i32(a, 1));
        return Value::none();
    });

    using FloatVecFn = void (*)(GLint, GLsizei, const GLfloat*);
    using IntVecFn = void (*)(GLint, GLsizei, const GLint*);

    auto defFloatVec = [this, &def](const char* name, FloatVecFn GlApi::*slot, size_t components) {
        def(name, [this, name, slot, components](const Args& a) {
            GLint location = resolveUniform(i32(a, 0), name);
            int32_t count = i32(a, 1);
            if (location < 0 || count <= 0) return Value::none();
            auto values = memory_.readArray<GLfloat>(u32(a, 2), components * static_cast<size_t>(count), name);
            if (!values.empty()) (api_.*slot)(location, count, values.data());
            return Value::none();
        });
    };
    auto defIntVec = [this, &def](const char* name, IntVecFn GlApi::*slot, size_t components) {
        def(name, [this, name, slot, components](const Args& a) {
            GLint location = resolveUniform(i32(a, 0), name);
            int32_t count = i32(a, 1);
            if (location < 0 || count <= 0) return Value::none();
            auto values = memory_.readArray<GLint>(u32(a, 2), components * static_cast<size_t>(count), name);
            if (!values.empty()) (api_.*slot)(location, count, values.data());
            return Value::none();
        });
    };

    defFloatVec("glUniform1fv", &GlApi::uniform1fv, 1);
    defFloatVec("glUniform2fv", &GlApi::uniform2fv, 2);
    defFloatVec("glUniform3fv", &GlApi::uniform3fv, 3);
    defFloatVec("glUniform4fv", &GlApi::uniform4fv, 4);
    defIntVec("glUniform1iv", &GlApi::uniform1iv, 1);
    defIntVec("glUniform2iv", &GlApi::uniform2iv, 2);
    defIntVec("glUniform3iv", &GlApi::uniform3iv, 3);
    defIntVec("glUniform4iv", &GlApi::uniform4iv, 4);

    def("glUniformMatrix4fv", [this](const Args& a) {
        GLint location = resolveUniform(i32(a, 0), "glUniformMatrix4fv");
        int32_t count = i32(a, 1);
        if (location < 0 || count <= 0) return Value::none();
        auto values = memory_.readArray<GLfloat>(u32(a, 3), 16 * static_cast<size_t>(count), "glUniformMatrix4fv");
        if (!values.empty()) {
            api_.uniformMatrix4fv(location, count, i32(a, 2) != 0, values.data());
        }
        return Value::none();
    });

    // ------------------------------------------------------------------------
    // Vertex input and draws
    // ------------------------------------------------------------------------

    def("glEnableVertexAttribArray", [this](const Args& a) {
        api_.enableVertexAttribArray(u32(a, 0));
        return Value::none();
    });
    def("glDisableVertexAttribArray", [this](const Args& a) {
        api_.disableVertexAttribArray(u32(a, 0));
        return Value::none();
    });
    def("glVertexAttribPointer", [this](const Args& a) {
        api_.vertexAttribPointer(u32(a, 0), i32(a, 1), u32(a, 2), i32(a, 3) != 0, i32(a, 4), offsetPointer(a, 5));
        return Value::none();
    });
    def("glVertexAttribIPointer", [this](const Args& a) {
        if (api_.vertexAttribIPointer) {
            api_.vertexAttribIPointer(u32(a, 0), i32(a, 1), u32(a, 2), i32(a, 3), offsetPointer(a, 4));
        }
        return Value::none();
    });
    def("glVertexAttribDivisor", [this](const Args& a) {
        if (api_.vertexAttribDivisor) {
            api_.vertexAttribDivisor(u32(a, 0), u32(a, 1));
        }
        return Value::none();
    });
    def("glDrawArrays", [this](const Args& a) {
        api_.drawArrays(u32(a, 0), i32(a, 1), i32(a, 2));
        return Value::none();
    });
    def("glDrawElements", [this](const Args& a) {
        api_.drawElements(u32(a, 0), i32(a, 1), u32(a, 2), offsetPointer(a, 3));
        return Value::none();
    });
    def("glDrawArraysInstanced", [this](const Args& a) {
        if (api_.drawArraysInstanced) {
            api_.drawArraysInstanced(u32(a, 0), i32(a, 1), i32(a, 2), i32(a, 3));
        }
        return Value::none();
    });
    def("glDrawElementsInstanced", [this](const Args& a) {
        if (api_.drawElementsInstanced) {
            api_.drawElementsInstanced(u32(a, 0), i32(a, 1), u32(a, 2), offsetPointer(a, 3), i32(a, 4));
        }
        return Value::none();
    });
}

}  // namespace gl
}  // namespace hostbridge
