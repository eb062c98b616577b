#include "hostbridge/gl/capabilities.h"
#include <iostream>

namespace hostbridge {
namespace gl {

namespace {

template <typename Fn>
void loadOptional(Fn& slot, const ProcLoader& load, const std::string& name) {
    slot = reinterpret_cast<Fn>(load(name.c_str()));
}

// Entry points for one capability, either core or suffixed by an extension vendor
bool loadVertexArrays(GlApi& api, const ProcLoader& load, const std::string& suffix) {
    loadOptional(api.genVertexArrays, load, "glGenVertexArrays" + suffix);
    loadOptional(api.deleteVertexArrays, load, "glDeleteVertexArrays" + suffix);
    loadOptional(api.bindVertexArray, load, "glBindVertexArray" + suffix);
    return api.genVertexArrays && api.deleteVertexArrays && api.bindVertexArray;
}

bool loadInstancing(GlApi& api, const ProcLoader& load, const std::string& suffix) {
    loadOptional(api.vertexAttribDivisor, load, "glVertexAttribDivisor" + suffix);
    loadOptional(api.drawArraysInstanced, load, "glDrawArraysInstanced" + suffix);
    loadOptional(api.drawElementsInstanced, load, "glDrawElementsInstanced" + suffix);
    return api.vertexAttribDivisor && api.drawArraysInstanced && api.drawElementsInstanced;
}

void clearInstancing(GlApi& api) {
    api.vertexAttribDivisor = nullptr;
    api.drawArraysInstanced = nullptr;
    api.drawElementsInstanced = nullptr;
}

bool loadQueries(GlApi& api, const ProcLoader& load, const std::string& suffix) {
    loadOptional(api.genQueries, load, "glGenQueries" + suffix);
    loadOptional(api.deleteQueries, load, "glDeleteQueries" + suffix);
    loadOptional(api.beginQuery, load, "glBeginQuery" + suffix);
    loadOptional(api.endQuery, load, "glEndQuery" + suffix);
    // Result getters only exist in the extension, core or not
    loadOptional(api.getQueryObjectiv, load, "glGetQueryObjectivEXT");
    loadOptional(api.getQueryObjectui64v, load, "glGetQueryObjectui64vEXT");
    return api.genQueries && api.deleteQueries && api.beginQuery && api.endQuery &&
           api.getQueryObjectiv && api.getQueryObjectui64v;
}

void clearQueries(GlApi& api) {
    api.genQueries = nullptr;
    api.deleteQueries = nullptr;
    api.beginQuery = nullptr;
    api.endQuery = nullptr;
    api.getQueryObjectiv = nullptr;
    api.getQueryObjectui64v = nullptr;
}

}  // namespace

const char* capabilityName(Capability capability) {
    switch (capability) {
        case Capability::VertexArrayObject: return "vertex array objects";
        case Capability::InstancedArrays: return "instanced arrays";
        case Capability::TimerQuery: return "disjoint timer queries";
        case Capability::DrawBuffers: return "draw buffers";
        case Capability::DepthTexture: return "depth textures";
    }
    return "unknown";
}

bool CapabilityReport::has(Capability capability) const {
    const CapabilityResult* result = find(capability);
    return result && result->available;
}

const CapabilityResult* CapabilityReport::find(Capability capability) const {
    for (const auto& result : results) {
        if (result.capability == capability) return &result;
    }
    return nullptr;
}

const CapabilityResult* CapabilityReport::missingRequired() const {
    for (const auto& result : results) {
        if (result.required && !result.available) return &result;
    }
    return nullptr;
}

CapabilityReport detectCapabilities(GlApi& api,
                                   const ProcLoader& load,
                                   const ExtensionQuery& hasExtension,
                                   int contextMajor) {
    CapabilityReport report;
    report.contextMajor = contextMajor;
    bool core3 = contextMajor >= 3;

    auto extension = [&](const char* name) {
        return hasExtension && hasExtension(name);
    };

    // Vertex array objects
    {
        CapabilityResult result{Capability::VertexArrayObject};
        if (core3 && loadVertexArrays(api, load, "")) {
            result.available = true;
            result.source = "core";
        } else if (extension("GL_OES_vertex_array_object") && loadVertexArrays(api, load, "OES")) {
            result.available = true;
            result.source = "GL_OES_vertex_array_object";
        } else {
            api.genVertexArrays = nullptr;
            api.deleteVertexArrays = nullptr;
            api.bindVertexArray = nullptr;
        }
        report.results.push_back(result);
    }

    // Instanced drawing
    {
        CapabilityResult result{Capability::InstancedArrays};
        if (core3 && loadInstancing(api, load, "")) {
            result.available = true;
            result.source = "core";
        } else if (extension("GL_ANGLE_instanced_arrays") && loadInstancing(api, load, "ANGLE")) {
            result.available = true;
            result.source = "GL_ANGLE_instanced_arrays";
        } else if (extension("GL_EXT_instanced_arrays") && loadInstancing(api, load, "EXT")) {
            result.available = true;
            result.source = "GL_EXT_instanced_arrays";
        } else {
            clearInstancing(api);
        }
        report.results.push_back(result);
    }

    // Timer queries are an extension on every GLES version
    {
        CapabilityResult result{Capability::TimerQuery};
        if (extension("GL_EXT_disjoint_timer_query") && loadQueries(api, load, core3 ? "" : "EXT")) {
            result.available = true;
            result.source = "GL_EXT_disjoint_timer_query";
        } else {
            clearQueries(api);
        }
        report.results.push_back(result);
    }

    // Multiple render targets
    {
        CapabilityResult result{Capability::DrawBuffers};
        if (core3) {
            loadOptional(api.drawBuffers, load, "glDrawBuffers");
            if (api.drawBuffers) result.source = "core";
        } else if (extension("GL_EXT_draw_buffers")) {
            loadOptional(api.drawBuffers, load, "glDrawBuffersEXT");
            if (api.drawBuffers) result.source = "GL_EXT_draw_buffers";
        }
        result.available = api.drawBuffers != nullptr;
        report.results.push_back(result);
    }

    // Depth textures (no entry points, but rendering depends on them)
    {
        CapabilityResult result{Capability::DepthTexture};
        result.required = true;
        if (core3) {
            result.available = true;
            result.source = "core";
        } else if (extension("GL_OES_depth_texture")) {
            result.available = true;
            result.source = "GL_OES_depth_texture";
        } else if (extension("GL_ANGLE_depth_texture")) {
            result.available = true;
            result.source = "GL_ANGLE_depth_texture";
        }
        report.results.push_back(result);
    }

    // Integer attributes only exist in GLES 3
    if (core3) {
        loadOptional(api.vertexAttribIPointer, load, "glVertexAttribIPointer");
    }

    for (const auto& result : report.results) {
        if (result.available) {
            std::cout << "[GL] " << capabilityName(result.capability) << ": " << result.source << std::endl;
        } else if (result.required) {
            std::cerr << "[GL] Required capability missing: " << capabilityName(result.capability) << std::endl;
        } else {
            std::cerr << "[GL] Warning: " << capabilityName(result.capability)
                      << " not supported, calls will be ignored" << std::endl;
        }
    }

    return report;
}

}  // namespace gl
}  // namespace hostbridge
