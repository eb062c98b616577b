#pragma once

/**
 * Capability detection
 *
 * Run once per GL context. Each optional feature the guest may use is
 * looked up either as core (GLES 3) or through its GLES 2 extension, and
 * the matching entry points are installed into the GlApi optional slots.
 *
 * Detection never throws: every capability gets an explicit result.
 * Missing optional capabilities are logged once here and their calls
 * become no-ops; a missing required capability is reported so the runtime
 * can refuse to start the guest.
 */

#include "hostbridge/gl/gl_api.h"
#include <functional>
#include <string>
#include <vector>

namespace hostbridge {
namespace gl {

enum class Capability {
    VertexArrayObject,
    InstancedArrays,
    TimerQuery,
    DrawBuffers,
    DepthTexture
};

const char* capabilityName(Capability capability);

struct CapabilityResult {
    Capability capability;
    bool required = false;
    bool available = false;
    std::string source;  // "core", an extension name, or empty when missing
};

struct CapabilityReport {
    int contextMajor = 2;
    std::vector<CapabilityResult> results;

    bool has(Capability capability) const;
    const CapabilityResult* find(Capability capability) const;

    /**
     * First missing required capability, or nullptr.
     */
    const CapabilityResult* missingRequired() const;
};

using ExtensionQuery = std::function<bool(const char* name)>;

/**
 * Inspect a context and install optional entry points into `api`.
 *
 * @param contextMajor 2 for GLES 2.0 (extensions), 3 for GLES 3.x (core)
 */
CapabilityReport detectCapabilities(GlApi& api,
                                   const ProcLoader& load,
                                   const ExtensionQuery& hasExtension,
                                   int contextMajor);

}  // namespace gl
}  // namespace hostbridge
