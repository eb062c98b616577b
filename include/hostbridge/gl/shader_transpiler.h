#pragma once

/**
 * Shader Transpiler
 *
 * Rewrites GLSL ES 1.00 shader text (what the guest authors against) into
 * GLSL ES 3.00 when the context only accepts the newer dialect:
 *   - drops #extension lines for features that are core in 3.00
 *   - gl_FragColor / gl_FragData become declared outputs
 *   - attribute/varying become in/out for the shader's stage
 *   - the texture2D/textureCube family (including EXT, Lod, Grad and Proj
 *     variants) becomes texture/textureLod/textureGrad/textureProj...
 *   - #version 100 becomes #version 300 es (added when absent)
 *
 * The rewrite is textual and idempotent: a source that already declares a
 * version other than 100 is returned unchanged. It never fails; bad input
 * produces bad output that the shader compiler reports.
 */

#include <string>

namespace hostbridge {
namespace gl {

enum class ShaderStage {
    Vertex,
    Fragment
};

enum class ShaderDialect {
    Glsl100,
    Glsl300es
};

/**
 * Name of the declared output replacing gl_FragColor.
 */
constexpr const char* kFragColorOutput = "GL_FragColor";
constexpr const char* kFragDataOutput = "GL_FragData";

std::string transpileShader(const std::string& source, ShaderStage stage,
                            ShaderDialect target = ShaderDialect::Glsl300es);

}  // namespace gl
}  // namespace hostbridge
