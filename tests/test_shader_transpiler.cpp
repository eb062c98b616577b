// Shader dialect rewrite tests

#include <catch2/catch_test_macros.hpp>
#include "hostbridge/gl/shader_transpiler.h"

using namespace hostbridge::gl;

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

size_t count(const std::string& haystack, const std::string& needle) {
    size_t n = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) {
        n++;
    }
    return n;
}

}  // namespace

TEST_CASE("A version pragma is added when absent", "[transpiler]") {
    std::string out = transpileShader("void main() {}\n", ShaderStage::Vertex);
    REQUIRE(out.rfind("#version 300 es\n", 0) == 0);
}

TEST_CASE("Version 100 is replaced", "[transpiler]") {
    std::string out = transpileShader("#version 100\nvoid main() {}\n", ShaderStage::Vertex);
    REQUIRE_FALSE(contains(out, "#version 100"));
    REQUIRE(count(out, "#version") == 1);
}

TEST_CASE("Sources already in another dialect pass through", "[transpiler]") {
    std::string source = "#version 300 es\nin vec4 a;\nvoid main() { gl_Position = a; }\n";
    REQUIRE(transpileShader(source, ShaderStage::Vertex) == source);
}

TEST_CASE("Transpiling is idempotent", "[transpiler]") {
    std::string source =
        "#extension GL_OES_standard_derivatives : enable\n"
        "precision mediump float;\n"
        "varying vec2 uv;\n"
        "uniform sampler2D tex;\n"
        "void main() { gl_FragColor = texture2D(tex, uv); }\n";
    std::string once = transpileShader(source, ShaderStage::Fragment);
    REQUIRE(transpileShader(once, ShaderStage::Fragment) == once);
}

TEST_CASE("Vertex stage qualifiers", "[transpiler]") {
    std::string out = transpileShader(
        "attribute vec3 position;\nvarying vec2 uv;\nvoid main() { uv = position.xy; }\n", ShaderStage::Vertex);
    REQUIRE(contains(out, "in vec3 position;"));
    REQUIRE(contains(out, "out vec2 uv;"));
    REQUIRE_FALSE(contains(out, "attribute"));
    REQUIRE_FALSE(contains(out, "varying"));
}

TEST_CASE("Fragment stage declares its color output", "[transpiler]") {
    std::string out = transpileShader(
        "precision mediump float;\nvarying vec2 uv;\nvoid main() { gl_FragColor = vec4(uv, 0.0, 1.0); }\n",
        ShaderStage::Fragment);
    REQUIRE(contains(out, "in vec2 uv;"));
    REQUIRE(contains(out, "out mediump vec4 GL_FragColor;"));
    REQUIRE(contains(out, "GL_FragColor = vec4"));
    REQUIRE_FALSE(contains(out, "gl_FragColor"));
}

TEST_CASE("gl_FragData becomes an output array", "[transpiler]") {
    std::string out = transpileShader(
        "#extension GL_EXT_draw_buffers : require\nvoid main() { gl_FragData[1] = vec4(1.0); }\n",
        ShaderStage::Fragment);
    REQUIRE(contains(out, "layout(location = 0) out mediump vec4 GL_FragData[4];"));
    REQUIRE(contains(out, "GL_FragData[1] = vec4(1.0);"));
    REQUIRE_FALSE(contains(out, "#extension"));
}

TEST_CASE("Sampling functions map to the generic names", "[transpiler]") {
    std::string out = transpileShader(
        "#extension GL_EXT_shader_texture_lod : enable\n"
        "uniform sampler2D t;\nuniform samplerCube c;\n"
        "void main() {\n"
        "  vec4 a = texture2D(t, vec2(0.0));\n"
        "  vec4 b = textureCube(c, vec3(0.0));\n"
        "  vec4 d = texture2DLodEXT(t, vec2(0.0), 1.0);\n"
        "  vec4 e = textureCubeGradEXT(c, vec3(0.0), vec3(0.0), vec3(0.0));\n"
        "  vec4 f = texture2DProj(t, vec3(1.0));\n"
        "  gl_FragColor = a + b + d + e + f;\n"
        "}\n",
        ShaderStage::Fragment);
    REQUIRE(contains(out, "vec4 a = texture(t"));
    REQUIRE(contains(out, "vec4 b = texture(c"));
    REQUIRE(contains(out, "vec4 d = textureLod(t"));
    REQUIRE(contains(out, "vec4 e = textureGrad(c"));
    REQUIRE(contains(out, "vec4 f = textureProj(t"));
    REQUIRE_FALSE(contains(out, "#extension"));
}

TEST_CASE("Identifiers containing keywords are left alone", "[transpiler]") {
    std::string out = transpileShader(
        "uniform float myattribute;\nvarying float varyingValue;\nvoid main() {}\n", ShaderStage::Vertex);
    REQUIRE(contains(out, "uniform float myattribute;"));
    REQUIRE(contains(out, "out float varyingValue;"));
}

TEST_CASE("Extensions that are not core are kept", "[transpiler]") {
    std::string out = transpileShader(
        "#extension GL_OES_EGL_image_external : require\nvoid main() {}\n", ShaderStage::Fragment);
    REQUIRE(contains(out, "#extension GL_OES_EGL_image_external : require"));
}

TEST_CASE("Frag depth extension output is renamed", "[transpiler]") {
    std::string out = transpileShader(
        "#extension GL_EXT_frag_depth : enable\nvoid main() { gl_FragDepthEXT = 0.5; }\n",
        ShaderStage::Fragment);
    REQUIRE(contains(out, "gl_FragDepth = 0.5;"));
    REQUIRE_FALSE(contains(out, "gl_FragDepthEXT"));
}

TEST_CASE("Comments above the version pragma stay above it", "[transpiler]") {
    std::string out = transpileShader("// header\n#version 100\nvoid main() {}\n", ShaderStage::Vertex);
    REQUIRE(out.rfind("// header\n#version 300 es\n", 0) == 0);
}

TEST_CASE("The GLSL 1.00 target leaves source untouched", "[transpiler]") {
    std::string source = "attribute vec3 p;\nvoid main() {}\n";
    REQUIRE(transpileShader(source, ShaderStage::Vertex, ShaderDialect::Glsl100) == source);
}
