// Capability detection tests

#include <catch2/catch_test_macros.hpp>
#include "hostbridge/gl/capabilities.h"
#include <set>
#include <string>

using namespace hostbridge::gl;

namespace {

void anyEntryPoint() {}

struct FakeDriver {
    std::set<std::string> procs;
    std::set<std::string> extensions;

    ProcLoader loader() const {
        return [this](const char* name) -> void* {
            return procs.count(name) ? reinterpret_cast<void*>(&anyEntryPoint) : nullptr;
        };
    }

    ExtensionQuery query() const {
        return [this](const char* name) { return extensions.count(name) > 0; };
    }
};

}  // namespace

TEST_CASE("A GLES 3 context provides core features", "[capabilities]") {
    FakeDriver driver;
    driver.procs = {"glGenVertexArrays", "glDeleteVertexArrays", "glBindVertexArray",
                    "glVertexAttribDivisor", "glDrawArraysInstanced", "glDrawElementsInstanced",
                    "glDrawBuffers", "glVertexAttribIPointer"};

    GlApi api;
    CapabilityReport report = detectCapabilities(api, driver.loader(), driver.query(), 3);

    REQUIRE(report.has(Capability::VertexArrayObject));
    REQUIRE(report.find(Capability::VertexArrayObject)->source == "core");
    REQUIRE(report.has(Capability::InstancedArrays));
    REQUIRE(report.has(Capability::DrawBuffers));
    REQUIRE(report.has(Capability::DepthTexture));
    REQUIRE_FALSE(report.has(Capability::TimerQuery));
    REQUIRE(report.missingRequired() == nullptr);

    REQUIRE(api.bindVertexArray != nullptr);
    REQUIRE(api.vertexAttribIPointer != nullptr);
    REQUIRE(api.genQueries == nullptr);
}

TEST_CASE("A GLES 2 context falls back to extensions", "[capabilities]") {
    FakeDriver driver;
    driver.extensions = {"GL_OES_vertex_array_object", "GL_ANGLE_instanced_arrays", "GL_OES_depth_texture"};
    driver.procs = {"glGenVertexArraysOES", "glDeleteVertexArraysOES", "glBindVertexArrayOES",
                    "glVertexAttribDivisorANGLE", "glDrawArraysInstancedANGLE", "glDrawElementsInstancedANGLE"};

    GlApi api;
    CapabilityReport report = detectCapabilities(api, driver.loader(), driver.query(), 2);

    REQUIRE(report.find(Capability::VertexArrayObject)->source == "GL_OES_vertex_array_object");
    REQUIRE(report.find(Capability::InstancedArrays)->source == "GL_ANGLE_instanced_arrays");
    REQUIRE(report.find(Capability::DepthTexture)->source == "GL_OES_depth_texture");
    REQUIRE_FALSE(report.has(Capability::DrawBuffers));
    REQUIRE(api.drawBuffers == nullptr);
    REQUIRE(api.vertexAttribIPointer == nullptr);
}

TEST_CASE("An advertised extension without entry points is unavailable", "[capabilities]") {
    FakeDriver driver;
    driver.extensions = {"GL_EXT_instanced_arrays", "GL_OES_depth_texture"};
    driver.procs = {"glVertexAttribDivisorEXT"};

    GlApi api;
    CapabilityReport report = detectCapabilities(api, driver.loader(), driver.query(), 2);

    REQUIRE_FALSE(report.has(Capability::InstancedArrays));
    REQUIRE(api.vertexAttribDivisor == nullptr);
}

TEST_CASE("Timer queries need the disjoint timer extension", "[capabilities]") {
    FakeDriver driver;
    driver.extensions = {"GL_EXT_disjoint_timer_query", "GL_OES_depth_texture"};
    driver.procs = {"glGenQueriesEXT", "glDeleteQueriesEXT", "glBeginQueryEXT", "glEndQueryEXT",
                    "glGetQueryObjectivEXT", "glGetQueryObjectui64vEXT"};

    GlApi api;
    CapabilityReport report = detectCapabilities(api, driver.loader(), driver.query(), 2);
    REQUIRE(report.has(Capability::TimerQuery));
    REQUIRE(api.beginQuery != nullptr);
    REQUIRE(api.getQueryObjectui64v != nullptr);
}

TEST_CASE("Missing depth textures are a required failure", "[capabilities]") {
    FakeDriver driver;
    GlApi api;
    CapabilityReport report = detectCapabilities(api, driver.loader(), driver.query(), 2);

    const CapabilityResult* missing = report.missingRequired();
    REQUIRE(missing != nullptr);
    REQUIRE(missing->capability == Capability::DepthTexture);
    REQUIRE(std::string(capabilityName(missing->capability)) == "depth textures");
}

TEST_CASE("ANGLE depth textures are accepted", "[capabilities]") {
    FakeDriver driver;
    driver.extensions = {"GL_ANGLE_depth_texture"};
    GlApi api;
    CapabilityReport report = detectCapabilities(api, driver.loader(), driver.query(), 2);
    REQUIRE(report.missingRequired() == nullptr);
}

TEST_CASE("Every capability gets an explicit result", "[capabilities]") {
    FakeDriver driver;
    GlApi api;
    CapabilityReport report = detectCapabilities(api, driver.loader(), driver.query(), 2);
    REQUIRE(report.results.size() == 5);
    REQUIRE(report.contextMajor == 2);
}
