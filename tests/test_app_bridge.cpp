// App bridge tests, run against a window that was never created

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "fake_guest.h"
#include "hostbridge/app/app_bridge.h"
#include "hostbridge/bridge/guest_memory.h"
#include "hostbridge/gl/gl_bridge.h"
#include "hostbridge/platform/event_driver.h"
#include "hostbridge/platform/window.h"
#include <chrono>
#include <set>

using namespace hostbridge;
using namespace hostbridge::test;
using Catch::Matchers::WithinAbs;

namespace {

struct AppFixture {
    FakeGuest guest;
    bridge::GuestMemory memory{&guest};
    platform::Window window;
    platform::EventDriver driver{memory};
    gl::GlBridge glBridge{memory, gl::GlBridge::Options{}};
    app::AppBridge appBridge;
    bridge::CallTable table;

    explicit AppFixture(app::AppBridge::Options options = {})
        : appBridge(memory, window, driver, glBridge, options) {
        guest.recordExport("resize");
        appBridge.registerFunctions(table);
    }

    void attachContext(int major) {
        gl::CapabilityReport report;
        report.contextMajor = major;
        glBridge.attachContext(gl::GlApi(), report);
    }
};

}  // namespace

TEST_CASE("Time is wall-clock seconds", "[app]") {
    AppFixture f;
    double before = std::chrono::duration_cast<std::chrono::duration<double>>(
                        std::chrono::system_clock::now().time_since_epoch()).count();
    double now = f.table.call("now").asF64();
    REQUIRE(now >= before - 1.0);
    REQUIRE(now <= before + 60.0);
}

TEST_CASE("Random numbers are non-negative 31-bit values", "[app]") {
    AppFixture f;
    std::set<int32_t> seen;
    for (int i = 0; i < 64; i++) {
        int32_t value = f.table.call("rand").asI32();
        REQUIRE(value >= 0);
        REQUIRE(value < 2147483647);
        seen.insert(value);
    }
    REQUIRE(seen.size() > 1);
}

TEST_CASE("Without a window the DPI scale is 1", "[app]") {
    AppFixture f(app::AppBridge::Options{true, 1, false});
    REQUIRE_THAT(f.appBridge.dpiScale(), WithinAbs(1.0, 1e-6));
    REQUIRE_THAT(f.table.call("dpi_scale").asF64(), WithinAbs(1.0, 1e-6));
}

TEST_CASE("Canvas size comes from the event driver", "[app]") {
    AppFixture f;
    f.driver.setCanvasSize(640, 480);
    REQUIRE(f.table.call("canvas_width").asI32() == 640);
    REQUIRE(f.table.call("canvas_height").asI32() == 480);
}

TEST_CASE("Window size requests resize the canvas when headless", "[app]") {
    AppFixture f;
    f.driver.setCanvasSize(800, 600);
    f.table.call("sapp_set_window_size", {i32(1280), i32(720)});

    REQUIRE(f.driver.canvasWidth() == 1280);
    REQUIRE(f.driver.canvasHeight() == 720);
    auto calls = f.guest.callsTo("resize");
    REQUIRE(calls.size() == 1);
    REQUIRE(calls[0].args[0].asI32() == 1280);
}

TEST_CASE("Non-positive window sizes are ignored", "[app]") {
    AppFixture f;
    f.driver.setCanvasSize(800, 600);
    f.appBridge.setWindowSize(0, 600);
    f.appBridge.setWindowSize(800, -1);
    REQUIRE(f.driver.canvasWidth() == 800);
    REQUIRE(f.guest.callsTo("resize").empty());
}

TEST_CASE("Clipboard and cursor are remembered", "[app]") {
    AppFixture f;
    REQUIRE(f.appBridge.cursor() == "default");

    f.guest.putString(100, "copied");
    f.table.call("sapp_set_clipboard", {u32(100), u32(6)});
    REQUIRE(f.appBridge.clipboard() == "copied");

    f.guest.putString(200, "pointer");
    f.table.call("sapp_set_cursor", {u32(200), u32(7)});
    REQUIRE(f.appBridge.cursor() == "pointer");
}

TEST_CASE("Fullscreen queries are false without a window", "[app]") {
    AppFixture f;
    f.table.call("sapp_set_fullscreen", {i32(1)});
    REQUIRE_FALSE(f.table.call("sapp_is_fullscreen").asBool());
}

TEST_CASE("Run loop controls configure the driver", "[app]") {
    AppFixture f;
    f.table.call("run_animation_loop", {i32(1)});
    REQUIRE(f.driver.started());
    REQUIRE(f.driver.blocking());
    REQUIRE(f.driver.takeFrameRequest());
    REQUIRE_FALSE(f.driver.takeFrameRequest());

    f.table.call("sapp_schedule_update");
    REQUIRE(f.driver.takeFrameRequest());
}

TEST_CASE("Setting up the canvas records the high-DPI choice", "[app]") {
    AppFixture f;
    f.table.call("setup_canvas_size", {i32(1)});
    REQUIRE(f.appBridge.highDpi());
    REQUIRE_THAT(f.driver.dpiScale(), WithinAbs(1.0, 1e-6));
}

TEST_CASE("WebGL versions are checked against the context", "[app]") {
    AppFixture f;
    f.attachContext(2);
    REQUIRE(f.appBridge.initWebGl(1));
    REQUIRE_FALSE(f.appBridge.initWebGl(2));

    f.attachContext(3);
    REQUIRE(f.appBridge.initWebGl(2));
    REQUIRE_FALSE(f.appBridge.initWebGl(1));
}

TEST_CASE("The shader hack flag reaches the GL bridge", "[app]") {
    AppFixture f;
    REQUIRE_FALSE(f.glBridge.shaderHack());
    f.table.call("set_emscripten_shader_hack", {i32(1)});
    REQUIRE(f.glBridge.shaderHack());
}

TEST_CASE("Console functions read C strings from guest memory", "[app]") {
    AppFixture f;
    f.guest.putString(300, std::string("hello from the guest") + '\0');
    for (const char* name : {"console_debug", "console_log", "console_info", "console_warn", "console_error"}) {
        REQUIRE(f.table.has(name));
        REQUIRE(f.table.call(name, {u32(300)}).isNone());
    }
}
