#include "hostbridge/app/app_bridge.h"
#include "hostbridge/bridge/guest_memory.h"
#include "hostbridge/gl/gl_bridge.h"
#include "hostbridge/platform/event_driver.h"
#include "hostbridge/platform/window.h"
#include <chrono>
#include <cmath>
#include <cstring>
#include <iostream>

namespace hostbridge {
namespace app {

using bridge::Args;
using guest::Value;

AppBridge::AppBridge(bridge::GuestMemory& memory, platform::Window& window, platform::EventDriver& driver,
                     gl::GlBridge& gl, Options options)
    : memory_(memory)
    , window_(window)
    , driver_(driver)
    , gl_(gl)
    , options_(options)
    , random_(std::random_device{}()) {}

void AppBridge::console(const char* level, const std::string& message) {
    bool isError = std::strcmp(level, "warn") == 0 || std::strcmp(level, "error") == 0;
    if (isError) {
        std::cerr << "[Guest] " << message << std::endl;
    } else if (std::strcmp(level, "debug") != 0 || options_.debug) {
        std::cout << "[Guest] " << message << std::endl;
    }
}

double AppBridge::now() const {
    auto since = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::duration<double>>(since).count();
}

int32_t AppBridge::rand() {
    std::uniform_int_distribution<int32_t> dist(0, 2147483646);
    return dist(random_);
}

float AppBridge::dpiScale() const {
    return options_.highDpi ? window_.pixelDensity() : 1.0f;
}

void AppBridge::updateCanvas() {
    float scale = dpiScale();
    driver_.setDpiScale(scale);

    if (!window_.isCreated()) return;

    int width = 0, height = 0;
    window_.getSize(&width, &height);
    driver_.resize(static_cast<int>(std::floor(width * scale)), static_cast<int>(std::floor(height * scale)));
}

void AppBridge::setupCanvasSize(bool highDpi) {
    options_.highDpi = highDpi;
    updateCanvas();
}

bool AppBridge::initWebGl(int32_t version) {
    int expectedMajor = version >= 2 ? 3 : 2;
    int actualMajor = gl_.contextMajor();
    if (actualMajor != 0 && actualMajor != expectedMajor) {
        std::cerr << "[GL] Guest asked for WebGL " << version << " but the context is OpenGL ES " << actualMajor
                  << ".0 (use --gl " << version << ")" << std::endl;
        return false;
    }
    if (options_.debug) {
        std::cout << "[GL] init_webgl(" << version << ")" << std::endl;
    }
    return true;
}

void AppBridge::setClipboard(const std::string& text) {
    clipboard_ = text;
    window_.setClipboardText(text);
}

void AppBridge::setCursor(const std::string& cssName) {
    cursor_ = cssName;
    window_.setCursor(cssName);
}

void AppBridge::setWindowSize(int32_t width, int32_t height) {
    if (width <= 0 || height <= 0) {
        std::cerr << "[Window] Ignoring window size " << width << "x" << height << std::endl;
        return;
    }
    if (!window_.isCreated()) {
        driver_.resize(width, height);
        return;
    }
    float scale = dpiScale();
    window_.setSize(static_cast<int>(width / scale), static_cast<int>(height / scale));
    updateCanvas();
}

void AppBridge::registerFunctions(bridge::CallTable& table) {
    const char* levels[] = {"debug", "log", "info", "warn", "error"};
    for (const char* level : levels) {
        std::string name = std::string("console_") + level;
        table.set(name, [this, level](const Args& args) {
            console(level, memory_.readCString(bridge::arg(args, 0).asU32(), "console"));
            return Value::none();
        });
    }

    table.set("now", [this](const Args&) {
        return Value::fromF64(now());
    });
    table.set("rand", [this](const Args&) {
        return Value::fromI32(rand());
    });
    table.set("dpi_scale", [this](const Args&) {
        return Value::fromF32(dpiScale());
    });
    table.set("canvas_width", [this](const Args&) {
        return Value::fromI32(driver_.canvasWidth());
    });
    table.set("canvas_height", [this](const Args&) {
        return Value::fromI32(driver_.canvasHeight());
    });
    table.set("setup_canvas_size", [this](const Args& args) {
        setupCanvasSize(bridge::arg(args, 0).asBool());
        return Value::none();
    });
    table.set("init_webgl", [this](const Args& args) {
        initWebGl(bridge::arg(args, 0).asI32());
        return Value::none();
    });
    table.set("set_emscripten_shader_hack", [this](const Args& args) {
        gl_.setShaderHack(bridge::arg(args, 0).asBool());
        return Value::none();
    });

    table.set("sapp_set_clipboard", [this](const Args& args) {
        setClipboard(memory_.readUtf8(bridge::arg(args, 0).asU32(), bridge::arg(args, 1).asU32(),
                                      "sapp_set_clipboard"));
        return Value::none();
    });
    table.set("sapp_set_cursor", [this](const Args& args) {
        setCursor(memory_.readUtf8(bridge::arg(args, 0).asU32(), bridge::arg(args, 1).asU32(), "sapp_set_cursor"));
        return Value::none();
    });
    table.set("sapp_set_cursor_grab", [this](const Args& args) {
        window_.setCursorGrab(bridge::arg(args, 0).asBool());
        return Value::none();
    });
    table.set("sapp_is_fullscreen", [this](const Args&) {
        return Value::fromBool(window_.isFullscreen());
    });
    table.set("sapp_set_fullscreen", [this](const Args& args) {
        window_.setFullscreen(bridge::arg(args, 0).asBool());
        return Value::none();
    });
    table.set("sapp_set_window_size", [this](const Args& args) {
        setWindowSize(bridge::arg(args, 0).asI32(), bridge::arg(args, 1).asI32());
        return Value::none();
    });

    table.set("run_animation_loop", [this](const Args& args) {
        driver_.start(bridge::arg(args, 0).asBool());
        return Value::none();
    });
    table.set("sapp_schedule_update", [this](const Args&) {
        driver_.scheduleUpdate();
        return Value::none();
    });
}

}  // namespace app
}  // namespace hostbridge
