#pragma once

/**
 * App Bridge
 *
 * The "app" call-table group: guest console output, time and randomness,
 * canvas sizing, window services (clipboard, cursor, fullscreen) and the
 * run-loop controls that configure the EventDriver.
 *
 * Works without a created window: sizes then come from the EventDriver's
 * canvas and window setters do nothing.
 */

#include "hostbridge/bridge/call_table.h"
#include <cstdint>
#include <random>
#include <string>

namespace hostbridge {
namespace bridge {
class GuestMemory;
}
namespace gl {
class GlBridge;
}
namespace platform {
class Window;
class EventDriver;
}

namespace app {

class AppBridge {
public:
    static constexpr uint32_t kVersion = 1;

    struct Options {
        bool highDpi = false;
        int glVersion = 1;  // WebGL-style version the context was created for
        bool debug = false;
    };

    AppBridge(bridge::GuestMemory& memory, platform::Window& window, platform::EventDriver& driver,
              gl::GlBridge& gl, Options options);

    void registerFunctions(bridge::CallTable& table);

    /**
     * Guest console line. debug/log/info go to stdout, warn/error to stderr.
     */
    void console(const char* level, const std::string& message);

    double now() const;
    int32_t rand();

    /**
     * Device pixels per canvas unit: the window's pixel density with
     * high-DPI enabled, 1 otherwise.
     */
    float dpiScale() const;

    /**
     * Recompute the canvas size from the window and push it (with the DPI
     * scale) to the event driver. Calls the guest's resize export when the
     * size changed.
     */
    void updateCanvas();

    void setupCanvasSize(bool highDpi);
    bool highDpi() const { return options_.highDpi; }

    /**
     * Check the guest's requested context version against the one created.
     * Returns false (logged) on a mismatch; rendering continues either way.
     */
    bool initWebGl(int32_t version);

    void setClipboard(const std::string& text);
    const std::string& clipboard() const { return clipboard_; }

    void setCursor(const std::string& cssName);
    const std::string& cursor() const { return cursor_; }

    void setWindowSize(int32_t width, int32_t height);

    AppBridge(const AppBridge&) = delete;
    AppBridge& operator=(const AppBridge&) = delete;

private:
    bridge::GuestMemory& memory_;
    platform::Window& window_;
    platform::EventDriver& driver_;
    gl::GlBridge& gl_;
    Options options_;

    std::mt19937 random_;
    std::string clipboard_;
    std::string cursor_ = "default";
};

}  // namespace app
}  // namespace hostbridge
