#pragma once

#include "hostbridge/audio/audio_bridge.h"
#include "hostbridge/bridge/plugin_registry.h"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace hostbridge {

namespace bridge {
class BridgeContext;
}

/**
 * Runtime configuration options
 */
struct RuntimeConfig {
    int width = 800;
    int height = 600;
    std::string title = "hostbridge";
    bool fullscreen = false;
    bool resizable = true;
    bool vsync = true;
    bool highDpi = false;
    int glVersion = 1;  // 1 = OpenGL ES 2.0 + extensions, 2 = OpenGL ES 3.0
    audio::AudioVariant audioVariant = audio::AudioVariant::Pooled;
    bool transpileShaders = false;  // rewrite shaders even if the guest does not ask
    bool headless = false;          // hidden window
    bool debug = false;             // verbose logging
};

/**
 * hostbridge Runtime
 *
 * Hosts one compiled guest module: an SDL3 window with an OpenGL ES
 * context, the audio device, and the libuv loop carrying network and file
 * work, all exposed to the guest through the bridge call table.
 *
 * Example usage:
 *   hostbridge::RuntimeConfig config;
 *   config.width = 1280;
 *   auto runtime = hostbridge::Runtime::create(config);
 *   if (runtime && runtime->loadModule("game.wasm")) runtime->run();
 */
class Runtime {
public:
    /**
     * Create the window, GL context and bridge services.
     * @return The runtime, or nullptr on failure (including a context
     *         missing a required graphics capability)
     */
    static std::unique_ptr<Runtime> create(const RuntimeConfig& config = {});

    virtual ~Runtime() = default;

    // ========================================================================
    // Guest Loading
    // ========================================================================

    /**
     * Register an extra bridge plugin. Only valid before the first load.
     */
    virtual bool addPlugin(bridge::PluginDescriptor plugin) = 0;

    /**
     * Compile, link and instantiate a guest module, then call its main
     * export.
     * @return true on success
     */
    virtual bool loadModule(const std::string& path) = 0;

    virtual bool loadModuleBytes(const std::vector<uint8_t>& bytes) = 0;

    // ========================================================================
    // Main Loop
    // ========================================================================

    /**
     * Run the main loop (blocking) until quit
     */
    virtual void run() = 0;

    /**
     * One tick: events, async completions, and a guest frame when due.
     * @return false if the runtime should quit
     */
    virtual bool pollEvents() = 0;

    virtual void quit() = 0;

    // ========================================================================
    // Window Management
    // ========================================================================

    virtual void resize(int width, int height) = 0;
    virtual void setFullscreen(bool fullscreen) = 0;

    /**
     * Current canvas size in pixels
     */
    virtual int getWidth() const = 0;
    virtual int getHeight() const = 0;

    // ========================================================================
    // Access to Internals (for advanced use)
    // ========================================================================

    virtual bridge::BridgeContext& context() = 0;

protected:
    Runtime() = default;
};

// Version info - uses CMake-defined HOSTBRIDGE_VERSION
#ifndef HOSTBRIDGE_VERSION
#define HOSTBRIDGE_VERSION "0.1.0"
#endif

inline const char* getVersion() {
    return HOSTBRIDGE_VERSION;
}

}  // namespace hostbridge
