#pragma once

/**
 * Bridge Context
 *
 * Owns every piece of bridge state for one guest: the libuv loop and the
 * async services on it, the host-value table, each sub-bridge, the plugin
 * registry and the merged call table. Nothing is global; two contexts can
 * coexist in one process.
 *
 * Lifecycle:
 *   1. init()                 start the loop, HTTP client and file reader
 *   2. addPlugin() (optional) third-party bridges
 *   3. buildCallTable()       built-in plugins first, then added ones
 *   4. stubMissing(imports)   before instantiating the guest
 *   5. attach(instance)       init hooks and version negotiation
 *   6. pump() once per tick
 *   7. shutdown()
 *
 * loadGuest() performs steps 3 to 5 for a module and then runs its main.
 */

#include "hostbridge/app/app_bridge.h"
#include "hostbridge/async/event_loop.h"
#include "hostbridge/audio/audio_bridge.h"
#include "hostbridge/audio/audio_context.h"
#include "hostbridge/bridge/call_table.h"
#include "hostbridge/bridge/guest_memory.h"
#include "hostbridge/bridge/host_values.h"
#include "hostbridge/bridge/plugin_registry.h"
#include "hostbridge/fs/async_file.h"
#include "hostbridge/fs/file_bridge.h"
#include "hostbridge/gl/gl_bridge.h"
#include "hostbridge/guest/engine.h"
#include "hostbridge/http/async_http_client.h"
#include "hostbridge/net/net_bridge.h"
#include "hostbridge/platform/event_driver.h"
#include <memory>
#include <string>
#include <vector>

namespace hostbridge {
namespace platform {
class Window;
}

namespace bridge {

/**
 * A compiled and instantiated guest. Owned by whoever loaded it and kept
 * alive as long as the context is attached to it.
 */
struct LoadedGuest {
    std::unique_ptr<guest::Module> module;
    std::unique_ptr<guest::Instance> instance;
};

struct ContextOptions {
    gl::GlBridge::Options gl;
    app::AppBridge::Options app;
    audio::AudioVariant audioVariant = audio::AudioVariant::Pooled;
    bool openAudioDevice = true;
};

class BridgeContext {
public:
    /**
     * The window is borrowed and may stay uncreated (headless tests).
     */
    BridgeContext(const ContextOptions& options, platform::Window& window);
    ~BridgeContext();

    /**
     * Start the event loop and the services running on it.
     * Returns false (logged) if any of them failed.
     */
    bool init();

    /**
     * Register an extra plugin. Must come before buildCallTable().
     */
    bool addPlugin(PluginDescriptor plugin);

    /**
     * Run every plugin's register function into the shared call table.
     */
    CallTable& buildCallTable();

    /**
     * Stub imports no plugin provides. Returns the number stubbed.
     */
    int stubMissing(const std::vector<std::string>& importNames);

    /**
     * Bind the instantiated guest: memory access, init hooks and version
     * checks. Returns the number of version mismatches (advisory).
     */
    int attach(guest::Instance* instance);

    void detach();

    /**
     * Compile the module, fill the call table, stub what is missing,
     * instantiate, attach and call the guest's main export.
     * Returns false (logged) when any step fails; whatever was created
     * before the failure is still handed back in `out`.
     */
    bool loadGuest(guest::Engine& engine, const std::vector<uint8_t>& bytes, LoadedGuest& out);

    /**
     * One non-blocking turn: libuv, HTTP/WebSocket completions, file and
     * decode completions, audio ended events.
     */
    void pump();

    /**
     * Stop audio, fail outstanding requests and close the loop.
     * Safe to call more than once.
     */
    void shutdown();

    async::EventLoop& loop() { return loop_; }
    http::AsyncHttpClient& http() { return http_; }
    fs::AsyncFileReader& fileReader() { return reader_; }
    HostValueTable& values() { return values_; }
    GuestMemory& memory() { return memory_; }
    audio::AudioContext& audioContext() { return audioContext_; }
    platform::EventDriver& driver() { return driver_; }
    gl::GlBridge& gl() { return gl_; }
    audio::AudioBridge& audio() { return audio_; }
    net::NetBridge& net() { return net_; }
    fs::FileBridge& files() { return files_; }
    app::AppBridge& app() { return app_; }
    PluginRegistry& plugins() { return registry_; }
    CallTable& callTable() { return table_; }

    BridgeContext(const BridgeContext&) = delete;
    BridgeContext& operator=(const BridgeContext&) = delete;

private:
    void registerBuiltins();

    platform::Window& window_;

    async::EventLoop loop_;
    http::AsyncHttpClient http_;
    fs::AsyncFileReader reader_;
    HostValueTable values_;
    GuestMemory memory_;
    audio::AudioContext audioContext_;
    platform::EventDriver driver_;
    gl::GlBridge gl_;
    audio::AudioBridge audio_;
    net::NetBridge net_;
    fs::FileBridge files_;
    app::AppBridge app_;

    PluginRegistry registry_;
    CallTable table_;
    bool builtinsRegistered_ = false;
    bool shutdown_ = false;
};

}  // namespace bridge
}  // namespace hostbridge
