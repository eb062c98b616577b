/**
 * hostbridge Runtime Implementation
 *
 * Wires the window, the bridge context and the guest engine together and
 * runs the main loop:
 *
 *   SDL events -> EventDriver -> guest input exports
 *   libuv turn -> HTTP / WebSocket / file / decode completions
 *   guest frame export (when due) -> SDL_GL_SwapWindow
 */

#include "hostbridge/runtime.h"
#include "hostbridge/bridge/bridge_context.h"
#include "hostbridge/fs/async_file.h"
#include "hostbridge/gl/capabilities.h"
#include "hostbridge/gl/gl_api.h"
#include "hostbridge/guest/engine.h"
#include "hostbridge/platform/window.h"
#include <SDL3/SDL.h>
#include <iostream>

namespace hostbridge {

namespace {

// Upper bound on an idle wait in blocking mode, so async completions
// are still picked up without input
constexpr int kIdleWaitMs = 8;

bool isWindowSizeEvent(const SDL_Event& event) {
    return event.type == SDL_EVENT_WINDOW_RESIZED || event.type == SDL_EVENT_WINDOW_PIXEL_SIZE_CHANGED ||
           event.type == SDL_EVENT_WINDOW_DISPLAY_SCALE_CHANGED;
}

}  // namespace

class RuntimeImpl : public Runtime {
public:
    explicit RuntimeImpl(const RuntimeConfig& config)
        : config_(config) {}

    ~RuntimeImpl() override {
        shutdown();
    }

    bool initialize() {
        std::cout << "[HostBridge] Initializing runtime..." << std::endl;
        std::cout << "[HostBridge] Window: " << config_.width << "x" << config_.height << ", WebGL "
                  << config_.glVersion << " profile" << std::endl;

        platform::WindowOptions windowOptions;
        windowOptions.title = config_.title;
        windowOptions.width = config_.width;
        windowOptions.height = config_.height;
        windowOptions.fullscreen = config_.fullscreen;
        windowOptions.resizable = config_.resizable;
        windowOptions.hidden = config_.headless;
        windowOptions.highDpi = config_.highDpi;
        windowOptions.glMajor = config_.glVersion >= 2 ? 3 : 2;
        windowOptions.vsync = config_.vsync;

        if (!window_.create(windowOptions)) {
            std::cerr << "[HostBridge] Failed to create window" << std::endl;
            return false;
        }

        bridge::ContextOptions options;
        options.gl.transpileShaders = config_.transpileShaders;
        options.gl.debug = config_.debug;
        options.app.highDpi = config_.highDpi;
        options.app.glVersion = config_.glVersion;
        options.app.debug = config_.debug;
        options.audioVariant = config_.audioVariant;

        context_ = std::make_unique<bridge::BridgeContext>(options, window_);
        if (!context_->init()) {
            std::cerr << "[HostBridge] Failed to initialize bridge services" << std::endl;
            return false;
        }

        if (!initializeGraphics()) {
            return false;
        }

        context_->app().updateCanvas();

        engine_ = guest::createEngine();
        if (engine_) {
            std::cout << "[HostBridge] Guest engine: " << engine_->getName() << std::endl;
        }

        std::cout << "[HostBridge] Runtime initialized" << std::endl;
        return true;
    }

    bool initializeGraphics() {
        gl::ProcLoader loader = &platform::Window::getProcAddress;

        gl::GlApi api;
        if (!gl::loadCoreFunctions(api, loader)) {
            platform::Window::showMessageBox("hostbridge", "The OpenGL ES driver is missing core entry points.");
            return false;
        }

        gl::CapabilityReport report =
            gl::detectCapabilities(api, loader, &platform::Window::extensionSupported, window_.contextMajor());

        if (const gl::CapabilityResult* missing = report.missingRequired()) {
            std::string message = std::string("This device does not support ") +
                                  gl::capabilityName(missing->capability) +
                                  ", which is required for rendering.";
            platform::Window::showMessageBox("hostbridge", message);
            return false;
        }

        context_->gl().attachContext(api, std::move(report));
        return true;
    }

    void shutdown() {
        if (context_) {
            context_->shutdown();
        }
        instance_.reset();
        module_.reset();
        context_.reset();
        engine_.reset();
        window_.destroy();
    }

    // ========================================================================
    // Guest Loading
    // ========================================================================

    bool addPlugin(bridge::PluginDescriptor plugin) override {
        if (instance_) {
            std::cerr << "[Plugins] Cannot add plugin " << plugin.name << " after the guest was loaded" << std::endl;
            return false;
        }
        return context_->addPlugin(std::move(plugin));
    }

    bool loadModule(const std::string& path) override {
        std::vector<uint8_t> bytes;
        std::string error;
        if (!fs::readFileSync(path, bytes, error)) {
            std::cerr << "[HostBridge] Failed to read module: " << error << std::endl;
            return false;
        }
        std::cout << "[HostBridge] Loading " << path << " (" << bytes.size() << " bytes)" << std::endl;
        return loadModuleBytes(bytes);
    }

    bool loadModuleBytes(const std::vector<uint8_t>& bytes) override {
        if (instance_) {
            std::cerr << "[HostBridge] A guest module is already loaded" << std::endl;
            return false;
        }
        if (!engine_) {
            std::cerr << "[HostBridge] No guest engine compiled in, cannot load module" << std::endl;
            return false;
        }

        bridge::LoadedGuest loaded;
        bool ok = context_->loadGuest(*engine_, bytes, loaded);
        module_ = std::move(loaded.module);
        instance_ = std::move(loaded.instance);
        return ok;
    }

    // ========================================================================
    // Main Loop
    // ========================================================================

    void run() override {
        std::cout << "[HostBridge] Starting main loop..." << std::endl;
        running_ = true;
        while (running_) {
            if (!pollEvents()) {
                break;
            }
        }
        std::cout << "[HostBridge] Main loop ended" << std::endl;
    }

    bool pollEvents() override {
        platform::EventDriver& driver = context_->driver();

        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            if (isWindowSizeEvent(event)) {
                context_->app().updateCanvas();
                continue;
            }
            if (!driver.handleEvent(event)) {
                running_ = false;
                return false;
            }
        }

        context_->pump();

        if (driver.runFrame()) {
            window_.swap();
        } else if (driver.blocking() || !driver.started()) {
            // Nothing to draw: sleep until input arrives or the wait expires
            SDL_WaitEventTimeout(nullptr, kIdleWaitMs);
        }

        return running_;
    }

    void quit() override {
        std::cout << "[HostBridge] Quit requested" << std::endl;
        running_ = false;
    }

    // ========================================================================
    // Window Management
    // ========================================================================

    void resize(int width, int height) override {
        std::cout << "[HostBridge] Resize: " << width << "x" << height << std::endl;
        context_->app().setWindowSize(width, height);
    }

    void setFullscreen(bool fullscreen) override {
        window_.setFullscreen(fullscreen);
    }

    int getWidth() const override { return context_->driver().canvasWidth(); }
    int getHeight() const override { return context_->driver().canvasHeight(); }

    bridge::BridgeContext& context() override { return *context_; }

private:
    RuntimeConfig config_;
    bool running_ = true;

    platform::Window window_;
    std::unique_ptr<bridge::BridgeContext> context_;
    std::unique_ptr<guest::Engine> engine_;
    std::unique_ptr<guest::Module> module_;
    std::unique_ptr<guest::Instance> instance_;
};

std::unique_ptr<Runtime> Runtime::create(const RuntimeConfig& config) {
    auto runtime = std::make_unique<RuntimeImpl>(config);
    if (!runtime->initialize()) {
        return nullptr;
    }
    return runtime;
}

}  // namespace hostbridge
