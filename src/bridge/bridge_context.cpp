#include "hostbridge/bridge/bridge_context.h"
#include "hostbridge/platform/window.h"
#include <iostream>

namespace hostbridge {
namespace bridge {

namespace {

audio::AudioContext::Options audioOptions(const ContextOptions& options) {
    audio::AudioContext::Options result;
    result.openDevice = options.openAudioDevice;
    return result;
}

}  // namespace

BridgeContext::BridgeContext(const ContextOptions& options, platform::Window& window)
    : window_(window)
    , http_(loop_)
    , reader_(loop_)
    , audioContext_(audioOptions(options))
    , driver_(memory_)
    , gl_(memory_, options.gl)
    , audio_(audioContext_, reader_, memory_, options.audioVariant)
    , net_(values_, http_, net::curlSocketFactory(http_))
    , files_(memory_, fs::makeFetcher(reader_, http_))
    , app_(memory_, window, driver_, gl_, options.app) {
    driver_.setClipboardReader([this]() { return window_.clipboardText(); });
    driver_.setDropReader([](const std::string& path, std::vector<uint8_t>& data) {
        std::string error;
        if (!fs::readFileSync(path, data, error)) {
            std::cerr << "[FS] " << error << std::endl;
            return false;
        }
        return true;
    });
}

BridgeContext::~BridgeContext() {
    shutdown();
}

bool BridgeContext::init() {
    if (!loop_.init()) {
        std::cerr << "[HostBridge] Failed to initialize event loop" << std::endl;
        return false;
    }
    if (!http_.init()) {
        std::cerr << "[HostBridge] Failed to initialize HTTP client" << std::endl;
        return false;
    }
    if (!reader_.init()) {
        std::cerr << "[HostBridge] Failed to initialize file reader" << std::endl;
        return false;
    }
    return true;
}

bool BridgeContext::addPlugin(PluginDescriptor plugin) {
    if (builtinsRegistered_) {
        std::cerr << "[Plugins] Plugin " << plugin.name << " added after the call table was built" << std::endl;
        return false;
    }
    return registry_.add(std::move(plugin));
}

void BridgeContext::registerBuiltins() {
    // Built-ins go first so added plugins can override single entry points
    std::vector<PluginDescriptor> builtins;
    builtins.push_back({"values", 1, [this](CallTable& table) { values_.registerFunctions(table, memory_); }, nullptr});
    builtins.push_back({"gl", gl::GlBridge::kVersion, [this](CallTable& table) { gl_.registerFunctions(table); },
                        nullptr});
    builtins.push_back({"audio", audio::AudioBridge::kVersion,
                        [this](CallTable& table) { audio_.registerFunctions(table); }, nullptr});
    builtins.push_back({"net", net::NetBridge::kVersion, [this](CallTable& table) { net_.registerFunctions(table); },
                        nullptr});
    builtins.push_back({"fs", fs::FileBridge::kVersion, [this](CallTable& table) { files_.registerFunctions(table); },
                        nullptr});
    builtins.push_back({"app", app::AppBridge::kVersion, [this](CallTable& table) { app_.registerFunctions(table); },
                        nullptr});

    std::vector<PluginDescriptor> extras = registry_.plugins();
    registry_ = PluginRegistry();
    for (auto& plugin : builtins) {
        registry_.add(std::move(plugin));
    }
    for (auto& plugin : extras) {
        registry_.add(std::move(plugin));
    }
    builtinsRegistered_ = true;
}

CallTable& BridgeContext::buildCallTable() {
    if (!builtinsRegistered_) {
        registerBuiltins();
    }
    registry_.registerAll(table_);
    return table_;
}

int BridgeContext::stubMissing(const std::vector<std::string>& importNames) {
    return registry_.stubMissing(importNames, table_);
}

int BridgeContext::attach(guest::Instance* instance) {
    memory_.attach(instance);
    if (!instance) return 0;
    return registry_.initAll(*instance);
}

void BridgeContext::detach() {
    memory_.attach(nullptr);
}

bool BridgeContext::loadGuest(guest::Engine& engine, const std::vector<uint8_t>& bytes, LoadedGuest& out) {
    out.module = engine.compile(bytes);
    if (!out.module) {
        return false;
    }

    CallTable& table = buildCallTable();
    int stubbed = stubMissing(out.module->importNames());
    if (stubbed > 0) {
        std::cerr << "[HostBridge] " << stubbed << " imports are stubbed" << std::endl;
    }

    out.instance = engine.instantiate(*out.module, table);
    if (!out.instance) {
        std::cerr << "[HostBridge] Failed to instantiate guest module" << std::endl;
        return false;
    }

    attach(out.instance.get());

    if (!out.instance->hasExport("main")) {
        std::cerr << "[HostBridge] Guest module has no main export" << std::endl;
        return true;
    }
    if (!out.instance->call("main")) {
        std::cerr << "[HostBridge] Guest main did not complete" << std::endl;
        return false;
    }
    return true;
}

void BridgeContext::pump() {
    loop_.runOnce();
    http_.processCompletedRequests();
    reader_.processCompletedReads();
    audioContext_.dispatchEndedEvents();
}

void BridgeContext::shutdown() {
    if (shutdown_) return;
    shutdown_ = true;

    std::cout << "[HostBridge] Shutting down bridge context" << std::endl;

    net_.wsClose();
    audioContext_.close();
    http_.shutdown();
    reader_.shutdown();
    gl_.detachContext();
    detach();
    loop_.shutdown();
}

}  // namespace bridge
}  // namespace hostbridge
