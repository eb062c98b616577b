// Guest load sequence tests against a scripted engine

#include <catch2/catch_test_macros.hpp>
#include "fake_guest.h"
#include "hostbridge/bridge/bridge_context.h"
#include "hostbridge/platform/window.h"
#include <memory>
#include <string>
#include <vector>

using namespace hostbridge;
using namespace hostbridge::test;

namespace {

class FakeModule : public guest::Module {
public:
    explicit FakeModule(std::vector<std::string> imports) : imports_(std::move(imports)) {}
    std::vector<std::string> importNames() const override { return imports_; }

private:
    std::vector<std::string> imports_;
};

// Records each step in `log` and hands out FakeGuest instances
class FakeEngine : public guest::Engine {
public:
    FakeEngine(std::vector<std::string>& log, bridge::BridgeContext& context) : log_(log), context_(context) {}

    guest::EngineType getType() const override { return guest::EngineType::Unknown; }
    const char* getName() const override { return "fake"; }

    std::unique_ptr<guest::Module> compile(const std::vector<uint8_t>& bytes) override {
        log_.push_back("compile");
        if (bytes.empty()) return nullptr;
        return std::make_unique<FakeModule>(imports);
    }

    std::unique_ptr<guest::Instance> instantiate(const guest::Module& module,
                                                 const bridge::CallTable& table) override {
        bool resolved = true;
        for (const auto& name : module.importNames()) {
            resolved = resolved && table.has(name);
        }
        log_.push_back(resolved ? "instantiate" : "instantiate with unresolved imports");
        if (failInstantiate) return nullptr;

        auto instance = std::make_unique<FakeGuest>();
        created = instance.get();
        if (withMain) {
            instance->setExport("main", [this](const std::vector<guest::Value>&) {
                log_.push_back(context_.memory().instance() ? "main attached" : "main detached");
                return guest::Value::none();
            });
        }
        return instance;
    }

    std::vector<std::string> imports = {"js_create_object", "glClear", "custom_call", "not_provided"};
    bool failInstantiate = false;
    bool withMain = true;
    FakeGuest* created = nullptr;

private:
    std::vector<std::string>& log_;
    bridge::BridgeContext& context_;
};

bridge::ContextOptions headlessOptions() {
    bridge::ContextOptions options;
    options.openAudioDevice = false;
    return options;
}

struct LoadFixture {
    std::vector<std::string> log;
    bridge::LoadedGuest loaded;
    platform::Window window;
    bridge::BridgeContext context{headlessOptions(), window};
    FakeEngine engine{log, context};

    LoadFixture() {
        bridge::PluginDescriptor custom;
        custom.name = "custom";
        custom.registerFn = [this](bridge::CallTable& table) {
            log.push_back("register");
            table.set("custom_call", [](const bridge::Args&) { return guest::Value::fromI32(1); });
        };
        custom.initFn = [this]() { log.push_back("init"); };
        context.addPlugin(std::move(custom));
    }
};

}  // namespace

TEST_CASE("Loading registers and stubs before instantiating, then inits before main", "[loading]") {
    LoadFixture f;
    REQUIRE(f.context.loadGuest(f.engine, {0x00, 0x61, 0x73, 0x6d}, f.loaded));

    REQUIRE(f.log == std::vector<std::string>{"compile", "register", "instantiate", "init", "main attached"});
    REQUIRE(f.loaded.module != nullptr);
    REQUIRE(f.loaded.instance.get() == f.engine.created);
    REQUIRE(f.context.memory().instance() == f.engine.created);
    REQUIRE(f.context.callTable().call("not_provided").isNone());
    REQUIRE(f.engine.created->callsTo("main").size() == 1);
}

TEST_CASE("A module that fails to compile stops the load", "[loading]") {
    LoadFixture f;
    REQUIRE_FALSE(f.context.loadGuest(f.engine, {}, f.loaded));
    REQUIRE(f.log == std::vector<std::string>{"compile"});
    REQUIRE(f.loaded.instance == nullptr);
    REQUIRE(f.context.memory().instance() == nullptr);
}

TEST_CASE("A failed instantiation never attaches or runs init hooks", "[loading]") {
    LoadFixture f;
    f.engine.failInstantiate = true;
    REQUIRE_FALSE(f.context.loadGuest(f.engine, {1}, f.loaded));
    REQUIRE(f.log == std::vector<std::string>{"compile", "register", "instantiate"});
    REQUIRE(f.loaded.module != nullptr);
    REQUIRE(f.context.memory().instance() == nullptr);
}

TEST_CASE("A guest without main still loads", "[loading]") {
    LoadFixture f;
    f.engine.withMain = false;
    REQUIRE(f.context.loadGuest(f.engine, {1}, f.loaded));
    REQUIRE(f.log == std::vector<std::string>{"compile", "register", "instantiate", "init"});
    REQUIRE(f.context.memory().instance() == f.engine.created);
}
