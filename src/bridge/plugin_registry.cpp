#include "hostbridge/bridge/plugin_registry.h"
#include "hostbridge/guest/engine.h"
#include <iostream>

namespace hostbridge {
namespace bridge {

bool PluginRegistry::add(PluginDescriptor plugin) {
    if (plugin.name.empty() || !plugin.registerFn) {
        std::cerr << "[Plugins] Ignoring plugin without a name or register function" << std::endl;
        return false;
    }
    for (const auto& existing : plugins_) {
        if (existing.name == plugin.name) {
            std::cerr << "[Plugins] Plugin " << plugin.name << " is already registered" << std::endl;
            return false;
        }
    }
    plugins_.push_back(std::move(plugin));
    registered_.push_back(false);
    return true;
}

void PluginRegistry::registerAll(CallTable& table) {
    for (size_t i = 0; i < plugins_.size(); i++) {
        if (registered_[i]) continue;
        size_t before = table.size();
        plugins_[i].registerFn(table);
        registered_[i] = true;
        std::cout << "[Plugins] " << plugins_[i].name << " v" << plugins_[i].version
                  << " registered (" << (table.size() - before) << " functions)" << std::endl;
    }
}

int PluginRegistry::stubMissing(const std::vector<std::string>& importNames, CallTable& table) {
    int stubbed = 0;
    for (const auto& name : importNames) {
        if (table.has(name)) continue;

        std::cerr << "[Plugins] No " << name << " function in the call table, stubbing" << std::endl;
        table.set(name, [name](const Args&) {
            std::cerr << "[Plugins] Missed function: " << name << std::endl;
            return guest::Value::none();
        });
        stubbed++;
    }
    return stubbed;
}

int PluginRegistry::initAll(guest::Instance& instance) {
    if (initialized_) {
        return static_cast<int>(mismatches_.size());
    }
    initialized_ = true;

    for (const auto& plugin : plugins_) {
        if (plugin.initFn) {
            plugin.initFn();
        }

        std::string exportName = plugin.name + "_version";
        if (!instance.hasExport(exportName)) {
            std::cout << "[Plugins] Plugin " << plugin.name
                      << " is present on the host, but the guest does not declare a version for it" << std::endl;
            continue;
        }

        auto result = instance.call(exportName);
        if (!result) {
            std::cerr << "[Plugins] Could not read " << exportName << " from the guest" << std::endl;
            continue;
        }

        uint32_t guestVersion = result->asU32();
        if (guestVersion != plugin.version) {
            std::cerr << "[Plugins] Plugin " << plugin.name << " version mismatch: host version "
                      << plugin.version << ", guest version " << guestVersion << std::endl;
            mismatches_.push_back({plugin.name, plugin.version, guestVersion});
        }
    }

    return static_cast<int>(mismatches_.size());
}

}  // namespace bridge
}  // namespace hostbridge
