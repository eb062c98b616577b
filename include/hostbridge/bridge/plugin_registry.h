#pragma once

/**
 * Plugin Registry
 *
 * Each bridge is a named, versioned group of call-table functions. Plugins
 * are added before the guest module is instantiated; registerAll() merges
 * them into one CallTable, stubMissing() fills any import the guest needs
 * but no plugin provides, and initAll() runs after instantiation to call
 * init hooks and compare versions against `<name>_version` guest exports.
 *
 * Version mismatches are advisory: they are logged and load continues.
 */

#include "hostbridge/bridge/call_table.h"
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace hostbridge {
namespace guest {
class Instance;
}

namespace bridge {

struct PluginDescriptor {
    std::string name;
    uint32_t version = 1;
    std::function<void(CallTable&)> registerFn;
    std::function<void()> initFn;  // optional
};

struct VersionMismatch {
    std::string plugin;
    uint32_t hostVersion;
    uint32_t guestVersion;
};

class PluginRegistry {
public:
    /**
     * Add a plugin. Must happen before registerAll(); returns false (logged)
     * for duplicate names or a missing register function.
     */
    bool add(PluginDescriptor plugin);

    /**
     * Invoke every plugin's register function once, in insertion order.
     * Later plugins override earlier entries with the same name.
     */
    void registerAll(CallTable& table);

    /**
     * Install a logging stub for every import the table does not provide.
     * Returns the number of stubs installed.
     */
    int stubMissing(const std::vector<std::string>& importNames, CallTable& table);

    /**
     * Run init hooks and version negotiation against the instantiated guest.
     * Returns the number of version mismatches (each logged once).
     */
    int initAll(guest::Instance& instance);

    const std::vector<PluginDescriptor>& plugins() const { return plugins_; }
    const std::vector<VersionMismatch>& mismatches() const { return mismatches_; }

private:
    std::vector<PluginDescriptor> plugins_;
    std::vector<bool> registered_;
    std::vector<VersionMismatch> mismatches_;
    bool initialized_ = false;
};

}  // namespace bridge
}  // namespace hostbridge
