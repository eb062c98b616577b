#pragma once

/**
 * Call Table
 *
 * The fixed set of host functions the guest module imports, keyed by
 * import name. Plugins fill it before instantiation.
 */

#include "hostbridge/guest/value.h"
#include <exception>
#include <functional>
#include <iostream>
#include <map>
#include <string>
#include <vector>

namespace hostbridge {
namespace bridge {

using Args = std::vector<guest::Value>;

/**
 * Host function signature. Returns Value::none() for void functions.
 */
using HostFunction = std::function<guest::Value(const Args& args)>;

/**
 * Run a host function for the guest. Exceptions never unwind into the
 * engine: they are logged and the call returns Value::none().
 */
inline guest::Value invokeHost(const std::string& name, const HostFunction& fn, const Args& args) {
    if (!fn) return guest::Value::none();
    try {
        return fn(args);
    } catch (const std::exception& e) {
        std::cerr << "[Guest] " << name << ": " << e.what() << std::endl;
        return guest::Value::none();
    }
}

class CallTable {
public:
    /**
     * Add or replace a function. Later registrations win, so a plugin can
     * override a built-in entry point.
     */
    void set(const std::string& name, HostFunction fn) {
        functions_[name] = std::move(fn);
    }

    bool has(const std::string& name) const {
        return functions_.find(name) != functions_.end();
    }

    const HostFunction* find(const std::string& name) const {
        auto it = functions_.find(name);
        return it == functions_.end() ? nullptr : &it->second;
    }

    /**
     * Invoke by name; unknown names return Value::none().
     */
    guest::Value call(const std::string& name, const Args& args = {}) const {
        auto it = functions_.find(name);
        if (it == functions_.end()) return guest::Value::none();
        return invokeHost(name, it->second, args);
    }

    std::vector<std::string> names() const {
        std::vector<std::string> result;
        result.reserve(functions_.size());
        for (const auto& entry : functions_) {
            result.push_back(entry.first);
        }
        return result;
    }

    size_t size() const { return functions_.size(); }

private:
    std::map<std::string, HostFunction> functions_;
};

/**
 * Argument accessor tolerant of short argument lists (missing args read as 0).
 */
inline guest::Value arg(const Args& args, size_t index) {
    return index < args.size() ? args[index] : guest::Value::none();
}

}  // namespace bridge
}  // namespace hostbridge
