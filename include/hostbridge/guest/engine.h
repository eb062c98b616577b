/**
 * Guest Module Engine Abstraction
 *
 * Common interface for executing the compiled guest module. The bridge
 * never sees engine types; it talks to the guest only through exports,
 * imports from the CallTable and a flat byte view of guest memory.
 */

#pragma once

#include "hostbridge/guest/value.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hostbridge {
namespace bridge {
class CallTable;
}

namespace guest {

/**
 * Flat view over guest linear memory.
 * Only valid until the next call into the guest (memory may grow).
 */
struct MemorySpan {
    uint8_t* data = nullptr;
    size_t size = 0;
};

/**
 * Compiled guest module (not yet instantiated)
 */
class Module {
public:
    virtual ~Module() = default;

    /**
     * Names of every function the module imports from the host.
     */
    virtual std::vector<std::string> importNames() const = 0;
};

/**
 * Instantiated guest module
 */
class Instance {
public:
    virtual ~Instance() = default;

    /**
     * Current view of guest memory.
     */
    virtual MemorySpan memory() = 0;

    /**
     * Check whether the module exports a function with this name.
     */
    virtual bool hasExport(const std::string& name) const = 0;

    /**
     * Call an exported function.
     * @return The first result (Value::none() for void exports), or
     *         std::nullopt if the export is missing or trapped. Traps are
     *         logged, never propagated.
     */
    virtual std::optional<Value> call(const std::string& name,
                                      const std::vector<Value>& args = {}) = 0;
};

/**
 * Engine type enumeration
 */
enum class EngineType {
    WasmCApi,
    Unknown
};

/**
 * Abstract guest engine
 */
class Engine {
public:
    virtual ~Engine() = default;

    virtual EngineType getType() const = 0;
    virtual const char* getName() const = 0;

    /**
     * Compile module bytes. Returns nullptr (after logging) on failure.
     */
    virtual std::unique_ptr<Module> compile(const std::vector<uint8_t>& bytes) = 0;

    /**
     * Instantiate a module, resolving every import through the call table.
     * The table must already contain an entry (or stub) for each import.
     */
    virtual std::unique_ptr<Instance> instantiate(const Module& module,
                                                  const bridge::CallTable& table) = 0;
};

/**
 * Create the default engine compiled into this build.
 * Returns nullptr if no engine backend is available.
 */
std::unique_ptr<Engine> createEngine();

/**
 * Create a specific engine type, or nullptr if it is not compiled in.
 */
std::unique_ptr<Engine> createEngine(EngineType type);

}  // namespace guest
}  // namespace hostbridge
