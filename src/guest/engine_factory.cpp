/**
 * Guest Engine Factory
 *
 * Creates the guest engine compiled into this build.
 */

#include "hostbridge/guest/engine.h"
#include <iostream>

namespace hostbridge {
namespace guest {

#if defined(HOSTBRIDGE_GUEST_WASM_C_API)
std::unique_ptr<Engine> createWasmCApiEngine();
#endif

std::unique_ptr<Engine> createEngine() {
#if defined(HOSTBRIDGE_GUEST_WASM_C_API)
    std::cout << "[Guest] Creating WebAssembly C API engine" << std::endl;
    return createWasmCApiEngine();
#else
    std::cerr << "[Guest] No guest engine available!" << std::endl;
    return nullptr;
#endif
}

std::unique_ptr<Engine> createEngine(EngineType type) {
    switch (type) {
        case EngineType::WasmCApi:
#if defined(HOSTBRIDGE_GUEST_WASM_C_API)
            return createWasmCApiEngine();
#else
            std::cerr << "[Guest] WebAssembly C API engine not compiled in" << std::endl;
            return nullptr;
#endif

        default:
            std::cerr << "[Guest] Unknown engine type" << std::endl;
            return nullptr;
    }
}

}  // namespace guest
}  // namespace hostbridge
