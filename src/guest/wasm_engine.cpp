/**
 * WebAssembly C API Guest Engine
 *
 * Runs the guest through the standard wasm.h interface, so any engine
 * implementing it (wasmtime, wasmer, ...) can be linked in.
 *
 * Every import is bound to a host function copied out of the CallTable;
 * arguments and results are converted between wasm_val_t and guest::Value
 * according to the signature the module declared.
 *
 * The engine must outlive every Module and Instance it produced.
 */

#if defined(HOSTBRIDGE_GUEST_WASM_C_API)

#include "hostbridge/bridge/call_table.h"
#include "hostbridge/guest/engine.h"
#include <wasm.h>
#include <iostream>
#include <map>

namespace hostbridge {
namespace guest {

namespace {

std::string nameOf(const wasm_name_t* name) {
    if (!name || !name->data) return std::string();
    std::string result(name->data, name->size);
    // Some engines count a trailing NUL in the name
    if (!result.empty() && result.back() == '\0') result.pop_back();
    return result;
}

Value fromWasm(const wasm_val_t& val) {
    switch (val.kind) {
        case WASM_I32: return Value::fromI32(val.of.i32);
        case WASM_I64: return Value::fromI64(val.of.i64);
        case WASM_F32: return Value::fromF32(val.of.f32);
        case WASM_F64: return Value::fromF64(val.of.f64);
        default: return Value::none();
    }
}

wasm_val_t toWasm(const Value& value, wasm_valkind_t kind) {
    wasm_val_t val;
    val.kind = kind;
    switch (kind) {
        case WASM_I32: val.of.i32 = value.asI32(); break;
        case WASM_I64: val.of.i64 = value.asI64(); break;
        case WASM_F32: val.of.f32 = value.asF32(); break;
        case WASM_F64: val.of.f64 = value.asF64(); break;
        default:
            val.kind = WASM_I32;
            val.of.i32 = 0;
            break;
    }
    return val;
}

std::vector<wasm_valkind_t> kindsOf(const wasm_valtype_vec_t* types) {
    std::vector<wasm_valkind_t> kinds;
    for (size_t i = 0; types && i < types->size; i++) {
        kinds.push_back(wasm_valtype_kind(types->data[i]));
    }
    return kinds;
}

std::string trapMessage(wasm_trap_t* trap) {
    wasm_message_t message;
    wasm_trap_message(trap, &message);
    std::string text = nameOf(&message);
    wasm_byte_vec_delete(&message);
    return text;
}

/**
 * Per-import state handed to the engine as the callback environment.
 */
struct ImportEnv {
    std::string name;
    bridge::HostFunction fn;
    std::vector<wasm_valkind_t> results;
};

wasm_trap_t* importTrampoline(void* env, const wasm_val_vec_t* args, wasm_val_vec_t* results) {
    ImportEnv* import = static_cast<ImportEnv*>(env);

    bridge::Args hostArgs;
    hostArgs.reserve(args ? args->size : 0);
    for (size_t i = 0; args && i < args->size; i++) {
        hostArgs.push_back(fromWasm(args->data[i]));
    }

    Value result = bridge::invokeHost(import->name, import->fn, hostArgs);

    for (size_t i = 0; results && i < results->size && i < import->results.size(); i++) {
        results->data[i] = toWasm(i == 0 ? result : Value::none(), import->results[i]);
    }
    return nullptr;
}

// ============================================================================
// Module
// ============================================================================

class WasmModule : public Module {
public:
    explicit WasmModule(wasm_module_t* module) : module_(module) {}
    ~WasmModule() override {
        if (module_) wasm_module_delete(module_);
    }

    std::vector<std::string> importNames() const override {
        std::vector<std::string> names;
        wasm_importtype_vec_t imports;
        wasm_module_imports(module_, &imports);
        for (size_t i = 0; i < imports.size; i++) {
            names.push_back(nameOf(wasm_importtype_name(imports.data[i])));
        }
        wasm_importtype_vec_delete(&imports);
        return names;
    }

    wasm_module_t* handle() const { return module_; }

private:
    wasm_module_t* module_;
};

// ============================================================================
// Instance
// ============================================================================

class WasmInstance : public Instance {
public:
    WasmInstance() = default;

    ~WasmInstance() override {
        wasm_extern_vec_delete(&exports_);
        if (instance_) wasm_instance_delete(instance_);
        for (wasm_func_t* func : importFuncs_) {
            wasm_func_delete(func);
        }
    }

    bool init(wasm_store_t* store, const WasmModule& module, const bridge::CallTable& table) {
        wasm_importtype_vec_t importTypes;
        wasm_module_imports(module.handle(), &importTypes);

        std::vector<wasm_extern_t*> externs;
        bool ok = true;
        for (size_t i = 0; i < importTypes.size; i++) {
            const wasm_importtype_t* type = importTypes.data[i];
            std::string name = nameOf(wasm_importtype_name(type));
            const wasm_externtype_t* externType = wasm_importtype_type(type);

            if (wasm_externtype_kind(externType) != WASM_EXTERN_FUNC) {
                std::cerr << "[Guest] Unsupported non-function import: " << name << std::endl;
                ok = false;
                break;
            }
            const wasm_functype_t* funcType = wasm_externtype_as_functype_const(externType);

            auto env = std::make_unique<ImportEnv>();
            env->name = name;
            env->results = kindsOf(wasm_functype_results(funcType));
            const bridge::HostFunction* fn = table.find(name);
            if (fn) {
                env->fn = *fn;
            } else {
                std::cerr << "[Guest] Import " << name << " is not in the call table" << std::endl;
            }

            wasm_func_t* func = wasm_func_new_with_env(store, funcType, importTrampoline, env.get(), nullptr);
            importEnvs_.push_back(std::move(env));
            importFuncs_.push_back(func);
            externs.push_back(wasm_func_as_extern(func));
        }
        wasm_importtype_vec_delete(&importTypes);
        if (!ok) return false;

        // Borrowed view; importFuncs_ owns the externs
        wasm_extern_vec_t imports;
        imports.size = externs.size();
        imports.data = externs.data();

        wasm_trap_t* trap = nullptr;
        instance_ = wasm_instance_new(store, module.handle(), &imports, &trap);
        if (trap) {
            std::cerr << "[Guest] Trap during instantiation: " << trapMessage(trap) << std::endl;
            wasm_trap_delete(trap);
        }
        if (!instance_) {
            std::cerr << "[Guest] Failed to instantiate module" << std::endl;
            return false;
        }

        wasm_exporttype_vec_t exportTypes;
        wasm_module_exports(module.handle(), &exportTypes);
        wasm_instance_exports(instance_, &exports_);
        for (size_t i = 0; i < exportTypes.size && i < exports_.size; i++) {
            std::string name = nameOf(wasm_exporttype_name(exportTypes.data[i]));
            wasm_extern_t* item = exports_.data[i];
            if (wasm_extern_kind(item) == WASM_EXTERN_FUNC) {
                functions_[name] = wasm_extern_as_func(item);
            } else if (wasm_extern_kind(item) == WASM_EXTERN_MEMORY && !memory_) {
                memory_ = wasm_extern_as_memory(item);
            }
        }
        wasm_exporttype_vec_delete(&exportTypes);

        if (!memory_) {
            std::cerr << "[Guest] Module does not export a memory" << std::endl;
        }
        return true;
    }

    MemorySpan memory() override {
        MemorySpan span;
        if (memory_) {
            span.data = reinterpret_cast<uint8_t*>(wasm_memory_data(memory_));
            span.size = wasm_memory_data_size(memory_);
        }
        return span;
    }

    bool hasExport(const std::string& name) const override {
        return functions_.find(name) != functions_.end();
    }

    std::optional<Value> call(const std::string& name, const std::vector<Value>& args) override {
        auto it = functions_.find(name);
        if (it == functions_.end()) return std::nullopt;
        wasm_func_t* func = it->second;

        wasm_functype_t* type = wasm_func_type(func);
        std::vector<wasm_valkind_t> paramKinds = kindsOf(wasm_functype_params(type));
        std::vector<wasm_valkind_t> resultKinds = kindsOf(wasm_functype_results(type));
        wasm_functype_delete(type);

        std::vector<wasm_val_t> params;
        params.reserve(paramKinds.size());
        for (size_t i = 0; i < paramKinds.size(); i++) {
            params.push_back(toWasm(i < args.size() ? args[i] : Value::none(), paramKinds[i]));
        }

        std::vector<wasm_val_t> results(resultKinds.size());
        for (size_t i = 0; i < resultKinds.size(); i++) {
            results[i] = toWasm(Value::none(), resultKinds[i]);
        }

        wasm_val_vec_t paramVec;
        paramVec.size = params.size();
        paramVec.data = params.data();
        wasm_val_vec_t resultVec;
        resultVec.size = results.size();
        resultVec.data = results.data();

        wasm_trap_t* trap = wasm_func_call(func, &paramVec, &resultVec);
        if (trap) {
            std::cerr << "[Guest] Trap in " << name << ": " << trapMessage(trap) << std::endl;
            wasm_trap_delete(trap);
            return std::nullopt;
        }
        return results.empty() ? Value::none() : fromWasm(results[0]);
    }

private:
    wasm_instance_t* instance_ = nullptr;
    wasm_extern_vec_t exports_ = {0, nullptr};
    wasm_memory_t* memory_ = nullptr;
    std::map<std::string, wasm_func_t*> functions_;
    std::vector<std::unique_ptr<ImportEnv>> importEnvs_;
    std::vector<wasm_func_t*> importFuncs_;
};

// ============================================================================
// Engine
// ============================================================================

class WasmCApiEngine : public Engine {
public:
    WasmCApiEngine() {
        engine_ = wasm_engine_new();
        store_ = engine_ ? wasm_store_new(engine_) : nullptr;
    }

    ~WasmCApiEngine() override {
        if (store_) wasm_store_delete(store_);
        if (engine_) wasm_engine_delete(engine_);
    }

    bool isReady() const { return store_ != nullptr; }

    EngineType getType() const override { return EngineType::WasmCApi; }
    const char* getName() const override { return "wasm-c-api"; }

    std::unique_ptr<Module> compile(const std::vector<uint8_t>& bytes) override {
        wasm_byte_vec_t binary;
        wasm_byte_vec_new(&binary, bytes.size(), reinterpret_cast<const wasm_byte_t*>(bytes.data()));
        wasm_module_t* module = wasm_module_new(store_, &binary);
        wasm_byte_vec_delete(&binary);

        if (!module) {
            std::cerr << "[Guest] Failed to compile module (" << bytes.size() << " bytes)" << std::endl;
            return nullptr;
        }
        return std::make_unique<WasmModule>(module);
    }

    std::unique_ptr<Instance> instantiate(const Module& module, const bridge::CallTable& table) override {
        const WasmModule* wasmModule = dynamic_cast<const WasmModule*>(&module);
        if (!wasmModule) {
            std::cerr << "[Guest] Module was not compiled by this engine" << std::endl;
            return nullptr;
        }
        auto instance = std::make_unique<WasmInstance>();
        if (!instance->init(store_, *wasmModule, table)) {
            return nullptr;
        }
        return instance;
    }

private:
    wasm_engine_t* engine_ = nullptr;
    wasm_store_t* store_ = nullptr;
};

}  // namespace

std::unique_ptr<Engine> createWasmCApiEngine() {
    auto engine = std::make_unique<WasmCApiEngine>();
    if (!engine->isReady()) {
        std::cerr << "[Guest] Failed to create WebAssembly engine" << std::endl;
        return nullptr;
    }
    return engine;
}

}  // namespace guest
}  // namespace hostbridge

#endif  // HOSTBRIDGE_GUEST_WASM_C_API
