#pragma once

/**
 * In-memory guest used by the bridge tests.
 *
 * Memory is a plain byte vector; exports are lambdas. A bump allocator
 * backs allocate_vec_u8 so host -> guest copies land in a known region.
 * Every export call is recorded for assertions.
 */

#include "hostbridge/bridge/call_table.h"
#include "hostbridge/guest/engine.h"
#include <cstring>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace hostbridge {
namespace test {

class FakeGuest : public guest::Instance {
public:
    using Export = std::function<guest::Value(const std::vector<guest::Value>&)>;

    struct Call {
        std::string name;
        std::vector<guest::Value> args;
    };

    static constexpr uint32_t kHeapStart = 32768;

    explicit FakeGuest(size_t memorySize = 65536) : memory_(memorySize, 0) {
        exports_["allocate_vec_u8"] = [this](const std::vector<guest::Value>& args) {
            uint32_t len = args.empty() ? 0 : args[0].asU32();
            uint32_t ptr = heap_;
            heap_ += (len + 7) & ~7u;
            return guest::Value::fromI32(static_cast<int32_t>(ptr));
        };
    }

    guest::MemorySpan memory() override {
        guest::MemorySpan span;
        span.data = memory_.data();
        span.size = memory_.size();
        return span;
    }

    bool hasExport(const std::string& name) const override {
        return exports_.find(name) != exports_.end();
    }

    std::optional<guest::Value> call(const std::string& name, const std::vector<guest::Value>& args) override {
        auto it = exports_.find(name);
        if (it == exports_.end()) return std::nullopt;
        calls_.push_back({name, args});
        return it->second(args);
    }

    void setExport(const std::string& name, Export fn) { exports_[name] = std::move(fn); }

    // Export that records its calls and returns nothing
    void recordExport(const std::string& name) {
        exports_[name] = [](const std::vector<guest::Value>&) { return guest::Value::none(); };
    }

    void putString(uint32_t ptr, const std::string& text) {
        std::memcpy(memory_.data() + ptr, text.data(), text.size());
    }

    void putBytes(uint32_t ptr, const std::vector<uint8_t>& bytes) {
        std::memcpy(memory_.data() + ptr, bytes.data(), bytes.size());
    }

    template <typename T>
    void put(uint32_t ptr, const T& value) {
        std::memcpy(memory_.data() + ptr, &value, sizeof(T));
    }

    template <typename T>
    T get(uint32_t ptr) const {
        T value;
        std::memcpy(&value, memory_.data() + ptr, sizeof(T));
        return value;
    }

    std::string getString(uint32_t ptr, size_t len) const {
        return std::string(reinterpret_cast<const char*>(memory_.data() + ptr), len);
    }

    std::vector<uint8_t> getBytes(uint32_t ptr, size_t len) const {
        return std::vector<uint8_t>(memory_.begin() + ptr, memory_.begin() + ptr + len);
    }

    const std::vector<Call>& calls() const { return calls_; }

    std::vector<Call> callsTo(const std::string& name) const {
        std::vector<Call> result;
        for (const auto& c : calls_) {
            if (c.name == name) result.push_back(c);
        }
        return result;
    }

    void clearCalls() { calls_.clear(); }

private:
    std::vector<uint8_t> memory_;
    std::map<std::string, Export> exports_;
    std::vector<Call> calls_;
    uint32_t heap_ = kHeapStart;
};

/**
 * Shorthand for building argument lists.
 */
inline guest::Value i32(int32_t v) { return guest::Value::fromI32(v); }
inline guest::Value u32(uint32_t v) { return guest::Value::fromI32(static_cast<int32_t>(v)); }
inline guest::Value f32(float v) { return guest::Value::fromF32(v); }
inline guest::Value f64(double v) { return guest::Value::fromF64(v); }

}  // namespace test
}  // namespace hostbridge
