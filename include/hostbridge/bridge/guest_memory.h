#pragma once

/**
 * Guest Memory
 *
 * Bounds-checked access to guest linear memory. Every (pointer, length)
 * pair coming from the guest goes through here; an out-of-range access is
 * logged with the calling bridge function and fails without touching memory.
 *
 * Views are re-read from the instance on every access because guest memory
 * may grow (and move) during any call into the guest.
 */

#include "hostbridge/guest/engine.h"
#include <cstdint>
#include <cstring>
#include <string>
#include <type_traits>
#include <vector>

namespace hostbridge {
namespace bridge {

class GuestMemory {
public:
    explicit GuestMemory(guest::Instance* instance = nullptr) : instance_(instance) {}

    void attach(guest::Instance* instance) { instance_ = instance; }
    guest::Instance* instance() const { return instance_; }
    bool attached() const { return instance_ != nullptr; }

    size_t size() const;

    /**
     * Pointer to [ptr, ptr+len) or nullptr (logged) if out of range.
     */
    uint8_t* bytes(uint32_t ptr, size_t len, const char* caller);

    bool read(uint32_t ptr, void* out, size_t len, const char* caller);
    bool write(uint32_t ptr, const void* data, size_t len, const char* caller);

    template <typename T>
    bool readValue(uint32_t ptr, T& out, const char* caller) {
        static_assert(std::is_trivially_copyable<T>::value, "plain data only");
        return read(ptr, &out, sizeof(T), caller);
    }

    template <typename T>
    bool writeValue(uint32_t ptr, const T& value, const char* caller) {
        static_assert(std::is_trivially_copyable<T>::value, "plain data only");
        return write(ptr, &value, sizeof(T), caller);
    }

    /**
     * Pointer to `count` elements of `elementSize` bytes at ptr, or nullptr
     * (logged) when the range overflows or leaves guest memory.
     */
    uint8_t* arrayBytes(uint32_t ptr, size_t count, size_t elementSize, const char* caller);

    /**
     * Copy `count` elements out of guest memory. Empty on failure; the range
     * is checked before anything is allocated.
     */
    template <typename T>
    std::vector<T> readArray(uint32_t ptr, size_t count, const char* caller) {
        static_assert(std::is_trivially_copyable<T>::value, "plain data only");
        if (count == 0) return {};
        uint8_t* src = arrayBytes(ptr, count, sizeof(T), caller);
        if (!src) return {};
        std::vector<T> out(count);
        std::memcpy(out.data(), src, count * sizeof(T));
        return out;
    }

    template <typename T>
    bool writeArray(uint32_t ptr, const T* values, size_t count, const char* caller) {
        static_assert(std::is_trivially_copyable<T>::value, "plain data only");
        if (count == 0) return true;
        uint8_t* dst = arrayBytes(ptr, count, sizeof(T), caller);
        if (!dst) return false;
        std::memcpy(dst, values, count * sizeof(T));
        return true;
    }

    std::vector<uint8_t> copyBytes(uint32_t ptr, size_t len, const char* caller);

    /**
     * Decode a UTF-8 string of at most `len` bytes (stops at NUL).
     */
    std::u16string readString(uint32_t ptr, size_t len, const char* caller);

    /**
     * Same as readString but returned as UTF-8.
     */
    std::string readUtf8(uint32_t ptr, size_t len, const char* caller);

    /**
     * NUL-terminated string, bounded by the end of memory.
     */
    std::string readCString(uint32_t ptr, const char* caller);

    /**
     * Encode a host string into at most maxLen bytes, without terminator.
     * Returns bytes written (0 on a bad range).
     */
    size_t writeString(uint32_t ptr, size_t maxLen, const std::u16string& str, const char* caller);

private:
    guest::Instance* instance_;
};

}  // namespace bridge
}  // namespace hostbridge
