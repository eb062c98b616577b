#include "hostbridge/bridge/guest_memory.h"
#include "hostbridge/bridge/utf8.h"
#include <iostream>

namespace hostbridge {
namespace bridge {

size_t GuestMemory::size() const {
    return instance_ ? instance_->memory().size : 0;
}

uint8_t* GuestMemory::bytes(uint32_t ptr, size_t len, const char* caller) {
    guest::MemorySpan span = instance_ ? instance_->memory() : guest::MemorySpan{};
    if (!span.data || static_cast<size_t>(ptr) > span.size || len > span.size - ptr) {
        std::cerr << "[Guest] " << (caller ? caller : "memory access")
                  << ": range [" << ptr << ", +" << len << ") outside guest memory of "
                  << span.size << " bytes" << std::endl;
        return nullptr;
    }
    return span.data + ptr;
}

uint8_t* GuestMemory::arrayBytes(uint32_t ptr, size_t count, size_t elementSize, const char* caller) {
    if (elementSize == 0 || count > size() / elementSize) {
        std::cerr << "[Guest] " << (caller ? caller : "memory access") << ": " << count
                  << " elements do not fit in guest memory of " << size() << " bytes" << std::endl;
        return nullptr;
    }
    return bytes(ptr, count * elementSize, caller);
}

bool GuestMemory::read(uint32_t ptr, void* out, size_t len, const char* caller) {
    uint8_t* src = bytes(ptr, len, caller);
    if (!src) return false;
    if (len > 0) std::memcpy(out, src, len);
    return true;
}

bool GuestMemory::write(uint32_t ptr, const void* data, size_t len, const char* caller) {
    uint8_t* dst = bytes(ptr, len, caller);
    if (!dst) return false;
    if (len > 0) std::memcpy(dst, data, len);
    return true;
}

std::vector<uint8_t> GuestMemory::copyBytes(uint32_t ptr, size_t len, const char* caller) {
    uint8_t* src = bytes(ptr, len, caller);
    if (!src) return {};
    return std::vector<uint8_t>(src, src + len);
}

std::u16string GuestMemory::readString(uint32_t ptr, size_t len, const char* caller) {
    uint8_t* src = bytes(ptr, len, caller);
    if (!src) return {};
    return decodeUtf8(src, len);
}

std::string GuestMemory::readUtf8(uint32_t ptr, size_t len, const char* caller) {
    return toUtf8(readString(ptr, len, caller));
}

std::string GuestMemory::readCString(uint32_t ptr, const char* caller) {
    guest::MemorySpan span = instance_ ? instance_->memory() : guest::MemorySpan{};
    if (!span.data || ptr >= span.size) {
        std::cerr << "[Guest] " << (caller ? caller : "memory access")
                  << ": string pointer " << ptr << " outside guest memory" << std::endl;
        return {};
    }
    const char* start = reinterpret_cast<const char*>(span.data + ptr);
    size_t maxLen = span.size - ptr;
    size_t len = 0;
    while (len < maxLen && start[len] != '\0') len++;
    return std::string(start, len);
}

size_t GuestMemory::writeString(uint32_t ptr, size_t maxLen, const std::u16string& str, const char* caller) {
    uint8_t* dst = bytes(ptr, maxLen, caller);
    if (!dst) return 0;
    return encodeUtf8(str, dst, maxLen);
}

}  // namespace bridge
}  // namespace hostbridge
