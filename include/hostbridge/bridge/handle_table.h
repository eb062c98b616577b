#pragma once

/**
 * Handle Table
 *
 * Slot table mapping small integer ids to host-resident objects. The guest
 * only ever sees the integer; every bridge that hands objects across the
 * boundary stores them here.
 *
 * Ids come from a free-running counter and are never handed out twice.
 * A slot is in one of four states:
 *   - Vacant:   never allocated (padding, or beyond the counter)
 *   - Reserved: allocated but not usable yet (e.g. audio still decoding)
 *   - Live:     holds an object
 *   - Freed:    released by the guest; stays in the table so stale ids
 *               are reported as "already deleted" instead of aliasing
 *
 * When the counter starts at 1, id 0 is the "no object" id and is looked
 * up silently as nullptr.
 */

#include <cstdint>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace hostbridge {
namespace bridge {

enum class SlotState : uint8_t {
    Vacant,
    Reserved,
    Live,
    Freed
};

template <typename T>
class HandleTable {
public:
    /**
     * @param kind Object kind used in diagnostics ("buffer", "texture", ...)
     * @param firstId First id handed out by the counter
     */
    explicit HandleTable(std::string kind, int32_t firstId = 1)
        : kind_(std::move(kind))
        , firstId_(firstId)
        , counter_(firstId) {}

    /**
     * Store an object and return its fresh id.
     */
    int32_t allocate(T object) {
        int32_t id = nextId();
        slots_[id].state = SlotState::Live;
        slots_[id].object = std::move(object);
        return id;
    }

    /**
     * Allocate an id whose object arrives later (see set()).
     */
    int32_t reserve() {
        int32_t id = nextId();
        slots_[id].state = SlotState::Reserved;
        return id;
    }

    /**
     * Fill a reserved (or live) slot. Returns false for freed or unknown ids.
     */
    bool set(int32_t id, T object) {
        if (!inRange(id)) return false;
        Slot& slot = slots_[id];
        if (slot.state != SlotState::Reserved && slot.state != SlotState::Live) {
            return false;
        }
        slot.state = SlotState::Live;
        slot.object = std::move(object);
        return true;
    }

    /**
     * Look up a live object.
     *
     * Returns nullptr for the "no object" id and reserved slots without a
     * diagnostic.
     * Freed and unknown ids log an invalid-handle diagnostic naming the
     * caller and also return nullptr; the caller treats that as a no-op.
     */
    T* lookup(int32_t id, const char* caller = nullptr) {
        if (id == 0 && firstId_ > 0) return nullptr;
        if (!inRange(id)) {
            reportInvalid(id, caller, "an invalid");
            return nullptr;
        }
        Slot& slot = slots_[id];
        switch (slot.state) {
            case SlotState::Live:
                return &slot.object;
            case SlotState::Reserved:
                return nullptr;
            case SlotState::Freed:
                reportInvalid(id, caller, "an already deleted");
                return nullptr;
            case SlotState::Vacant:
            default:
                reportInvalid(id, caller, "an invalid");
                return nullptr;
        }
    }

    const T* lookup(int32_t id, const char* caller = nullptr) const {
        return const_cast<HandleTable*>(this)->lookup(id, caller);
    }

    /**
     * Release an id. The object's own teardown is the caller's job and must
     * happen before this call. Returns false if the id was not allocated.
     */
    bool free(int32_t id) {
        if (!inRange(id)) return false;
        Slot& slot = slots_[id];
        if (slot.state != SlotState::Live && slot.state != SlotState::Reserved) {
            return false;
        }
        slot.state = SlotState::Freed;
        slot.object = T();
        return true;
    }

    SlotState state(int32_t id) const {
        if (!inRange(id)) return SlotState::Vacant;
        return slots_[id].state;
    }

    bool isLive(int32_t id) const { return state(id) == SlotState::Live; }

    size_t liveCount() const {
        size_t count = 0;
        for (const auto& slot : slots_) {
            if (slot.state == SlotState::Live) count++;
        }
        return count;
    }

    /**
     * Number of slots including padding; always greater than the last id.
     */
    size_t capacity() const { return slots_.size(); }

    /**
     * Visit every live object (id, object).
     */
    template <typename Fn>
    void forEachLive(Fn&& fn) {
        for (size_t i = 0; i < slots_.size(); i++) {
            if (slots_[i].state == SlotState::Live) {
                fn(static_cast<int32_t>(i), slots_[i].object);
            }
        }
    }

    /**
     * Drop every slot. Used on context teardown; ids keep counting.
     */
    void clear() {
        for (auto& slot : slots_) {
            if (slot.state == SlotState::Live || slot.state == SlotState::Reserved) {
                slot.state = SlotState::Freed;
                slot.object = T();
            }
        }
    }

    const std::string& kind() const { return kind_; }

private:
    struct Slot {
        SlotState state = SlotState::Vacant;
        T object = T();
    };

    int32_t nextId() {
        int32_t id = counter_++;
        // Pad with vacant slots up to the new id
        if (slots_.size() <= static_cast<size_t>(id)) {
            slots_.resize(static_cast<size_t>(id) + 1);
        }
        return id;
    }

    bool inRange(int32_t id) const {
        return id >= 0 && static_cast<size_t>(id) < slots_.size();
    }

    void reportInvalid(int32_t id, const char* caller, const char* what) const {
        std::cerr << "[Handles] " << (caller ? caller : "lookup") << " called with "
                  << what << " " << kind_ << " ID " << id << "!" << std::endl;
    }

    std::string kind_;
    int32_t firstId_;
    int32_t counter_;
    std::vector<Slot> slots_;
};

}  // namespace bridge
}  // namespace hostbridge
