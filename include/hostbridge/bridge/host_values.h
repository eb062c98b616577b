#pragma once

/**
 * Host Values
 *
 * Second handle table holding dynamically shaped host data the guest
 * manipulates by handle: strings, byte buffers and records addressed by
 * field name. Nothing here is reflective; every access is an explicit call
 * from the "values" call-table group.
 *
 * Handles come from their own counter starting at 0. Two negative handles
 * are reserved: -1 is null and -2 is undefined (e.g. a missing field).
 */

#include "hostbridge/bridge/call_table.h"
#include "hostbridge/bridge/handle_table.h"
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hostbridge {
namespace bridge {

class GuestMemory;

struct HostValue {
    enum class Kind { Number, String, Bytes, Record };
    using Fields = std::map<std::string, HostValue>;

    Kind kind = Kind::Number;
    double number = 0.0;
    std::u16string string;
    std::vector<uint8_t> bytes;
    std::shared_ptr<Fields> fields;

    static HostValue fromNumber(double n);
    static HostValue fromString(std::u16string s);
    static HostValue fromUtf8(const std::string& s);
    static HostValue fromBytes(std::vector<uint8_t> b);
    static HostValue record();

    bool isRecord() const { return kind == Kind::Record && fields; }

    /**
     * Field lookup on a record; nullptr when missing or not a record.
     */
    const HostValue* field(const std::string& name) const;
    void setField(const std::string& name, HostValue value);

    /**
     * UTF-8 text of a String value (empty for other kinds).
     */
    std::string utf8() const;
};

class HostValueTable {
public:
    static constexpr int32_t kNull = -1;
    static constexpr int32_t kUndefined = -2;

    HostValueTable();

    int32_t add(HostValue value);

    /**
     * Live value or nullptr (sentinels and unknown handles; the latter logged).
     */
    HostValue* get(int32_t handle, const char* caller = nullptr);

    /**
     * Take a value out of the table, freeing its handle.
     */
    std::optional<HostValue> consume(int32_t handle, const char* caller = nullptr);

    bool free(int32_t handle);

    size_t liveCount() const { return table_.liveCount(); }

    /**
     * Register the js_* value functions.
     */
    void registerFunctions(CallTable& table, GuestMemory& memory);

private:
    HandleTable<HostValue> table_;
};

}  // namespace bridge
}  // namespace hostbridge
