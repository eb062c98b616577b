#include "hostbridge/bridge/host_values.h"
#include "hostbridge/bridge/guest_memory.h"
#include "hostbridge/bridge/utf8.h"
#include <iostream>

namespace hostbridge {
namespace bridge {

using guest::Value;

// ============================================================================
// HostValue
// ============================================================================

HostValue HostValue::fromNumber(double n) {
    HostValue v;
    v.kind = Kind::Number;
    v.number = n;
    return v;
}

HostValue HostValue::fromString(std::u16string s) {
    HostValue v;
    v.kind = Kind::String;
    v.string = std::move(s);
    return v;
}

HostValue HostValue::fromUtf8(const std::string& s) {
    return fromString(bridge::fromUtf8(s));
}

HostValue HostValue::fromBytes(std::vector<uint8_t> b) {
    HostValue v;
    v.kind = Kind::Bytes;
    v.bytes = std::move(b);
    return v;
}

HostValue HostValue::record() {
    HostValue v;
    v.kind = Kind::Record;
    v.fields = std::make_shared<Fields>();
    return v;
}

const HostValue* HostValue::field(const std::string& name) const {
    if (!isRecord()) return nullptr;
    auto it = fields->find(name);
    return it == fields->end() ? nullptr : &it->second;
}

void HostValue::setField(const std::string& name, HostValue value) {
    if (!isRecord()) return;
    (*fields)[name] = std::move(value);
}

std::string HostValue::utf8() const {
    return kind == Kind::String ? toUtf8(string) : std::string();
}

// ============================================================================
// HostValueTable
// ============================================================================

HostValueTable::HostValueTable() : table_("host value", 0) {}

int32_t HostValueTable::add(HostValue value) {
    return table_.allocate(std::move(value));
}

HostValue* HostValueTable::get(int32_t handle, const char* caller) {
    if (handle == kNull || handle == kUndefined) return nullptr;
    return table_.lookup(handle, caller);
}

std::optional<HostValue> HostValueTable::consume(int32_t handle, const char* caller) {
    HostValue* value = get(handle, caller);
    if (!value) return std::nullopt;
    HostValue taken = std::move(*value);
    table_.free(handle);
    return taken;
}

bool HostValueTable::free(int32_t handle) {
    return table_.free(handle);
}

namespace {

// Records store whatever the guest sets; reading a field converts numbers
// the same way for f32, u32 and num readers.
Value numberField(HostValueTable& values, GuestMemory& memory, const Args& args, const char* caller, bool asFloat) {
    HostValue* object = values.get(arg(args, 0).asI32(), caller);
    if (!object) return asFloat ? Value::fromF32(0.0f) : Value::fromI32(0);

    std::string name = memory.readUtf8(arg(args, 1).asU32(), arg(args, 2).asU32(), caller);
    const HostValue* field = object->field(name);
    double n = (field && field->kind == HostValue::Kind::Number) ? field->number : 0.0;
    if (asFloat) return Value::fromF64(n);
    return Value::fromI64(Value::truncateToI64(n));
}

}  // namespace

void HostValueTable::registerFunctions(CallTable& table, GuestMemory& memory) {
    table.set("js_create_string", [this, &memory](const Args& args) {
        std::u16string s = memory.readString(arg(args, 0).asU32(), arg(args, 1).asU32(), "js_create_string");
        return Value::fromI32(add(HostValue::fromString(std::move(s))));
    });

    table.set("js_create_buffer", [this, &memory](const Args& args) {
        std::vector<uint8_t> bytes = memory.copyBytes(arg(args, 0).asU32(), arg(args, 1).asU32(), "js_create_buffer");
        return Value::fromI32(add(HostValue::fromBytes(std::move(bytes))));
    });

    table.set("js_create_object", [this](const Args&) {
        return Value::fromI32(add(HostValue::record()));
    });

    auto setNumber = [this, &memory](const Args& args, const char* caller) {
        HostValue* object = get(arg(args, 0).asI32(), caller);
        if (!object) return Value::none();
        if (!object->isRecord()) {
            std::cerr << "[Handles] " << caller << " on a value that is not an object" << std::endl;
            return Value::none();
        }
        std::string name = memory.readUtf8(arg(args, 1).asU32(), arg(args, 2).asU32(), caller);
        object->setField(name, HostValue::fromNumber(arg(args, 3).asF64()));
        return Value::none();
    };
    table.set("js_set_field_f32", [setNumber](const Args& args) { return setNumber(args, "js_set_field_f32"); });
    table.set("js_set_field_u32", [setNumber](const Args& args) {
        Args converted = args;
        if (converted.size() > 3) converted[3] = Value::fromF64(static_cast<double>(args[3].asU32()));
        return setNumber(converted, "js_set_field_u32");
    });

    table.set("js_set_field_string", [this, &memory](const Args& args) {
        HostValue* object = get(arg(args, 0).asI32(), "js_set_field_string");
        if (!object || !object->isRecord()) return Value::none();
        std::string name = memory.readUtf8(arg(args, 1).asU32(), arg(args, 2).asU32(), "js_set_field_string");
        std::u16string value = memory.readString(arg(args, 3).asU32(), arg(args, 4).asU32(), "js_set_field_string");
        object->setField(name, HostValue::fromString(std::move(value)));
        return Value::none();
    });

    table.set("js_unwrap_to_str", [this, &memory](const Args& args) {
        HostValue* value = get(arg(args, 0).asI32(), "js_unwrap_to_str");
        if (value) {
            memory.writeString(arg(args, 1).asU32(), arg(args, 2).asU32(), value->string, "js_unwrap_to_str");
        }
        return Value::none();
    });

    table.set("js_unwrap_to_buf", [this, &memory](const Args& args) {
        HostValue* value = get(arg(args, 0).asI32(), "js_unwrap_to_buf");
        if (!value) return Value::none();
        size_t maxLen = arg(args, 2).asU32();
        size_t n = value->bytes.size() < maxLen ? value->bytes.size() : maxLen;
        if (n < value->bytes.size()) {
            std::cerr << "[Handles] js_unwrap_to_buf: destination holds " << maxLen
                      << " of " << value->bytes.size() << " bytes, truncating" << std::endl;
        }
        memory.write(arg(args, 1).asU32(), value->bytes.data(), n, "js_unwrap_to_buf");
        return Value::none();
    });

    table.set("js_string_length", [this](const Args& args) {
        HostValue* value = get(arg(args, 0).asI32(), "js_string_length");
        return Value::fromI32(value ? static_cast<int32_t>(utf8Length(value->string)) : 0);
    });

    table.set("js_buf_length", [this](const Args& args) {
        HostValue* value = get(arg(args, 0).asI32(), "js_buf_length");
        return Value::fromI32(value ? static_cast<int32_t>(value->bytes.size()) : 0);
    });

    table.set("js_free_object", [this](const Args& args) {
        free(arg(args, 0).asI32());
        return Value::none();
    });

    table.set("js_have_field", [this, &memory](const Args& args) {
        HostValue* object = get(arg(args, 0).asI32(), "js_have_field");
        if (!object) return Value::fromBool(false);
        std::string name = memory.readUtf8(arg(args, 1).asU32(), arg(args, 2).asU32(), "js_have_field");
        return Value::fromBool(object->field(name) != nullptr);
    });

    table.set("js_field_f32", [this, &memory](const Args& args) {
        return numberField(*this, memory, args, "js_field_f32", true);
    });
    table.set("js_field_u32", [this, &memory](const Args& args) {
        return numberField(*this, memory, args, "js_field_u32", false);
    });
    table.set("js_field_num", [this, &memory](const Args& args) {
        return numberField(*this, memory, args, "js_field_num", true);
    });

    table.set("js_field", [this, &memory](const Args& args) {
        HostValue* object = get(arg(args, 0).asI32(), "js_field");
        if (!object) return Value::fromI32(kUndefined);
        std::string name = memory.readUtf8(arg(args, 1).asU32(), arg(args, 2).asU32(), "js_field");
        const HostValue* field = object->field(name);
        if (!field) return Value::fromI32(kUndefined);
        return Value::fromI32(add(*field));
    });
}

}  // namespace bridge
}  // namespace hostbridge
