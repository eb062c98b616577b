#pragma once

#include <cmath>
#include <cstdint>

namespace hostbridge {
namespace guest {

/**
 * Numeric scalar crossing the guest boundary.
 *
 * Bridge functions are written once against Value and the engine coerces
 * to whatever signature the guest module declared for the import.
 */
struct Value {
    enum class Kind : uint8_t { None, I32, I64, F32, F64 };

    Kind kind = Kind::None;
    union {
        int32_t i32;
        int64_t i64;
        float f32;
        double f64;
    };

    Value() : i64(0) {}

    static Value none() { return Value(); }
    static Value fromI32(int32_t v) { Value r; r.kind = Kind::I32; r.i32 = v; return r; }
    static Value fromI64(int64_t v) { Value r; r.kind = Kind::I64; r.i64 = v; return r; }
    static Value fromF32(float v) { Value r; r.kind = Kind::F32; r.f32 = v; return r; }
    static Value fromF64(double v) { Value r; r.kind = Kind::F64; r.f64 = v; return r; }
    static Value fromBool(bool v) { return fromI32(v ? 1 : 0); }

    bool isNone() const { return kind == Kind::None; }

    /**
     * Float to integer conversion that never overflows: NaN and infinities
     * become 0, and values outside the int64 range are reduced modulo 2^32.
     */
    static int64_t truncateToI64(double v) {
        if (!std::isfinite(v)) return 0;
        double t = std::trunc(v);
        if (t >= 9223372036854775807.0 || t < -9223372036854775807.0) {
            t = std::fmod(t, 4294967296.0);
        }
        return static_cast<int64_t>(t);
    }

    /** Same wrapping as ToInt32: the low 32 bits of the truncated value. */
    static int32_t wrapToI32(double v) {
        return static_cast<int32_t>(static_cast<uint32_t>(static_cast<uint64_t>(truncateToI64(v))));
    }

    int32_t asI32() const {
        switch (kind) {
            case Kind::I32: return i32;
            case Kind::I64: return static_cast<int32_t>(i64);
            case Kind::F32: return wrapToI32(f32);
            case Kind::F64: return wrapToI32(f64);
            default: return 0;
        }
    }

    uint32_t asU32() const { return static_cast<uint32_t>(asI32()); }

    int64_t asI64() const {
        switch (kind) {
            case Kind::I32: return i32;
            case Kind::I64: return i64;
            case Kind::F32: return truncateToI64(f32);
            case Kind::F64: return truncateToI64(f64);
            default: return 0;
        }
    }

    float asF32() const { return static_cast<float>(asF64()); }

    double asF64() const {
        switch (kind) {
            case Kind::I32: return i32;
            case Kind::I64: return static_cast<double>(i64);
            case Kind::F32: return f32;
            case Kind::F64: return f64;
            default: return 0.0;
        }
    }

    bool asBool() const { return asI64() != 0 || asF64() != 0.0; }
};

}  // namespace guest
}  // namespace hostbridge
