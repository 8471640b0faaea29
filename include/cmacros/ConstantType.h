#pragma once
#include "llvm/ADT/StringRef.h"
#include <cstdint>
#include <string>

namespace cmacros {

// ── Type tags ─────────────────────────────────────────────────────────────────
enum class ConstantType {
    Int,
    Long,
    Float,
    Double,
    String,   // char * / const char *
    Pointer,  // void *
    Other,    // no usable scalar constant (code macro, unsupported type)
};

/// Tag spelling used in probe output, config and results: "int", "long", ...
const char *typeName(ConstantType t);

/// Parse a tag spelling.  Throws ConfigurationError for anything outside the
/// fixed enumeration.
ConstantType parseConstantType(llvm::StringRef tag);

/// Like parseConstantType, but maps unknown spellings to Other.  Used on
/// probe output, where an unexpected answer means "not a constant".
ConstantType constantTypeFromProbe(llvm::StringRef tag);

/// The C return type a value probe declares for `t`.  Must not be called
/// with Other.
const char *cTypeFor(ConstantType t);

// =============================================================================
// Value — a resolved constant payload
// =============================================================================
struct Value {
    ConstantType type     = ConstantType::Other;
    int64_t      intVal   = 0;   // Int, Long
    double       floatVal = 0.0; // Float, Double when computed by a probe
    std::string  strVal;         // String payload, or Float/Double literal text
    uintptr_t    ptrVal   = 0;   // Pointer (opaque, never dereferenced)

    static Value mkInt(int64_t v)   { Value x; x.type = ConstantType::Int;  x.intVal = v; return x; }
    static Value mkLong(int64_t v)  { Value x; x.type = ConstantType::Long; x.intVal = v; return x; }
    static Value mkFloat(double v)  { Value x; x.type = ConstantType::Float;  x.floatVal = v; return x; }
    static Value mkDouble(double v) { Value x; x.type = ConstantType::Double; x.floatVal = v; return x; }
    static Value mkString(std::string s) {
        Value x; x.type = ConstantType::String; x.strVal = std::move(s); return x;
    }
    static Value mkPointer(uintptr_t p) {
        Value x; x.type = ConstantType::Pointer; x.ptrVal = p; return x;
    }
    // Float/Double kept as the literal's decimal text (no binary rounding).
    static Value mkDecimalText(ConstantType t, std::string text) {
        Value x; x.type = t; x.strVal = std::move(text); return x;
    }

    bool hasDecimalText() const {
        return (type == ConstantType::Float || type == ConstantType::Double) &&
               !strVal.empty();
    }

    /// Human readable rendering: integers in decimal, floats as their literal
    /// text (or shortest round-trip form), strings unquoted, pointers as hex.
    std::string repr() const;

    bool operator==(const Value &o) const;
    bool operator!=(const Value &o) const { return !(*this == o); }
};

} // namespace cmacros
