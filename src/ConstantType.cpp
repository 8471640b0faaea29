#include "cmacros/ConstantType.h"
#include "cmacros/Error.h"

#include <cstdio>

namespace cmacros {

const char *typeName(ConstantType t) {
    switch (t) {
    case ConstantType::Int:     return "int";
    case ConstantType::Long:    return "long";
    case ConstantType::Float:   return "float";
    case ConstantType::Double:  return "double";
    case ConstantType::String:  return "string";
    case ConstantType::Pointer: return "pointer";
    case ConstantType::Other:   return "other";
    }
    return "other";
}

static bool lookupType(llvm::StringRef tag, ConstantType &out) {
    static const ConstantType all[] = {
        ConstantType::Int,    ConstantType::Long,   ConstantType::Float,
        ConstantType::Double, ConstantType::String, ConstantType::Pointer,
        ConstantType::Other,
    };
    for (ConstantType t : all) {
        if (tag == typeName(t)) { out = t; return true; }
    }
    return false;
}

ConstantType parseConstantType(llvm::StringRef tag) {
    ConstantType t;
    if (!lookupType(tag, t))
        throw ConfigurationError(
            "type should be one of: string, int, long, pointer, float, double "
            "or other (got '" + tag.str() + "')");
    return t;
}

ConstantType constantTypeFromProbe(llvm::StringRef tag) {
    ConstantType t;
    return lookupType(tag.trim(), t) ? t : ConstantType::Other;
}

const char *cTypeFor(ConstantType t) {
    switch (t) {
    case ConstantType::Int:     return "int";
    case ConstantType::Long:    return "long";
    case ConstantType::Float:   return "float";
    case ConstantType::Double:  return "double";
    case ConstantType::String:  return "const char *";
    case ConstantType::Pointer: return "void *";
    case ConstantType::Other:   break;
    }
    return nullptr;
}

std::string Value::repr() const {
    char buf[64];
    switch (type) {
    case ConstantType::Int:
    case ConstantType::Long:
        return std::to_string(intVal);
    case ConstantType::Float:
        if (!strVal.empty()) return strVal;
        snprintf(buf, sizeof(buf), "%.9g", floatVal);
        return buf;
    case ConstantType::Double:
        if (!strVal.empty()) return strVal;
        snprintf(buf, sizeof(buf), "%.17g", floatVal);
        return buf;
    case ConstantType::String:
        return strVal;
    case ConstantType::Pointer:
        snprintf(buf, sizeof(buf), "0x%llx",
                 static_cast<unsigned long long>(ptrVal));
        return buf;
    case ConstantType::Other:
        break;
    }
    return {};
}

bool Value::operator==(const Value &o) const {
    return type == o.type && intVal == o.intVal && floatVal == o.floatVal &&
           strVal == o.strVal && ptrVal == o.ptrVal;
}

} // namespace cmacros
