#include "cmacros/Classifier.h"

#include <cctype>
#include <cstdint>
#include <limits>

namespace cmacros {

static bool isDigit(char c) { return c >= '0' && c <= '9'; }
static bool isOctal(char c) { return c >= '0' && c <= '7'; }
static bool isWordChar(char c) {
    return isalnum(static_cast<unsigned char>(c)) || c == '_';
}

static std::optional<Classification> classifyInteger(llvm::StringRef raw) {
    llvm::StringRef digits = raw;
    bool negative = digits.consume_front("-");
    if (digits.empty()) return std::nullopt;

    unsigned radix;
    if (digits.front() == '0') {
        for (char c : digits) if (!isOctal(c)) return std::nullopt;
        radix = 8;
    } else {
        for (char c : digits) if (!isDigit(c)) return std::nullopt;
        radix = 10;
    }

    uint64_t magnitude = 0;
    if (digits.getAsInteger(radix, magnitude)) return std::nullopt; // overflow

    const uint64_t maxPos = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    int64_t v;
    if (negative) {
        if (magnitude > maxPos + 1) return std::nullopt;
        v = magnitude == maxPos + 1 ? std::numeric_limits<int64_t>::min()
                                    : -static_cast<int64_t>(magnitude);
    } else {
        if (magnitude > maxPos) return std::nullopt;
        v = static_cast<int64_t>(magnitude);
    }
    return Classification{ConstantType::Int, Value::mkInt(v)};
}

static std::optional<Classification> classifyString(llvm::StringRef raw) {
    if (raw.size() < 3 || raw.front() != '"' || raw.back() != '"')
        return std::nullopt;
    llvm::StringRef body = raw.drop_front().drop_back();
    for (char c : body) if (!isWordChar(c)) return std::nullopt;
    return Classification{ConstantType::String, Value::mkString(body.str())};
}

static std::optional<Classification> classifyDecimal(llvm::StringRef raw) {
    bool suffixed = false;
    llvm::StringRef text = raw;
    if (!text.empty() && (text.back() == 'f' || text.back() == 'F')) {
        suffixed = true;
        text = text.drop_back();
    }
    size_t dot = text.find('.');
    if (dot == llvm::StringRef::npos) return std::nullopt;
    llvm::StringRef whole = text.take_front(dot);
    llvm::StringRef frac  = text.drop_front(dot + 1);
    if (whole.empty() || frac.empty()) return std::nullopt;
    for (char c : whole) if (!isDigit(c)) return std::nullopt;
    for (char c : frac)  if (!isDigit(c)) return std::nullopt;

    ConstantType t = suffixed ? ConstantType::Float : ConstantType::Double;
    return Classification{t, Value::mkDecimalText(t, text.str())};
}

std::optional<Classification> classifyLiteral(llvm::StringRef raw) {
    if (auto c = classifyInteger(raw)) return c;
    if (auto c = classifyString(raw))  return c;
    if (auto c = classifyDecimal(raw)) return c;
    return std::nullopt;
}

} // namespace cmacros
