#pragma once
#include "cmacros/ConstantType.h"
#include "llvm/ADT/StringRef.h"
#include <optional>

namespace cmacros {

struct Classification {
    ConstantType type;
    Value        value;
};

/// Zero-compilation classification of a macro's raw text.  The first shape
/// that matches wins:
///
///   -?([1-9][0-9]*|0[0-7]*)       int    (octal read in base 8, as C does)
///   "[A-Za-z0-9_]+"               string (unquoted text)
///   [0-9]+\.[0-9]+[fF]?           float with suffix, double without; the
///                                 value keeps the text before the suffix
///
/// Anything else, including integers that do not fit in 64 bits, returns
/// nullopt and is left to the compiler.  Pure and deterministic.
std::optional<Classification> classifyLiteral(llvm::StringRef raw);

} // namespace cmacros
