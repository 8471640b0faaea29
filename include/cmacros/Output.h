#pragma once
#include "cmacros/Constant.h"
#include "llvm/Support/raw_ostream.h"

namespace cmacros {

enum class OutputFormat { Text, Json };

/// One line per constant: "NAME\tTYPE\tVALUE".  Constants whose type has not
/// been computed (and `resolve` is off) print "NAME\t?\tRAW" instead.
void printText(llvm::raw_ostream &os, const ConstantSet &set, bool resolve);

/// A JSON array of {name, raw_value, type, value} objects.  Unresolved fields
/// are null.  A float or double classified from its literal text is written
/// with exactly that text, so no digits are lost to a round trip through
/// double.
void printJson(llvm::raw_ostream &os, const ConstantSet &set, bool resolve);

inline void printConstants(llvm::raw_ostream &os, const ConstantSet &set,
                           OutputFormat format, bool resolve) {
    if (format == OutputFormat::Json) printJson(os, set, resolve);
    else                              printText(os, set, resolve);
}

} // namespace cmacros
