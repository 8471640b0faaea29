#pragma once
#include "cmacros/Config.h"
#include "cmacros/Diagnostic.h"
#include "cmacros/ToolRunner.h"
#include "llvm/ADT/StringRef.h"
#include <string>
#include <vector>

namespace cmacros {

/// A "#define NAME TEXT" line as reported by the preprocessor.
struct RawMacro {
    std::string name;
    std::string rawValue; // may be empty for valueless macros
    unsigned    line = 0; // 1-based line in the dump
};

/// Runs the preprocessor in macro-dump mode over the aggregated headers and
/// returns the object-like macros that pass the name filter, in output order.
class MacroEnumerator {
public:
    /// Pseudo-file name diagnostics about the dump are reported against.
    static constexpr const char *kDumpFile = "<macro-dump>";

    MacroEnumerator(const DiscoveryConfig &config, ToolRunner &runner,
                    DiagEngine &diag);

    /// Throws ToolInvocationError if the preprocessor fails.
    std::vector<RawMacro> enumerate();

    /// <cc...> <ppflags...> <cflags...> <extra-cflags...> <source>
    std::vector<std::string> commandLine(const std::string &sourcePath) const;

    /// Parse -dM output.  Lines that are not "#define" lines become warnings;
    /// function-like macros and names rejected by `filter` are dropped.
    static std::vector<RawMacro> parseMacroDump(llvm::StringRef output,
                                                const NameFilter &filter,
                                                DiagEngine &diag);

private:
    const DiscoveryConfig &config_;
    ToolRunner            &runner_;
    DiagEngine            &diag_;
};

} // namespace cmacros
