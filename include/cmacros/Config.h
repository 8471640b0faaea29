#pragma once
#include "llvm/ADT/StringRef.h"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace cmacros {

enum class Language { C, CXX };

/// "c" or "c++".
const char *languageName(Language l);

/// Parse "c" / "c++".  Throws ConfigurationError otherwise.
Language parseLanguage(llvm::StringRef s);

/// Predicate over macro names; a name is kept when it returns true.
using NameFilter = std::function<bool(llvm::StringRef)>;

/// The default filter: reject names starting with '_'.
bool defaultNameFilter(llvm::StringRef name);

/// Build a filter from a regular expression that names must match.
/// Throws ConfigurationError if the pattern does not compile.
NameFilter regexNameFilter(const std::string &pattern);

/// Everything one discovery run needs.  Built once by the caller and treated
/// as read-only by every stage of the pipeline.
struct DiscoveryConfig {
    std::vector<std::string> headers;     // #include order matters
    Language                 lang = Language::C;
    std::vector<std::string> cc;          // compiler executable + base args
    std::optional<std::vector<std::string>> ppflags; // override of -dM -E -x <lang>
    std::vector<std::string> cflags;
    std::vector<std::string> extraCflags; // e.g. -I paths
    NameFilter               filter = defaultNameFilter;
    bool                     verbose = false;

    /// Host defaults: cc from $CC (or the first of cc/gcc/clang on PATH),
    /// cflags from $CFLAGS.
    static DiscoveryConfig defaults();

    /// Preprocessor flags in effect: the override, else -dM -E -x <lang>.
    std::vector<std::string> effectivePpflags() const;

    /// Source file suffix for the language (".c" or ".cxx").
    const char *sourceSuffix() const { return lang == Language::C ? "c" : "cxx"; }

    /// Throws ConfigurationError when the configuration cannot be used.
    void validate() const;
};

/// Split a string on shell words ("gcc -m32" → {"gcc", "-m32"}).
std::vector<std::string> splitShellWords(llvm::StringRef s);

/// Locate a C compiler: $CC if set, else cc, gcc or clang from PATH.
/// Returns an empty vector when none is found.
std::vector<std::string> findCompiler();

} // namespace cmacros
