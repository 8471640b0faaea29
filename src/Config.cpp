#include "cmacros/Config.h"
#include "cmacros/Error.h"

#include "llvm/ADT/SmallVector.h"
#include "llvm/Support/Allocator.h"
#include "llvm/Support/CommandLine.h"
#include "llvm/Support/Program.h"
#include "llvm/Support/Regex.h"
#include "llvm/Support/StringSaver.h"

#include <cstdlib>
#include <memory>

namespace cmacros {

const char *languageName(Language l) {
    return l == Language::C ? "c" : "c++";
}

Language parseLanguage(llvm::StringRef s) {
    if (s == "c")   return Language::C;
    if (s == "c++") return Language::CXX;
    throw ConfigurationError("lang should be one of c or c++ (got '" +
                             s.str() + "')");
}

bool defaultNameFilter(llvm::StringRef name) {
    return !name.empty() && name.front() != '_';
}

NameFilter regexNameFilter(const std::string &pattern) {
    auto re = std::make_shared<llvm::Regex>(pattern);
    std::string err;
    if (!re->isValid(err))
        throw ConfigurationError("invalid filter '" + pattern + "': " + err);
    return [re](llvm::StringRef name) { return re->match(name); };
}

std::vector<std::string> splitShellWords(llvm::StringRef s) {
    llvm::BumpPtrAllocator alloc;
    llvm::StringSaver saver(alloc);
    llvm::SmallVector<const char *, 8> argv;
    llvm::cl::TokenizeGNUCommandLine(s, saver, argv);
    std::vector<std::string> out;
    for (const char *a : argv)
        if (a) out.emplace_back(a);
    return out;
}

std::vector<std::string> findCompiler() {
    const char *env = std::getenv("CC");
    if (env && *env) return splitShellWords(env);

    static const char *candidates[] = { "cc", "gcc", "clang", nullptr };
    for (int i = 0; candidates[i]; ++i) {
        if (auto p = llvm::sys::findProgramByName(candidates[i]))
            return { *p };
    }
    return {};
}

DiscoveryConfig DiscoveryConfig::defaults() {
    DiscoveryConfig c;
    c.cc = findCompiler();
    if (const char *flags = std::getenv("CFLAGS"))
        c.cflags = splitShellWords(flags);
    return c;
}

std::vector<std::string> DiscoveryConfig::effectivePpflags() const {
    if (ppflags) return *ppflags;
    return { "-dM", "-E", "-x", languageName(lang) };
}

void DiscoveryConfig::validate() const {
    if (cc.empty() || cc.front().empty())
        throw ConfigurationError(
            "no C compiler configured; set CC or pass --cc");
    if (!filter)
        throw ConfigurationError("name filter must not be empty");
}

} // namespace cmacros
