#include "cmacros/CompilerResolver.h"
#include "cmacros/Error.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/Process.h"
#include "llvm/Support/raw_ostream.h"

#include <atomic>
#include <dlfcn.h>

namespace cmacros {

// =============================================================================
// ProbeModule — one built and loaded probe
// =============================================================================

class CompilerResolver::ProbeModule {
public:
    explicit ProbeModule(std::string dir) : dir_(std::move(dir)) {}

    ~ProbeModule() {
        // Unload before the directory (and the module in it) goes away.
        if (handle_) dlclose(handle_);
        llvm::sys::fs::remove_directories(dir_);
    }

    ProbeModule(const ProbeModule &) = delete;
    ProbeModule &operator=(const ProbeModule &) = delete;

    // <dir>/<stem>-<pid>-<counter>, without extension.  The counter is shared
    // by every resolver in the process so names stay distinct in verbose
    // output.
    std::string artifactBase(llvm::StringRef stem) const {
        static std::atomic<unsigned long> counter{0};
        unsigned long n = ++counter;

        llvm::SmallString<128> path(dir_);
        llvm::sys::path::append(path, llvm::Twine(stem) + "-" +
                                      llvm::Twine(llvm::sys::Process::getProcessId()) +
                                      "-" + llvm::Twine(n));
        return path.str().str();
    }

    void *handle_ = nullptr;
    void *symbol_ = nullptr;

private:
    std::string dir_;
};

// ── private artifact directory ───────────────────────────────────────────────

// Each resolution writes and loads only inside a fresh owner-only directory
// under the temp directory.
static std::error_code makeProbeDir(std::string &out) {
    llvm::SmallString<128> dir;
    if (std::error_code ec =
            llvm::sys::fs::createUniqueDirectory("cmacros-probe", dir))
        return ec;
    out = dir.str().str();
    return llvm::sys::fs::setPermissions(out, llvm::sys::fs::owner_all);
}

// =============================================================================
// CompilerResolver
// =============================================================================

CompilerResolver::CompilerResolver(const DiscoveryConfig &config,
                                   ToolRunner &runner, DiagEngine *diag)
    : config_(config)
    , runner_(runner)
    , diag_(diag)
    , renderer_(config.headers, config.lang) {}

CompilerResolver::~CompilerResolver() = default;

std::vector<std::string>
CompilerResolver::buildCommand(const std::string &sourcePath,
                               const std::string &modulePath) const {
    std::vector<std::string> cmd(config_.cc.begin(), config_.cc.end());
    for (auto &f : config_.cflags)      cmd.push_back(f);
    for (auto &f : config_.extraCflags) cmd.push_back(f);
    cmd.push_back(sourcePath);
    cmd.push_back("-shared");
    cmd.push_back("-fPIC");
    cmd.push_back("-o");
    cmd.push_back(modulePath);
    return cmd;
}

void CompilerResolver::noteFailure(const std::string &what) {
    if (diag_ && config_.verbose)
        diag_->note({}, what);
}

std::unique_ptr<CompilerResolver::ProbeModule>
CompilerResolver::buildProbe(llvm::StringRef stem, const std::string &source,
                             const char *symbol) {
    std::string dir;
    if (std::error_code ec = makeProbeDir(dir)) {
        if (!dir.empty()) llvm::sys::fs::remove_directories(dir);
        noteFailure("cannot create probe directory: " + ec.message());
        return nullptr;
    }

    // Owns the directory from here on; every return below cleans up.
    auto probe = std::make_unique<ProbeModule>(dir);
    std::string base       = probe->artifactBase(stem);
    std::string sourcePath = base + "." + config_.sourceSuffix();
    std::string modulePath = base + ".so";

    {
        std::error_code ec;
        llvm::raw_fd_ostream os(sourcePath, ec, llvm::sys::fs::CD_CreateNew,
                                llvm::sys::fs::FA_Write, llvm::sys::fs::OF_None);
        if (ec) {
            noteFailure("cannot write probe " + sourcePath + ": " + ec.message());
            return nullptr;
        }
        os << source;
        os.close();
        if (os.has_error()) {
            noteFailure("cannot write probe " + sourcePath + ": " +
                        os.error().message());
            os.clear_error();
            return nullptr;
        }
    }

    std::vector<std::string> cmd = buildCommand(sourcePath, modulePath);
    ToolResult res = runner_.run(cmd);
    if (!res.ok()) {
        noteFailure("probe build failed: " + joinCommandLine(cmd) + "\n" + res.err);
        return nullptr;
    }

    probe->handle_ = dlopen(modulePath.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!probe->handle_) {
        const char *err = dlerror();
        noteFailure("cannot load probe " + modulePath + ": " + (err ? err : "unknown error"));
        return nullptr;
    }
    probe->symbol_ = dlsym(probe->handle_, symbol);
    if (!probe->symbol_) {
        const char *err = dlerror();
        noteFailure(std::string("probe has no symbol ") + symbol + ": " +
                    (err ? err : "unknown error"));
        return nullptr;
    }
    return probe;
}

ConstantType CompilerResolver::resolveType(const std::string &expression) {
    auto probe = buildProbe("cet", renderer_.typeProbe(expression),
                            ProbeRenderer::kTypeSymbol);
    if (!probe) return ConstantType::Other;

    auto fn = reinterpret_cast<const char *(*)()>(probe->symbol_);
    const char *tag = fn();
    // The tag lives in the module's rodata; decode it before unloading.
    return tag ? constantTypeFromProbe(tag) : ConstantType::Other;
}

std::optional<Value> CompilerResolver::resolveValue(ConstantType type,
                                                    const std::string &expression) {
    if (type == ConstantType::Other) return std::nullopt;

    auto probe = buildProbe("cev", renderer_.valueProbe(type, expression),
                            ProbeRenderer::kValueSymbol);
    if (!probe) return std::nullopt;

    void *sym = probe->symbol_;
    switch (type) {
    case ConstantType::Int:
        return Value::mkInt(reinterpret_cast<int (*)()>(sym)());
    case ConstantType::Long:
        return Value::mkLong(reinterpret_cast<long (*)()>(sym)());
    case ConstantType::Float:
        return Value::mkFloat(reinterpret_cast<float (*)()>(sym)());
    case ConstantType::Double:
        return Value::mkDouble(reinterpret_cast<double (*)()>(sym)());
    case ConstantType::String: {
        const char *s = reinterpret_cast<const char *(*)()>(sym)();
        if (!s) return std::nullopt;
        return Value::mkString(s);
    }
    case ConstantType::Pointer: {
        void *p = reinterpret_cast<void *(*)()>(sym)();
        return Value::mkPointer(reinterpret_cast<uintptr_t>(p));
    }
    case ConstantType::Other:
        break;
    }
    return std::nullopt;
}

} // namespace cmacros
