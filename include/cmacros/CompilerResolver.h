#pragma once
#include "cmacros/Config.h"
#include "cmacros/Diagnostic.h"
#include "cmacros/ExpressionResolver.h"
#include "cmacros/ProbeRenderer.h"
#include "cmacros/ToolRunner.h"
#include "llvm/ADT/StringRef.h"
#include <memory>
#include <string>
#include <vector>

namespace cmacros {

/// ExpressionResolver that compiles a probe into a shared object, loads it
/// into this process, calls its single exported function and reads back the
/// answer.  Every probe source and module lives in an owner-only directory
/// private to one call, and that directory is removed before the call
/// returns, whether or not the build succeeded.
class CompilerResolver : public ExpressionResolver {
public:
    // `diag` receives a note per failed probe when config.verbose is set.
    CompilerResolver(const DiscoveryConfig &config, ToolRunner &runner,
                     DiagEngine *diag = nullptr);
    ~CompilerResolver() override;

    ConstantType resolveType(const std::string &expression) override;
    std::optional<Value> resolveValue(ConstantType type,
                                      const std::string &expression) override;

    /// <cc...> <cflags...> <extra-cflags...> <source> -shared -fPIC -o <module>
    std::vector<std::string> buildCommand(const std::string &sourcePath,
                                          const std::string &modulePath) const;

private:
    class ProbeModule;

    // Writes `source`, builds and loads it, and looks up `symbol`.  Returns
    // nullptr on any failure.
    std::unique_ptr<ProbeModule> buildProbe(llvm::StringRef stem,
                                            const std::string &source,
                                            const char *symbol);

    void noteFailure(const std::string &what);

    const DiscoveryConfig &config_;
    ToolRunner            &runner_;
    DiagEngine            *diag_;
    ProbeRenderer          renderer_;
};

} // namespace cmacros
