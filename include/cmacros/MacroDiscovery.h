#pragma once
#include "cmacros/Config.h"
#include "cmacros/Constant.h"
#include "cmacros/Diagnostic.h"
#include "cmacros/ExpressionResolver.h"
#include "cmacros/ToolRunner.h"
#include <memory>
#include <optional>
#include <string>

namespace cmacros {

/// Finds the object-like macros defined by a set of headers and hands them
/// back as Constants whose type and value resolve on demand.
///
///   DiagEngine diag;
///   DiscoveryConfig cfg = DiscoveryConfig::defaults();
///   cfg.headers = {"errno.h"};
///   MacroDiscovery d(cfg, diag);
///   for (auto &c : d.run())
///       printf("%s %s\n", c->name().c_str(), typeName(c->type()));
///
/// The constants keep a reference to this object's resolver; keep the
/// MacroDiscovery alive while they are in use.
class MacroDiscovery {
public:
    /// Uses a ProcessToolRunner and a CompilerResolver.  Throws
    /// ConfigurationError if `config` is unusable.
    MacroDiscovery(DiscoveryConfig config, DiagEngine &diag);

    /// Custom collaborators.  A null `resolver` means a CompilerResolver
    /// driving `runner`.
    MacroDiscovery(DiscoveryConfig config, DiagEngine &diag,
                   std::unique_ptr<ToolRunner> runner,
                   std::unique_ptr<ExpressionResolver> resolver = nullptr);

    ~MacroDiscovery();

    MacroDiscovery(const MacroDiscovery &) = delete;
    MacroDiscovery &operator=(const MacroDiscovery &) = delete;

    /// Preprocess the headers and build the constant set.  Throws
    /// ToolInvocationError if the preprocessor fails.
    ConstantSet run();

    /// Static type of an arbitrary expression, in the context of the headers.
    ConstantType computeExpressionType(const std::string &expression);

    /// Value of an expression of known type; nullopt if it cannot be computed.
    std::optional<Value> computeExpressionValue(ConstantType type,
                                                const std::string &expression);

    const DiscoveryConfig &config()   const { return config_; }
    ExpressionResolver    &resolver()       { return *resolver_; }

private:
    DiscoveryConfig                     config_;
    DiagEngine                         &diag_;
    std::unique_ptr<ToolRunner>         runner_;
    std::unique_ptr<ExpressionResolver> resolver_;
};

} // namespace cmacros
