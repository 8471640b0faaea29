#include "cmacros/MacroDiscovery.h"
#include "cmacros/Classifier.h"
#include "cmacros/CompilerResolver.h"
#include "cmacros/Error.h"
#include "cmacros/MacroEnumerator.h"

namespace cmacros {

MacroDiscovery::MacroDiscovery(DiscoveryConfig config, DiagEngine &diag)
    : MacroDiscovery(std::move(config), diag, nullptr, nullptr) {}

MacroDiscovery::MacroDiscovery(DiscoveryConfig config, DiagEngine &diag,
                               std::unique_ptr<ToolRunner> runner,
                               std::unique_ptr<ExpressionResolver> resolver)
    : config_(std::move(config))
    , diag_(diag)
    , runner_(std::move(runner))
    , resolver_(std::move(resolver)) {
    config_.validate();
    if (!runner_)
        runner_ = std::make_unique<ProcessToolRunner>(config_.verbose);
    if (!resolver_)
        resolver_ = std::make_unique<CompilerResolver>(config_, *runner_, &diag_);
}

MacroDiscovery::~MacroDiscovery() = default;

ConstantSet MacroDiscovery::run() {
    MacroEnumerator enumerator(config_, *runner_, diag_);
    std::vector<RawMacro> raw = enumerator.enumerate();

    ConstantSet result;
    for (auto &m : raw) {
        std::unique_ptr<Constant> c;
        if (auto cls = classifyLiteral(m.rawValue))
            c = std::make_unique<Constant>(m.name, m.rawValue, std::move(*cls));
        else
            c = std::make_unique<Constant>(m.name, m.rawValue, resolver_.get());

        if (!result.add(std::move(c)))
            diag_.warn({MacroEnumerator::kDumpFile, m.line},
                       "duplicate definition of " + m.name + " ignored");
    }
    return result;
}

ConstantType MacroDiscovery::computeExpressionType(const std::string &expression) {
    return resolver_->resolveType(expression);
}

std::optional<Value>
MacroDiscovery::computeExpressionValue(ConstantType type,
                                       const std::string &expression) {
    if (type == ConstantType::Other) return std::nullopt;
    return resolver_->resolveValue(type, expression);
}

} // namespace cmacros
