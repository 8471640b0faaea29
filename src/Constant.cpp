#include "cmacros/Constant.h"

namespace cmacros {

// =============================================================================
// Constant
// =============================================================================

Constant::Constant(std::string name, std::optional<std::string> rawValue,
                   ExpressionResolver *resolver)
    : name_(std::move(name)), raw_(std::move(rawValue)), resolver_(resolver) {}

Constant::Constant(std::string name, std::string rawValue, Classification c)
    : name_(std::move(name)), raw_(std::move(rawValue)) {
    type_          = c.type;
    value_         = std::move(c.value);
    valueComputed_ = true;
}

std::unique_ptr<Constant>
Constant::fromExpression(std::string expression, ExpressionResolver *resolver,
                         std::optional<ConstantType> assertedType) {
    std::string name = expression;
    auto c = std::make_unique<Constant>(std::move(name), std::move(expression),
                                        resolver);
    c->isExpression_ = true;
    c->type_         = assertedType;
    if (assertedType == ConstantType::Other) c->valueComputed_ = true;
    return c;
}

ConstantType Constant::typeLocked() const {
    if (!type_)
        type_ = resolver_ ? resolver_->resolveType(subject()) : ConstantType::Other;
    return *type_;
}

ConstantType Constant::type() const {
    std::lock_guard<std::mutex> lock(mu_);
    return typeLocked();
}

std::optional<Value> Constant::value() const {
    std::lock_guard<std::mutex> lock(mu_);
    if (valueComputed_) return value_;

    ConstantType t = typeLocked();
    if (t != ConstantType::Other && resolver_)
        value_ = resolver_->resolveValue(t, subject());
    valueComputed_ = true;
    return value_;
}

bool Constant::typeComputed() const {
    std::lock_guard<std::mutex> lock(mu_);
    return type_.has_value();
}

bool Constant::valueComputed() const {
    std::lock_guard<std::mutex> lock(mu_);
    return valueComputed_;
}

// =============================================================================
// ConstantSet
// =============================================================================

bool ConstantSet::add(std::unique_ptr<Constant> c) {
    auto ins = index_.try_emplace(c->name(), items_.size());
    if (!ins.second) return false;
    items_.push_back(std::move(c));
    return true;
}

const Constant *ConstantSet::lookup(llvm::StringRef name) const {
    auto it = index_.find(name);
    return it == index_.end() ? nullptr : items_[it->second].get();
}

std::vector<std::string> ConstantSet::names() const {
    std::vector<std::string> out;
    out.reserve(items_.size());
    for (auto &c : items_) out.push_back(c->name());
    return out;
}

} // namespace cmacros
