#pragma once
#include "cmacros/Classifier.h"
#include "cmacros/ConstantType.h"
#include "cmacros/ExpressionResolver.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cmacros {

/// One discovered macro (or a bare expression) with a lazily resolved type
/// and value.  Each is computed at most once; later calls return the cached
/// result.  Access from several threads is serialised per constant.
///
/// The resolver is a non-owning back-reference used only for the lazy
/// computations; it must outlive the constant.  A null resolver makes every
/// unclassified constant resolve to Other.
class Constant {
public:
    /// A macro whose raw text the classifier could not settle.  Resolution
    /// asks about the macro's name.
    Constant(std::string name, std::optional<std::string> rawValue,
             ExpressionResolver *resolver);

    /// A macro already classified from its text; no resolver is consulted.
    Constant(std::string name, std::string rawValue, Classification c);

    /// A bare expression.  Resolution asks about the expression text itself.
    /// If `assertedType` is given it is taken as the type without probing.
    static std::unique_ptr<Constant>
    fromExpression(std::string expression, ExpressionResolver *resolver,
                   std::optional<ConstantType> assertedType = std::nullopt);

    Constant(const Constant &) = delete;
    Constant &operator=(const Constant &) = delete;

    const std::string                &name()     const { return name_; }
    const std::optional<std::string> &rawValue() const { return raw_; }

    ConstantType type() const;

    /// nullopt when type() is Other or the value could not be computed.
    std::optional<Value> value() const;

    bool typeComputed()  const;
    bool valueComputed() const;

private:
    // The text handed to the resolver.
    const std::string &subject() const { return isExpression_ ? *raw_ : name_; }
    ConstantType typeLocked() const;

    std::string                name_;
    std::optional<std::string> raw_;
    ExpressionResolver        *resolver_     = nullptr;
    bool                       isExpression_ = false;

    mutable std::mutex                  mu_;
    mutable std::optional<ConstantType> type_;
    mutable bool                        valueComputed_ = false;
    mutable std::optional<Value>        value_;
};

/// Discovery result: constants in preprocessor output order, indexed by name.
class ConstantSet {
public:
    using Storage        = std::vector<std::unique_ptr<Constant>>;
    using const_iterator = Storage::const_iterator;

    /// Returns false (and drops `c`) if a constant of that name already exists.
    bool add(std::unique_ptr<Constant> c);

    /// nullptr if absent.
    const Constant *lookup(llvm::StringRef name) const;
    bool contains(llvm::StringRef name) const { return lookup(name) != nullptr; }

    size_t size()  const { return items_.size(); }
    bool   empty() const { return items_.empty(); }

    const_iterator begin() const { return items_.begin(); }
    const_iterator end()   const { return items_.end(); }

    std::vector<std::string> names() const;

private:
    Storage                 items_;
    llvm::StringMap<size_t> index_;
};

} // namespace cmacros
