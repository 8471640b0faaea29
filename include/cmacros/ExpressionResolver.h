#pragma once
#include "cmacros/ConstantType.h"
#include <optional>
#include <string>

namespace cmacros {

/// Answers "what type is this C expression?" and "what is its value?".
/// CompilerResolver asks the real compiler; tests plug in canned answers.
///
/// Implementations must be safe to call for distinct expressions from
/// several threads at once.
class ExpressionResolver {
public:
    virtual ~ExpressionResolver() = default;

    /// Static type of `expression`, or Other if it is not a supported value
    /// expression.  Never throws for a bad expression.
    virtual ConstantType resolveType(const std::string &expression) = 0;

    /// Value of `expression` read back as `type`; nullopt if it could not be
    /// computed.  `type` must not be Other.
    virtual std::optional<Value> resolveValue(ConstantType type,
                                              const std::string &expression) = 0;
};

} // namespace cmacros
