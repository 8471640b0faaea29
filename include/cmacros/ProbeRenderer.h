#pragma once
#include "cmacros/Config.h"
#include "cmacros/ConstantType.h"
#include <string>
#include <vector>

namespace cmacros {

/// Renders the two probe translation units.  Built once per resolver with
/// the run's headers and language; holds no other state.
class ProbeRenderer {
public:
    static constexpr const char *kTypeSymbol  = "compute_expression_type";
    static constexpr const char *kValueSymbol = "compute_expression_value";

    ProbeRenderer(std::vector<std::string> headers, Language lang);

    /// A unit exporting `const char *compute_expression_type(void)` that
    /// returns the type tag of `expression`, selected at compile time from
    /// {float, double, char *, void *, int, long}.  Any other type fails to
    /// compile.
    std::string typeProbe(const std::string &expression) const;

    /// A unit exporting `<ctype> compute_expression_value(void)` returning
    /// `expression`.  `type` must not be Other.
    std::string valueProbe(ConstantType type, const std::string &expression) const;

private:
    std::vector<std::string> headers_;
    Language                 lang_;

    const char *linkage() const { return lang_ == Language::CXX ? "extern \"C\" " : ""; }
};

} // namespace cmacros
