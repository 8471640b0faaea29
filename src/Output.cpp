#include "cmacros/Output.h"

#include "llvm/Support/JSON.h"

namespace cmacros {

// ── JSON ─────────────────────────────────────────────────────────────────────

// Classified text is digits '.' digits.  JSON forbids leading zeros in the
// integer part, so "007.5" is written as "7.5"; the digits that matter stay.
static llvm::StringRef jsonDecimal(llvm::StringRef text) {
    while (text.size() > 1 && text[0] == '0' && text[1] != '.')
        text = text.drop_front();
    return text;
}

static void writeValue(llvm::json::OStream &J, const std::optional<Value> &v) {
    if (!v) {
        J.value(nullptr);
        return;
    }
    switch (v->type) {
    case ConstantType::Int:
    case ConstantType::Long:
        J.value(v->intVal);
        return;
    case ConstantType::Float:
    case ConstantType::Double:
        if (v->hasDecimalText()) J.rawValue(jsonDecimal(v->strVal));
        else                     J.value(v->floatVal);
        return;
    case ConstantType::String:
    case ConstantType::Pointer:
        J.value(v->repr());
        return;
    case ConstantType::Other:
        break;
    }
    J.value(nullptr);
}

void printJson(llvm::raw_ostream &os, const ConstantSet &set, bool resolve) {
    llvm::json::OStream J(os, 2);
    J.array([&] {
        for (auto &c : set) {
            J.object([&] {
                J.attribute("name", c->name());
                if (c->rawValue()) J.attribute("raw_value", *c->rawValue());
                else               J.attribute("raw_value", nullptr);
                if (resolve || c->typeComputed())
                    J.attribute("type", typeName(c->type()));
                else
                    J.attribute("type", nullptr);

                J.attributeBegin("value");
                if (resolve || c->valueComputed()) writeValue(J, c->value());
                else                               J.value(nullptr);
                J.attributeEnd();
            });
        }
    });
    os << "\n";
}

// ── text ─────────────────────────────────────────────────────────────────────

void printText(llvm::raw_ostream &os, const ConstantSet &set, bool resolve) {
    for (auto &c : set) {
        os << c->name() << "\t";
        if (resolve || c->typeComputed()) {
            os << typeName(c->type()) << "\t";
            auto v = c->value();
            os << (v ? v->repr() : "");
        } else {
            os << "?\t" << c->rawValue().value_or("");
        }
        os << "\n";
    }
}

} // namespace cmacros
