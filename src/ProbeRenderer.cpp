#include "cmacros/ProbeRenderer.h"
#include "cmacros/HeaderAggregator.h"

#include <sstream>

namespace cmacros {

ProbeRenderer::ProbeRenderer(std::vector<std::string> headers, Language lang)
    : headers_(std::move(headers)), lang_(lang) {}

std::string ProbeRenderer::typeProbe(const std::string &expression) const {
    std::ostringstream out;
    out << renderIncludes(headers_);

    if (lang_ == Language::C) {
        out << "const char *\n"
            << kTypeSymbol << "(void)\n"
            << "{\n"
            << "  return _Generic(\n"
            << "    (" << expression << "),\n"
            << "    float    : \"float\",\n"
            << "    double   : \"double\",\n"
            << "    char *   : \"string\",\n"
            << "    void *   : \"pointer\",\n"
            << "    int      : \"int\",\n"
            << "    long     : \"long\"\n"
            << "  );\n"
            << "}\n";
        return out.str();
    }

    // C++ has no _Generic.  An unspecialised trait has no name(), so an
    // unsupported type fails to compile just like a missing association.
    // String literals decay to const char * here.
    out << "#include <type_traits>\n"
        << "template <typename T> struct cmacros_type_tag {};\n";
    static const char *const tags[][2] = {
        { "float",        "float"   },
        { "double",       "double"  },
        { "char *",       "string"  },
        { "const char *", "string"  },
        { "void *",       "pointer" },
        { "int",          "int"     },
        { "long",         "long"    },
    };
    for (auto &t : tags)
        out << "template <> struct cmacros_type_tag<" << t[0] << "> "
            << "{ static const char *name() { return \"" << t[1] << "\"; } };\n";
    out << linkage() << "const char *\n"
        << kTypeSymbol << "(void)\n"
        << "{\n"
        << "  return cmacros_type_tag<std::decay<decltype((" << expression
        << "))>::type>::name();\n"
        << "}\n";
    return out.str();
}

std::string ProbeRenderer::valueProbe(ConstantType type,
                                      const std::string &expression) const {
    std::ostringstream out;
    out << renderIncludes(headers_);
    out << linkage() << cTypeFor(type) << "\n"
        << kValueSymbol << "(void)\n"
        << "{\n"
        << "  return (" << expression << ");\n"
        << "}\n";
    return out.str();
}

} // namespace cmacros
