#include "cmacros/Config.h"
#include "cmacros/ConfigFile.h"
#include "cmacros/Constant.h"
#include "cmacros/Diagnostic.h"
#include "cmacros/Error.h"
#include "cmacros/MacroDiscovery.h"
#include "cmacros/Output.h"

#include "llvm/Support/CommandLine.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/raw_ostream.h"

#include <string>
#include <vector>

// ── CLI options ───────────────────────────────────────────────────────────────
static llvm::cl::list<std::string>
    Headers(llvm::cl::Positional, llvm::cl::desc("<header.h>..."),
            llvm::cl::ZeroOrMore);

static llvm::cl::opt<std::string>
    ConfigPath("config", llvm::cl::desc("Read settings from a cmacros.toml file"),
               llvm::cl::value_desc("file"));

static llvm::cl::opt<std::string>
    Lang("x", llvm::cl::desc("Language of the headers: c (default) or c++"),
         llvm::cl::value_desc("lang"));

static llvm::cl::opt<std::string>
    CC("cc", llvm::cl::desc("C compiler and base arguments (default: $CC, cc, gcc, clang)"),
       llvm::cl::value_desc("command"));

static llvm::cl::opt<std::string>
    CFlags("cflags", llvm::cl::desc("Compiler flags (default: $CFLAGS)"),
           llvm::cl::value_desc("flags"));

static llvm::cl::list<std::string>
    IncludePaths("I", llvm::cl::desc("Add include search directory"),
                 llvm::cl::value_desc("dir"), llvm::cl::Prefix);

static llvm::cl::list<std::string>
    CmdlineDefs("D", llvm::cl::desc("Define preprocessor macro"),
                llvm::cl::value_desc("NAME[=VALUE]"), llvm::cl::Prefix);

static llvm::cl::list<std::string>
    ExtraCFlags("extra-cflag", llvm::cl::desc("Extra compiler flag (repeatable)"),
                llvm::cl::value_desc("flag"));

static llvm::cl::opt<std::string>
    Filter("filter", llvm::cl::desc("Regular expression macro names must match "
                                    "(default: names not starting with '_')"),
           llvm::cl::value_desc("regex"));

static llvm::cl::opt<bool>
    Resolve("resolve", llvm::cl::desc("Resolve the type and value of every macro"));

using cmacros::OutputFormat;
static llvm::cl::opt<OutputFormat>
    Format("format", llvm::cl::desc("Output format"),
           llvm::cl::values(clEnumValN(OutputFormat::Text, "text", "name, type, value per line"),
                            clEnumValN(OutputFormat::Json, "json", "JSON array")),
           llvm::cl::init(OutputFormat::Text));

static llvm::cl::opt<std::string>
    Eval("eval", llvm::cl::desc("Resolve a single C expression instead of discovering macros"),
         llvm::cl::value_desc("expr"));

static llvm::cl::opt<std::string>
    EvalType("type", llvm::cl::desc("Type of the --eval expression (skip type probing)"),
             llvm::cl::value_desc("int|long|float|double|string|pointer"));

static llvm::cl::opt<bool>
    Verbose("v", llvm::cl::desc("Verbose output"));

// ── Configuration ─────────────────────────────────────────────────────────────
static cmacros::DiscoveryConfig buildConfig() {
    cmacros::DiscoveryConfig cfg = cmacros::DiscoveryConfig::defaults();
    if (!ConfigPath.empty())
        cmacros::ConfigFileParser::parseFile(ConfigPath, cfg);

    // Command-line settings override the file.
    if (!Headers.empty())
        cfg.headers.assign(Headers.begin(), Headers.end());
    if (Lang.getNumOccurrences())
        cfg.lang = cmacros::parseLanguage(Lang);
    if (CC.getNumOccurrences())
        cfg.cc = cmacros::splitShellWords(CC);
    if (CFlags.getNumOccurrences())
        cfg.cflags = cmacros::splitShellWords(CFlags);
    for (auto &dir : IncludePaths) cfg.extraCflags.push_back("-I" + dir);
    for (auto &def : CmdlineDefs)  cfg.extraCflags.push_back("-D" + def);
    for (auto &f : ExtraCFlags)    cfg.extraCflags.push_back(f);
    if (Filter.getNumOccurrences())
        cfg.filter = cmacros::regexNameFilter(Filter);
    if (Verbose) cfg.verbose = true;
    return cfg;
}

// ── Main ──────────────────────────────────────────────────────────────────────
int main(int argc, char **argv) {
    llvm::InitLLVM X(argc, argv);
    llvm::cl::ParseCommandLineOptions(
        argc, argv, "cmacros - discover macro constants in C/C++ headers\n");

    cmacros::DiagEngine diag;

    try {
        cmacros::MacroDiscovery discovery(buildConfig(), diag);

        if (Eval.getNumOccurrences()) {
            std::optional<cmacros::ConstantType> asserted;
            if (EvalType.getNumOccurrences())
                asserted = cmacros::parseConstantType(EvalType);
            cmacros::ConstantSet set;
            set.add(cmacros::Constant::fromExpression(Eval, &discovery.resolver(),
                                                      asserted));
            cmacros::printConstants(llvm::outs(), set, Format, /*resolve=*/true);
            return 0;
        }

        if (discovery.config().headers.empty()) {
            llvm::errs() << "cmacros: no headers given\n";
            return 1;
        }

        if (Verbose) llvm::errs() << "[cmacros] Preprocessing headers ...\n";
        cmacros::ConstantSet set = discovery.run();
        if (Verbose)
            llvm::errs() << "[cmacros] " << set.size() << " macro(s) found\n";

        cmacros::printConstants(llvm::outs(), set, Format, Resolve);
    } catch (const cmacros::ToolInvocationError &e) {
        llvm::errs() << e.stderrText();
        llvm::errs() << "cmacros error: " << e.what() << "\n";
        return 1;
    } catch (const cmacros::Error &e) {
        llvm::errs() << "cmacros error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
