#include "cmacros/MacroEnumerator.h"
#include "cmacros/Error.h"
#include "cmacros/HeaderAggregator.h"

#include "llvm/ADT/SmallVector.h"

namespace cmacros {

MacroEnumerator::MacroEnumerator(const DiscoveryConfig &config,
                                 ToolRunner &runner, DiagEngine &diag)
    : config_(config), runner_(runner), diag_(diag) {}

std::vector<std::string>
MacroEnumerator::commandLine(const std::string &sourcePath) const {
    std::vector<std::string> cmd(config_.cc.begin(), config_.cc.end());
    for (auto &f : config_.effectivePpflags()) cmd.push_back(f);
    for (auto &f : config_.cflags)             cmd.push_back(f);
    for (auto &f : config_.extraCflags)        cmd.push_back(f);
    cmd.push_back(sourcePath);
    return cmd;
}

std::vector<RawMacro> MacroEnumerator::enumerate() {
    AggregatedSource source(config_.headers, config_.sourceSuffix());
    std::vector<std::string> cmd = commandLine(source.path());

    ToolResult res = runner_.run(cmd);
    if (!res.ok())
        throw ToolInvocationError(std::move(cmd), std::move(res.err),
                                  res.exitStatus, res.signaled);

    return parseMacroDump(res.out, config_.filter, diag_);
}

// ── -dM output parsing ───────────────────────────────────────────────────────

static bool isSpace(char c) { return c == ' ' || c == '\t'; }

std::vector<RawMacro> MacroEnumerator::parseMacroDump(llvm::StringRef output,
                                                      const NameFilter &filter,
                                                      DiagEngine &diag) {
    std::vector<RawMacro> macros;

    llvm::SmallVector<llvm::StringRef, 256> lines;
    output.split(lines, '\n');

    unsigned lineno = 0;
    for (llvm::StringRef line : lines) {
        ++lineno;
        line = line.rtrim("\r");
        if (line.trim().empty()) continue;

        // #define <name>[ <text>]
        llvm::StringRef rest = line;
        if (!rest.consume_front("#define") || rest.empty() || !isSpace(rest.front())) {
            diag.warn({kDumpFile, lineno},
                      "unable to parse line: " + line.str());
            continue;
        }
        rest = rest.ltrim(" \t");
        size_t end = 0;
        while (end < rest.size() && !isSpace(rest[end])) ++end;
        llvm::StringRef name  = rest.take_front(end);
        llvm::StringRef value = rest.drop_front(end).trim(" \t");
        if (name.empty()) {
            diag.warn({kDumpFile, lineno},
                      "unable to parse line: " + line.str());
            continue;
        }

        // Function-like macros never denote a single value.
        if (name.find_first_of("()") != llvm::StringRef::npos) continue;
        if (!filter(name)) continue;

        macros.push_back({name.str(), value.str(), lineno});
    }
    return macros;
}

} // namespace cmacros
