#pragma once
#include <string>
#include <vector>

namespace cmacros {

/// Outcome of one external command.
struct ToolResult {
    int         exitStatus = 0;     // exit code, or the signal number if signaled
    bool        signaled   = false; // terminated by a signal
    std::string out;                // captured standard output
    std::string err;                // captured standard error

    bool ok() const { return !signaled && exitStatus == 0; }
};

/// Runs a command line and captures its output.  The preprocessor run and the
/// probe builds all go through this seam so tests can substitute canned
/// results.
class ToolRunner {
public:
    virtual ~ToolRunner() = default;

    // argv[0] is looked up on PATH.  Never throws for a failing command;
    // failure to spawn is reported as exit status 127.
    virtual ToolResult run(const std::vector<std::string> &argv) = 0;
};

/// fork + exec + wait, with stdout and stderr redirected to temporary files
/// that are read back and deleted once the child has exited.
class ProcessToolRunner : public ToolRunner {
public:
    explicit ProcessToolRunner(bool verbose = false) : verbose_(verbose) {}

    ToolResult run(const std::vector<std::string> &argv) override;

private:
    bool verbose_;
};

} // namespace cmacros
