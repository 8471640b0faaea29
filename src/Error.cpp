#include "cmacros/Error.h"

namespace cmacros {

std::string joinCommandLine(const std::vector<std::string> &argv) {
    std::string out;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i) out += ' ';
        out += argv[i];
    }
    return out;
}

static std::string describeFailure(const std::vector<std::string> &argv,
                                   int exitStatus, bool signaled) {
    std::string msg = "command: " + joinCommandLine(argv) + " failed";
    if (signaled)
        msg += " (killed by signal " + std::to_string(exitStatus) + ")";
    else
        msg += " (exit status " + std::to_string(exitStatus) + ")";
    return msg;
}

ToolInvocationError::ToolInvocationError(std::vector<std::string> argv,
                                         std::string stderrText,
                                         int exitStatus, bool signaled)
    : Error(describeFailure(argv, exitStatus, signaled))
    , argv_(std::move(argv))
    , stderr_(std::move(stderrText))
    , exitStatus_(exitStatus)
    , signaled_(signaled) {}

std::string ToolInvocationError::commandLine() const {
    return joinCommandLine(argv_);
}

} // namespace cmacros
