#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace cmacros {

/// Base of every fatal error raised by the discovery pipeline.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string &msg) : std::runtime_error(msg) {}
};

/// The preprocessor (or another required tool) exited non-zero or was killed
/// by a signal.  Fatal to the discovery run.
class ToolInvocationError : public Error {
public:
    ToolInvocationError(std::vector<std::string> argv, std::string stderrText,
                        int exitStatus, bool signaled);

    const std::vector<std::string> &argv()      const { return argv_; }
    const std::string              &stderrText() const { return stderr_; }
    int                             exitStatus() const { return exitStatus_; }
    bool                            signaled()   const { return signaled_; }

    /// The argv joined with single spaces, as it would be typed in a shell.
    std::string commandLine() const;

private:
    std::vector<std::string> argv_;
    std::string              stderr_;
    int                      exitStatus_;
    bool                     signaled_;
};

/// Invalid configuration: unknown language, unknown type tag, a scalar where
/// a list is required, a malformed config file.
class ConfigurationError : public Error {
public:
    explicit ConfigurationError(const std::string &msg) : Error(msg) {}
};

/// Join an argv vector with spaces.
std::string joinCommandLine(const std::vector<std::string> &argv);

} // namespace cmacros
