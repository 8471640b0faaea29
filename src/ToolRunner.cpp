#include "cmacros/ToolRunner.h"
#include "cmacros/Error.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/FileUtilities.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/raw_ostream.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <sys/wait.h>
#include <unistd.h>

namespace cmacros {

static std::string slurp(llvm::StringRef path) {
    auto buf = llvm::MemoryBuffer::getFile(path);
    if (!buf) return {};
    return (*buf)->getBuffer().str();
}

ToolResult ProcessToolRunner::run(const std::vector<std::string> &argv) {
    ToolResult r;
    if (argv.empty()) {
        r.exitStatus = 127;
        r.err = "empty command line";
        return r;
    }
    if (verbose_)
        llvm::errs() << "[cmacros] " << joinCommandLine(argv) << "\n";

    // Output is captured through files rather than pipes so a chatty child
    // can never block on a full pipe while we wait for it.
    llvm::SmallString<128> outPath, errPath;
    int outFd = -1, errFd = -1;
    if (std::error_code ec =
            llvm::sys::fs::createTemporaryFile("cmacros-out", "txt", outFd, outPath)) {
        r.exitStatus = 127;
        r.err = "cannot create temporary file: " + ec.message();
        return r;
    }
    llvm::FileRemover outRemover(outPath);
    if (std::error_code ec =
            llvm::sys::fs::createTemporaryFile("cmacros-err", "txt", errFd, errPath)) {
        ::close(outFd);
        r.exitStatus = 127;
        r.err = "cannot create temporary file: " + ec.message();
        return r;
    }
    llvm::FileRemover errRemover(errPath);

    pid_t pid = fork();
    if (pid < 0) {
        int e = errno;
        ::close(outFd);
        ::close(errFd);
        r.exitStatus = 127;
        r.err = std::string("fork failed: ") + strerror(e);
        return r;
    }
    if (pid == 0) {
        dup2(outFd, STDOUT_FILENO);
        dup2(errFd, STDERR_FILENO);
        ::close(outFd);
        ::close(errFd);
        std::vector<char *> args;
        for (auto &s : argv) args.push_back(const_cast<char *>(s.c_str()));
        args.push_back(nullptr);
        execvp(args[0], args.data());
        fprintf(stderr, "cmacros: exec '%s' failed: %s\n",
                argv[0].c_str(), strerror(errno));
        _exit(127);
    }
    ::close(outFd);
    ::close(errFd);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            r.exitStatus = 127;
            r.err = std::string("waitpid failed: ") + strerror(errno);
            return r;
        }
    }
    if (WIFSIGNALED(status)) {
        r.signaled   = true;
        r.exitStatus = WTERMSIG(status);
    } else {
        r.exitStatus = WIFEXITED(status) ? WEXITSTATUS(status) : 127;
    }

    r.out = slurp(outPath);
    r.err = slurp(errPath);
    return r;
}

} // namespace cmacros
