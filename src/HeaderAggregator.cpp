#include "cmacros/HeaderAggregator.h"
#include "cmacros/Error.h"

#include "llvm/Support/FileSystem.h"
#include "llvm/Support/raw_ostream.h"

namespace cmacros {

std::string renderIncludes(const std::vector<std::string> &headers) {
    std::string out;
    for (auto &h : headers) {
        out += "#include <";
        out += h;
        out += ">\n";
    }
    return out;
}

AggregatedSource::AggregatedSource(const std::vector<std::string> &headers,
                                   llvm::StringRef suffix) {
    int fd;
    if (std::error_code ec =
            llvm::sys::fs::createTemporaryFile("c-macros", suffix, fd, path_))
        throw Error("cannot create temporary source: " + ec.message());
    remover_.setFile(path_);

    llvm::raw_fd_ostream os(fd, /*shouldClose=*/true);
    os << renderIncludes(headers);
    os.close();
    if (os.has_error()) {
        std::string msg = "cannot write " + path_.str().str() + ": " +
                          os.error().message();
        os.clear_error();
        throw Error(msg);
    }
}

} // namespace cmacros
