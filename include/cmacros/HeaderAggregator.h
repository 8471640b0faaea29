#pragma once
#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileUtilities.h"
#include <string>
#include <vector>

namespace cmacros {

/// One "#include <h>" line per header, in order, each newline-terminated.
std::string renderIncludes(const std::vector<std::string> &headers);

/// A temporary translation unit exposing the combined macro namespace of the
/// configured headers.  The file exists for the lifetime of the object and is
/// removed by its destructor.
class AggregatedSource {
public:
    // suffix is "c" or "cxx".  Throws cmacros::Error if the file cannot be
    // created or written.
    AggregatedSource(const std::vector<std::string> &headers, llvm::StringRef suffix);

    AggregatedSource(const AggregatedSource &) = delete;
    AggregatedSource &operator=(const AggregatedSource &) = delete;

    std::string path() const { return path_.str().str(); }

private:
    llvm::SmallString<128> path_;
    llvm::FileRemover      remover_;
};

} // namespace cmacros
