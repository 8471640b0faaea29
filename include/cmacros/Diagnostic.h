#pragma once
#include <string>
#include <vector>
#include <mutex>
#include <cstdio>

namespace cmacros {

/// Where a diagnostic points. Discovery only ever reads one kind of input
/// (the compiler's macro dump), so a location is a pseudo-file name plus an
/// optional 1-based line; line 0 means "no particular line".
struct DiagLocation {
    const char *file = nullptr;
    unsigned    line = 0;
};

enum class DiagLevel { Note, Warning };

struct Diagnostic {
    DiagLevel    level;
    DiagLocation loc;
    std::string  message;
};

/// DiagEngine collects the non-fatal findings of a discovery run: dump lines
/// that could not be parsed, duplicate definitions, and (in verbose mode)
/// failed compiler resolutions. Fatal conditions are thrown as cmacros::Error
/// instead. Unless constructed quiet, each diagnostic is echoed to stderr:
///   <file>:<line>: <level>: <message>
///   <file>: <level>: <message>          (no line)
///   cmacros: <level>: <message>         (no file)
///
/// Resolutions may run on several threads, so recording is serialised.
class DiagEngine {
public:
    explicit DiagEngine(bool quiet = false) : quiet_(quiet) {}

    void note(DiagLocation l, std::string msg) { emit(DiagLevel::Note,    l, std::move(msg)); }
    void warn(DiagLocation l, std::string msg) { emit(DiagLevel::Warning, l, std::move(msg)); }

    int warningCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return warningCount_;
    }

    // Snapshot; safe to take while other threads are still emitting.
    std::vector<Diagnostic> diagnostics() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return diags_;
    }

private:
    void emit(DiagLevel level, DiagLocation loc, std::string msg) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!quiet_) {
            const char *prefix = level == DiagLevel::Note ? "note" : "warning";
            if (!loc.file)
                fprintf(stderr, "cmacros: %s: %s\n", prefix, msg.c_str());
            else if (loc.line == 0)
                fprintf(stderr, "%s: %s: %s\n", loc.file, prefix, msg.c_str());
            else
                fprintf(stderr, "%s:%u: %s: %s\n", loc.file, loc.line, prefix, msg.c_str());
        }
        if (level == DiagLevel::Warning)
            ++warningCount_;
        diags_.push_back({level, loc, std::move(msg)});
    }

    mutable std::mutex      mutex_;
    bool                    quiet_        = false;
    int                     warningCount_ = 0;
    std::vector<Diagnostic> diags_;
};

} // namespace cmacros
