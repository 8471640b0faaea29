#pragma once
#include "cmacros/Config.h"
#include <string>
#include <vector>

namespace cmacros {

/// Reader for cmacros.toml, a TOML-like file with a single [discovery]
/// section:
///
///   [discovery]
///   headers      = ["stdio.h", "errno.h"]
///   lang         = "c"
///   cc           = ["gcc"]
///   cflags       = ["-O0"]
///   extra_cflags = ["-I/opt/foo/include"]
///   filter       = "^E"
///   verbose      = false
///
/// Keys present in the file replace the corresponding field of the config
/// passed in; absent keys leave it untouched.
class ConfigFileParser {
public:
    // Throws ConfigurationError on malformed input or an unreadable file.
    static void parseFile(const std::string &path, DiscoveryConfig &into);

    // Parse from a string (for testing).
    static void parseString(const std::string &src, DiscoveryConfig &into,
                            const std::string &sourceName = "<string>");

private:
    struct Token {
        std::string key;                 // section.key
        std::string scalar;
        std::vector<std::string> list;
        bool        isList = false;
        int         line   = 0;
    };
    static std::vector<Token> tokenize(const std::string &src,
                                       const std::string &srcName);
    static void apply(const std::vector<Token> &tokens, DiscoveryConfig &into,
                      const std::string &srcName);
};

} // namespace cmacros
