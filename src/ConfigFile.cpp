#include "cmacros/ConfigFile.h"
#include "cmacros/Error.h"

#include <fstream>
#include <sstream>

namespace cmacros {

// ── helpers ───────────────────────────────────────────────────────────────────

static std::string trim(const std::string &s) {
    size_t l = s.find_first_not_of(" \t\r\n");
    if (l == std::string::npos) return "";
    size_t r = s.find_last_not_of(" \t\r\n");
    return s.substr(l, r - l + 1);
}

static std::string stripComment(const std::string &line) {
    // Remove everything after an unquoted '#'
    bool inQ = false;
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '"') inQ = !inQ;
        if (!inQ && line[i] == '#') return line.substr(0, i);
    }
    return line;
}

static bool isQuoted(const std::string &s) {
    return s.size() >= 2 && s.front() == '"' && s.back() == '"';
}

static std::string unquote(const std::string &s) {
    if (isQuoted(s)) return s.substr(1, s.size() - 2);
    return s;
}

static std::string where(const std::string &srcName, int line) {
    return srcName + ":" + std::to_string(line) + ": ";
}

// Split the inside of [ ... ] on commas outside quotes.
static std::vector<std::string> parseList(const std::string &body,
                                          const std::string &srcName,
                                          int lineno) {
    std::vector<std::string> items;
    std::string cur;
    bool inQ = false;
    auto flush = [&]() {
        std::string item = trim(cur);
        cur.clear();
        if (item.empty()) return;
        if (!isQuoted(item))
            throw ConfigurationError(where(srcName, lineno) +
                                     "list elements must be quoted strings: " + item);
        items.push_back(unquote(item));
    };
    for (char c : body) {
        if (c == '"') inQ = !inQ;
        if (c == ',' && !inQ) { flush(); continue; }
        cur += c;
    }
    if (inQ)
        throw ConfigurationError(where(srcName, lineno) + "unterminated string");
    flush();
    return items;
}

// ── tokenize ─────────────────────────────────────────────────────────────────

std::vector<ConfigFileParser::Token> ConfigFileParser::tokenize(
        const std::string &src, const std::string &srcName) {
    std::vector<Token> tokens;
    std::istringstream ss(src);
    std::string line;
    std::string section;
    int lineno = 0;

    while (std::getline(ss, line)) {
        ++lineno;
        line = trim(stripComment(line));
        if (line.empty()) continue;

        if (line.front() == '[') {
            size_t close = line.find(']');
            if (close == std::string::npos)
                throw ConfigurationError(where(srcName, lineno) +
                                         "unterminated section header");
            section = trim(line.substr(1, close - 1));
            if (section != "discovery")
                throw ConfigurationError(where(srcName, lineno) +
                                         "unknown section [" + section + "]");
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos)
            throw ConfigurationError(where(srcName, lineno) +
                                     "expected key = value, got: " + line);
        if (section.empty())
            throw ConfigurationError(where(srcName, lineno) +
                                     "key outside of [discovery] section");

        Token tok;
        tok.key  = section + "." + trim(line.substr(0, eq));
        tok.line = lineno;
        std::string value = trim(line.substr(eq + 1));
        if (!value.empty() && value.front() == '[') {
            if (value.back() != ']')
                throw ConfigurationError(where(srcName, lineno) +
                                         "unterminated list for " + tok.key);
            tok.isList = true;
            tok.list   = parseList(value.substr(1, value.size() - 2), srcName, lineno);
        } else {
            tok.scalar = unquote(value);
        }
        tokens.push_back(std::move(tok));
    }
    return tokens;
}

// ── apply ────────────────────────────────────────────────────────────────────

void ConfigFileParser::apply(const std::vector<Token> &tokens,
                             DiscoveryConfig &into,
                             const std::string &srcName) {
    auto needList = [&](const Token &tok) -> const std::vector<std::string> & {
        if (!tok.isList)
            throw ConfigurationError(where(srcName, tok.line) + tok.key +
                                     " should be a list of strings");
        return tok.list;
    };
    auto needScalar = [&](const Token &tok) -> const std::string & {
        if (tok.isList)
            throw ConfigurationError(where(srcName, tok.line) + tok.key +
                                     " should be a string, not a list");
        return tok.scalar;
    };

    for (auto &tok : tokens) {
        if      (tok.key == "discovery.headers")      into.headers     = needList(tok);
        else if (tok.key == "discovery.cc")           into.cc          = needList(tok);
        else if (tok.key == "discovery.cflags")       into.cflags      = needList(tok);
        else if (tok.key == "discovery.extra_cflags") into.extraCflags = needList(tok);
        else if (tok.key == "discovery.ppflags")      into.ppflags     = needList(tok);
        else if (tok.key == "discovery.lang")         into.lang   = parseLanguage(needScalar(tok));
        else if (tok.key == "discovery.filter")       into.filter = regexNameFilter(needScalar(tok));
        else if (tok.key == "discovery.verbose") {
            const std::string &v = needScalar(tok);
            if (v != "true" && v != "false")
                throw ConfigurationError(where(srcName, tok.line) +
                                         "verbose should be true or false");
            into.verbose = v == "true";
        } else {
            throw ConfigurationError(where(srcName, tok.line) +
                                     "unknown key " + tok.key);
        }
    }
}

// ── public API ────────────────────────────────────────────────────────────────

void ConfigFileParser::parseFile(const std::string &path, DiscoveryConfig &into) {
    std::ifstream f(path);
    if (!f) throw ConfigurationError("cannot open " + path);
    std::string src((std::istreambuf_iterator<char>(f)),
                     std::istreambuf_iterator<char>());
    parseString(src, into, path);
}

void ConfigFileParser::parseString(const std::string &src, DiscoveryConfig &into,
                                   const std::string &srcName) {
    auto tokens = tokenize(src, srcName);
    apply(tokens, into, srcName);
}

} // namespace cmacros
