#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace safexec::deps {

class ImportParseError : public std::runtime_error {
public:
    ImportParseError(const std::string& message, int line)
        : std::runtime_error(message + " (line " + std::to_string(line) + ")")
        , line_(line) {}

    int Line() const { return line_; }

private:
    int line_;
};

// Body of the first ```python fenced block, or the snippet unchanged.
std::string ExtractFencedCode(const std::string& snippet);

// Top-level module names of every import statement in `source`, at any
// nesting depth, in order of first appearance. Relative imports and
// __future__ are skipped. Throws ImportParseError on unterminated strings,
// unbalanced brackets or malformed import statements.
std::vector<std::string> ParseImports(const std::string& source);

// Line-oriented fallback for sources ParseImports rejects.
std::vector<std::string> ScanImportLines(const std::string& source);

}  // namespace safexec::deps
