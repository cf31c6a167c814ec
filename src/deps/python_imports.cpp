#include "deps/python_imports.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>

#include "utils/common.hpp"

namespace safexec::deps {
namespace {

struct LogicalLine {
    std::string text;
    int line = 1;
};

bool IsIdentifierChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool IsIdentifier(const std::string& name) {
    if (name.empty() || std::isdigit(static_cast<unsigned char>(name.front()))) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), IsIdentifierChar);
}

bool IsStringPrefixChar(char c) {
    switch (c) {
        case 'r': case 'R': case 'b': case 'B':
        case 'u': case 'U': case 'f': case 'F':
            return true;
        default:
            return false;
    }
}

// Detects a string literal (with optional r/b/u/f prefix) starting at `pos`
// and reports where its opening quote is.
bool IsStringStart(const std::string& source, std::size_t pos, std::size_t& quote_pos) {
    const char c = source[pos];
    if (c == '\'' || c == '"') {
        quote_pos = pos;
        return true;
    }
    if (!IsStringPrefixChar(c) || (pos > 0 && IsIdentifierChar(source[pos - 1]))) {
        return false;
    }
    std::size_t cursor = pos;
    while (cursor < source.size() && cursor - pos < 2 && IsStringPrefixChar(source[cursor])) {
        ++cursor;
    }
    if (cursor < source.size() && (source[cursor] == '\'' || source[cursor] == '"')) {
        quote_pos = cursor;
        return true;
    }
    return false;
}

// Joins physical lines into logical ones (brackets and backslashes continue a
// line), drops comments and replaces string literals with "".
std::vector<LogicalLine> SplitLogicalLines(const std::string& raw) {
    std::string source;
    source.reserve(raw.size());
    for (const char c : raw) {
        if (c != '\r') {
            source.push_back(c);
        }
    }

    std::vector<LogicalLine> lines;
    std::string current;
    int depth = 0;
    int line = 1;
    int start_line = 1;
    auto flush = [&]() {
        if (!utils::Trim(current).empty()) {
            lines.push_back(LogicalLine{current, start_line});
        }
        current.clear();
    };

    std::size_t i = 0;
    const std::size_t n = source.size();
    while (i < n) {
        const char c = source[i];
        if (c == '#') {
            while (i < n && source[i] != '\n') {
                ++i;
            }
            continue;
        }
        if (c == '\\' && i + 1 < n && source[i + 1] == '\n') {
            current.push_back(' ');
            ++line;
            i += 2;
            continue;
        }
        if (c == '\n') {
            ++line;
            if (depth == 0) {
                flush();
                start_line = line;
            } else {
                current.push_back(' ');
            }
            ++i;
            continue;
        }

        std::size_t quote_pos = i;
        if (IsStringStart(source, i, quote_pos)) {
            const char quote = source[quote_pos];
            const bool triple = quote_pos + 2 < n && source[quote_pos + 1] == quote &&
                                source[quote_pos + 2] == quote;
            const int opened_at = line;
            std::size_t j = quote_pos + (triple ? 3 : 1);
            bool closed = false;
            while (j < n) {
                const char d = source[j];
                if (d == '\\') {
                    if (j + 1 < n && source[j + 1] == '\n') {
                        ++line;
                    }
                    j += 2;
                    continue;
                }
                if (d == '\n') {
                    if (!triple) {
                        throw ImportParseError("unterminated string literal", opened_at);
                    }
                    ++line;
                    ++j;
                    continue;
                }
                if (triple) {
                    if (d == quote && j + 2 < n && source[j + 1] == quote && source[j + 2] == quote) {
                        j += 3;
                        closed = true;
                        break;
                    }
                } else if (d == quote) {
                    ++j;
                    closed = true;
                    break;
                }
                ++j;
            }
            if (!closed) {
                throw ImportParseError("unterminated string literal", opened_at);
            }
            current += "\"\"";
            i = j;
            continue;
        }

        if (c == '(' || c == '[' || c == '{') {
            ++depth;
        } else if (c == ')' || c == ']' || c == '}') {
            if (depth == 0) {
                throw ImportParseError("unmatched closing bracket", line);
            }
            --depth;
        }
        current.push_back(c);
        ++i;
    }
    if (depth != 0) {
        throw ImportParseError("unclosed bracket", start_line);
    }
    flush();
    return lines;
}

// Splits a logical line into simple statements at top-level ';' and ':'.
std::vector<std::string> SplitStatements(const std::string& text) {
    std::vector<std::string> statements;
    std::string current;
    int depth = 0;
    for (const char c : text) {
        if (c == '(' || c == '[' || c == '{') {
            ++depth;
        } else if (c == ')' || c == ']' || c == '}') {
            --depth;
        }
        if (depth == 0 && (c == ';' || c == ':')) {
            statements.push_back(utils::Trim(current));
            current.clear();
            continue;
        }
        current.push_back(c);
    }
    statements.push_back(utils::Trim(current));
    return statements;
}

bool StartsWithKeyword(const std::string& statement, const std::string& keyword) {
    if (!utils::StartsWith(statement, keyword)) {
        return false;
    }
    return statement.size() == keyword.size() ||
           std::isspace(static_cast<unsigned char>(statement[keyword.size()]));
}

// "a.b.c" -> "a"; throws when any component is not an identifier.
std::string TopLevelModule(const std::string& dotted, int line) {
    std::stringstream stream(dotted);
    std::string part;
    std::string first;
    while (std::getline(stream, part, '.')) {
        if (!IsIdentifier(part)) {
            throw ImportParseError("invalid module name '" + dotted + "'", line);
        }
        if (first.empty()) {
            first = part;
        }
    }
    if (first.empty()) {
        throw ImportParseError("empty module name", line);
    }
    return first;
}

void AddUnique(std::vector<std::string>& names, const std::string& name) {
    if (name == "__future__") {
        return;
    }
    if (std::find(names.begin(), names.end(), name) == names.end()) {
        names.push_back(name);
    }
}

void ParseImportStatement(const std::string& statement, int line, std::vector<std::string>& names) {
    const auto rest = utils::Trim(statement.substr(std::string("import").size()));
    if (rest.empty()) {
        throw ImportParseError("import statement without a module", line);
    }
    std::stringstream stream(rest);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = utils::Trim(item);
        if (item.empty()) {
            throw ImportParseError("trailing comma in import", line);
        }
        std::istringstream words(item);
        std::string dotted;
        std::string as_keyword;
        std::string alias;
        words >> dotted >> as_keyword >> alias;
        if (!as_keyword.empty() && (as_keyword != "as" || !IsIdentifier(alias))) {
            throw ImportParseError("malformed import alias", line);
        }
        AddUnique(names, TopLevelModule(dotted, line));
    }
}

void ParseFromStatement(const std::string& statement, int line, std::vector<std::string>& names) {
    std::istringstream words(statement.substr(std::string("from").size()));
    std::string module;
    std::string import_keyword;
    std::string imported;
    words >> module >> import_keyword;
    std::getline(words, imported);
    if (module.empty() || import_keyword != "import" || utils::Trim(imported).empty()) {
        throw ImportParseError("malformed from-import", line);
    }
    if (module.front() == '.') {
        return;
    }
    AddUnique(names, TopLevelModule(module, line));
}

}  // namespace

std::string ExtractFencedCode(const std::string& snippet) {
    static const std::string kFence = "```python";
    const auto start = snippet.find(kFence);
    if (start == std::string::npos) {
        return snippet;
    }
    const auto body_start = start + kFence.size();
    const auto end = snippet.find("```", body_start);
    if (end == std::string::npos) {
        return snippet.substr(body_start);
    }
    return snippet.substr(body_start, end - body_start);
}

std::vector<std::string> ParseImports(const std::string& source) {
    std::vector<std::string> names;
    for (const auto& logical : SplitLogicalLines(source)) {
        for (const auto& statement : SplitStatements(logical.text)) {
            if (StartsWithKeyword(statement, "import")) {
                ParseImportStatement(statement, logical.line, names);
            } else if (StartsWithKeyword(statement, "from")) {
                ParseFromStatement(statement, logical.line, names);
            }
        }
    }
    return names;
}

std::vector<std::string> ScanImportLines(const std::string& source) {
    static const std::regex kImportLine(R"(^\s*(?:from|import)\s+([a-zA-Z_][a-zA-Z0-9_]*))");
    std::vector<std::string> names;
    std::istringstream stream(source);
    std::string line;
    while (std::getline(stream, line)) {
        std::smatch match;
        if (std::regex_search(line, match, kImportLine)) {
            AddUnique(names, match[1].str());
        }
    }
    return names;
}

}  // namespace safexec::deps
