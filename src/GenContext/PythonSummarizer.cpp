// =================================================================
// src/GenContext/PythonSummarizer.cpp
// =================================================================
// Implementation for the Python declaration digest.

#include "GenContext/PythonSummarizer.hpp"
#include <tree_sitter/api.h>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstring>
#include <memory>
#include <sstream>
#include <vector>

extern "C" const TSLanguage* tree_sitter_python(void);

namespace GenContext {

namespace {

const char* const kIndentUnit = "    ";
const char* const kDocQuote = "\"\"\"";

using ParserPtr = std::unique_ptr<TSParser, decltype(&ts_parser_delete)>;
using TreePtr = std::unique_ptr<TSTree, decltype(&ts_tree_delete)>;

std::string indent(size_t depth) {
    std::string result;
    for (size_t i = 0; i < depth; ++i) {
        result += kIndentUnit;
    }
    return result;
}

bool isType(TSNode node, const char* type) {
    return std::strcmp(ts_node_type(node), type) == 0;
}

TSNode field(TSNode node, const char* name) {
    return ts_node_child_by_field_name(node, name, static_cast<uint32_t>(std::strlen(name)));
}

// Collapses whitespace runs (and backslash continuations) into single spaces
std::string normalizeWhitespace(const std::string& text) {
    std::string result;
    bool pending_space = false;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\\' && i + 1 < text.size() && (text[i + 1] == '\n' || text[i + 1] == '\r')) {
            pending_space = true;
            continue;
        }
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = true;
            continue;
        }
        if (pending_space && !result.empty()) {
            result += ' ';
        }
        pending_space = false;
        result += c;
    }
    return result;
}

// First ERROR or MISSING node in document order
TSNode findErrorNode(TSNode node) {
    if (isType(node, "ERROR") || ts_node_is_missing(node)) {
        return node;
    }
    if (!ts_node_has_error(node)) {
        return TSNode{};
    }
    uint32_t count = ts_node_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode found = findErrorNode(ts_node_child(node, i));
        if (!ts_node_is_null(found)) {
            return found;
        }
    }
    return TSNode{};
}

void appendUtf8(std::string& out, unsigned long code_point) {
    if (code_point < 0x80) {
        out += static_cast<char>(code_point);
    } else if (code_point < 0x800) {
        out += static_cast<char>(0xC0 | (code_point >> 6));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    } else if (code_point < 0x10000) {
        out += static_cast<char>(0xE0 | (code_point >> 12));
        out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (code_point >> 18));
        out += static_cast<char>(0x80 | ((code_point >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    }
}

bool isHexDigits(const std::string& text, size_t pos, size_t count) {
    if (pos + count > text.size()) {
        return false;
    }
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isxdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
    }
    return true;
}

std::string decodeEscapes(const std::string& body) {
    std::string out;
    for (size_t i = 0; i < body.size(); ++i) {
        char c = body[i];
        if (c != '\\' || i + 1 >= body.size()) {
            out += c;
            continue;
        }

        char next = body[++i];
        switch (next) {
            case '\n': break;   // line continuation
            case '\\': out += '\\'; break;
            case '\'': out += '\''; break;
            case '"': out += '"'; break;
            case 'a': out += '\a'; break;
            case 'b': out += '\b'; break;
            case 'f': out += '\f'; break;
            case 'n': out += '\n'; break;
            case 'r': out += '\r'; break;
            case 't': out += '\t'; break;
            case 'v': out += '\v'; break;
            case 'x':
                if (isHexDigits(body, i + 1, 2)) {
                    appendUtf8(out, std::stoul(body.substr(i + 1, 2), nullptr, 16));
                    i += 2;
                } else {
                    out += "\\x";
                }
                break;
            case 'u':
            case 'U': {
                size_t digits = (next == 'u') ? 4 : 8;
                if (isHexDigits(body, i + 1, digits)) {
                    unsigned long code_point = std::stoul(body.substr(i + 1, digits), nullptr, 16);
                    if (code_point <= 0x10FFFF) {
                        appendUtf8(out, code_point);
                        i += digits;
                        break;
                    }
                }
                out += '\\';
                out += next;
                break;
            }
            default:
                if (next >= '0' && next <= '7') {
                    size_t end = i;
                    while (end < body.size() && end < i + 3 && body[end] >= '0' && body[end] <= '7') {
                        ++end;
                    }
                    appendUtf8(out, std::stoul(body.substr(i, end - i), nullptr, 8));
                    i = end - 1;
                } else {
                    // Unknown escapes (including \N{...}) are kept as written
                    out += '\\';
                    out += next;
                }
                break;
        }
    }
    return out;
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::string line;
    std::istringstream stream(text);
    while (std::getline(stream, line)) {
        lines.push_back(line);
    }
    if (!text.empty() && text.back() == '\n') {
        lines.push_back("");
    }
    if (text.empty()) {
        lines.push_back("");
    }
    return lines;
}

bool isBlank(const std::string& line) {
    return line.find_first_not_of(" \t\r\f\v") == std::string::npos;
}

/**
 * Walks a parsed module and writes the digest lines.
 */
class DigestWriter {
public:
    DigestWriter(const std::string& source, const SignatureOptions& options)
        : m_source(source), m_options(options) {}

    void writeBlock(TSNode block, size_t depth, bool in_class) {
        uint32_t count = ts_node_named_child_count(block);
        for (uint32_t i = 0; i < count; ++i) {
            writeStatement(ts_node_named_child(block, i), depth, in_class);
        }
    }

    std::string result() const {
        std::string joined;
        for (size_t i = 0; i < m_lines.size(); ++i) {
            if (i > 0) joined += '\n';
            joined += m_lines[i];
        }
        return joined;
    }

private:
    const std::string& m_source;
    const SignatureOptions& m_options;
    std::vector<std::string> m_lines;

    std::string text(TSNode node) const {
        uint32_t start = ts_node_start_byte(node);
        uint32_t end = ts_node_end_byte(node);
        return m_source.substr(start, end - start);
    }

    void writeStatement(TSNode statement, size_t depth, bool in_class) {
        if (isType(statement, "function_definition")) {
            writeFunction(statement, depth);
        } else if (isType(statement, "class_definition")) {
            writeClass(statement, depth);
        } else if (isType(statement, "decorated_definition")) {
            TSNode definition = field(statement, "definition");
            if (!ts_node_is_null(definition)) {
                writeStatement(definition, depth, in_class);
            }
        } else if (isType(statement, "expression_statement")) {
            if (in_class) {
                writeField(statement, depth);
            }
        } else {
            // Control flow: declarations inside keep the enclosing depth
            writeNestedBlocks(statement, depth, in_class);
        }
    }

    void writeNestedBlocks(TSNode node, size_t depth, bool in_class) {
        uint32_t count = ts_node_named_child_count(node);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode child = ts_node_named_child(node, i);
            std::string type = ts_node_type(child);
            if (type == "block") {
                writeBlock(child, depth, in_class);
            } else if (type.size() > 7 && type.compare(type.size() - 7, 7, "_clause") == 0) {
                writeNestedBlocks(child, depth, in_class);
            }
        }
    }

    void writeFunction(TSNode function, size_t depth) {
        bool is_async = ts_node_child_count(function) > 0 && isType(ts_node_child(function, 0), "async");

        std::string line = indent(depth) + (is_async ? "async def " : "def ");
        line += text(field(function, "name"));
        line += "(";
        std::vector<std::string> params = parameterNames(field(function, "parameters"));
        for (size_t i = 0; i < params.size(); ++i) {
            if (i > 0) line += ", ";
            line += params[i];
        }
        line += "):";
        m_lines.push_back(line);

        writeBody(field(function, "body"), depth, false);
    }

    void writeClass(TSNode klass, size_t depth) {
        std::string line = indent(depth) + "class " + text(field(klass, "name"));

        std::vector<std::string> bases;
        TSNode superclasses = field(klass, "superclasses");
        if (!ts_node_is_null(superclasses)) {
            uint32_t count = ts_node_named_child_count(superclasses);
            for (uint32_t i = 0; i < count; ++i) {
                TSNode base = ts_node_named_child(superclasses, i);
                if (isType(base, "keyword_argument") || isType(base, "comment")) {
                    continue;
                }
                bases.push_back(normalizeWhitespace(text(base)));
            }
        }
        if (!bases.empty()) {
            line += "(";
            for (size_t i = 0; i < bases.size(); ++i) {
                if (i > 0) line += ", ";
                line += bases[i];
            }
            line += ")";
        }
        line += ":";
        m_lines.push_back(line);

        writeBody(field(klass, "body"), depth, true);
    }

    void writeBody(TSNode body, size_t depth, bool in_class) {
        if (ts_node_is_null(body)) {
            return;
        }
        std::string docstring;
        if (findDocstring(body, docstring)) {
            writeDocstring(docstring, depth + 1);
        }
        writeBlock(body, depth + 1, in_class);
    }

    void writeField(TSNode statement, size_t depth) {
        if (ts_node_named_child_count(statement) != 1) {
            return;
        }
        TSNode assignment = ts_node_named_child(statement, 0);
        if (!isType(assignment, "assignment")) {
            return;
        }

        TSNode annotation = field(assignment, "type");
        TSNode value = field(assignment, "right");
        std::string line = indent(depth) + normalizeWhitespace(text(field(assignment, "left")));

        if (!ts_node_is_null(annotation)) {
            line += ": " + normalizeWhitespace(text(annotation));
            if (!ts_node_is_null(value)) {
                line += " = ...";
            }
        } else {
            // a = b = value nests the second assignment on the right
            while (!ts_node_is_null(value) && isType(value, "assignment") &&
                   ts_node_is_null(field(value, "type"))) {
                line += " = " + normalizeWhitespace(text(field(value, "left")));
                value = field(value, "right");
            }
            line += " = ...";
        }
        m_lines.push_back(line);
    }

    std::vector<std::string> parameterNames(TSNode parameters) const {
        std::vector<std::string> names;
        if (ts_node_is_null(parameters)) {
            return names;
        }

        uint32_t count = ts_node_named_child_count(parameters);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode param = ts_node_named_child(parameters, i);
            std::string name = parameterName(param);
            if (name.empty()) {
                continue;
            }
            if (m_options.omit_self && name == "self") {
                continue;
            }
            names.push_back(name);
        }
        return names;
    }

    std::string parameterName(TSNode param) const {
        std::string type = ts_node_type(param);
        if (type == "identifier") {
            return text(param);
        }
        if (type == "list_splat_pattern" || type == "dictionary_splat_pattern" ||
            type == "list_splat" || type == "dictionary_splat") {
            return normalizeWhitespace(text(param));
        }
        if (type == "default_parameter" || type == "typed_default_parameter") {
            TSNode name = field(param, "name");
            return ts_node_is_null(name) ? "" : parameterName(name);
        }
        if (type == "typed_parameter") {
            // The annotation is a field; the name is the first named child
            if (ts_node_named_child_count(param) == 0) {
                return "";
            }
            return parameterName(ts_node_named_child(param, 0));
        }
        // keyword_separator, positional_separator, comments
        return "";
    }

    bool findDocstring(TSNode body, std::string& docstring) const {
        uint32_t count = ts_node_named_child_count(body);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode statement = ts_node_named_child(body, i);
            if (isType(statement, "comment")) {
                continue;
            }
            if (!isType(statement, "expression_statement") || ts_node_named_child_count(statement) != 1) {
                return false;
            }
            TSNode literal = ts_node_named_child(statement, 0);
            std::string raw;
            if (!stringValue(literal, raw)) {
                return false;
            }
            docstring = PythonSummarizer::cleanDocstring(raw);
            return !docstring.empty();
        }
        return false;
    }

    bool stringValue(TSNode literal, std::string& value) const {
        if (isType(literal, "string")) {
            return PythonSummarizer::decodeStringLiteral(text(literal), value);
        }
        if (isType(literal, "concatenated_string")) {
            value.clear();
            uint32_t count = ts_node_named_child_count(literal);
            for (uint32_t i = 0; i < count; ++i) {
                TSNode part = ts_node_named_child(literal, i);
                if (isType(part, "comment")) {
                    continue;
                }
                std::string piece;
                if (!isType(part, "string") || !PythonSummarizer::decodeStringLiteral(text(part), piece)) {
                    return false;
                }
                value += piece;
            }
            return true;
        }
        return false;
    }

    void writeDocstring(const std::string& docstring, size_t depth) {
        std::vector<std::string> lines = splitLines(docstring);
        std::string prefix = indent(depth);
        for (size_t i = 0; i < lines.size(); ++i) {
            std::string line;
            if (i == 0) {
                line = prefix + kDocQuote + lines[i];
            } else if (!lines[i].empty()) {
                line = prefix + lines[i];
            }
            if (i + 1 == lines.size()) {
                if (i > 0 && lines[i].empty()) {
                    line = prefix;
                }
                line += kDocQuote;
            }
            m_lines.push_back(line);
        }
    }
};

} // namespace

PythonSummarizer::PythonSummarizer(SignatureOptions options)
    : m_options(options) {}

bool PythonSummarizer::supports(const std::filesystem::path& path) const {
    std::string extension = path.extension().string();
    return extension == ".py" || extension == ".pyi";
}

std::string PythonSummarizer::summarize(const std::string& source_text) const {
    static const std::string marker = "# SyntaxError while parsing: ";

    if (source_text.size() > UINT32_MAX) {
        return marker + "file too large to parse";
    }

    ParserPtr parser(ts_parser_new(), ts_parser_delete);
    if (!parser || !ts_parser_set_language(parser.get(), tree_sitter_python())) {
        return marker + "Python grammar is incompatible with the tree-sitter runtime";
    }

    TreePtr tree(ts_parser_parse_string(parser.get(), nullptr, source_text.data(),
                                        static_cast<uint32_t>(source_text.size())),
                 ts_tree_delete);
    if (!tree) {
        return marker + "parser returned no tree";
    }

    TSNode root = ts_tree_root_node(tree.get());
    if (ts_node_has_error(root)) {
        TSNode error = findErrorNode(root);
        TSPoint point = ts_node_is_null(error) ? TSPoint{0, 0} : ts_node_start_point(error);
        std::string reason = "invalid syntax";
        if (!ts_node_is_null(error) && ts_node_is_missing(error)) {
            reason = std::string("expected '") + ts_node_type(error) + "'";
        }
        return marker + reason + " (line " + std::to_string(point.row + 1) +
               ", column " + std::to_string(point.column + 1) + ")";
    }

    DigestWriter writer(source_text, m_options);
    writer.writeBlock(root, 0, false);
    return writer.result();
}

std::string PythonSummarizer::cleanDocstring(const std::string& raw) {
    // Expand tabs to 8-column stops
    std::vector<std::string> lines;
    for (const auto& line : splitLines(raw)) {
        std::string expanded;
        for (char c : line) {
            if (c == '\t') {
                expanded.append(8 - (expanded.size() % 8), ' ');
            } else {
                expanded += c;
            }
        }
        lines.push_back(expanded);
    }

    size_t margin = std::string::npos;
    for (size_t i = 1; i < lines.size(); ++i) {
        size_t content = lines[i].find_first_not_of(' ');
        if (content != std::string::npos) {
            margin = std::min(margin, content);
        }
    }

    size_t first = lines[0].find_first_not_of(' ');
    lines[0] = (first == std::string::npos) ? "" : lines[0].substr(first);
    if (margin != std::string::npos) {
        for (size_t i = 1; i < lines.size(); ++i) {
            lines[i] = lines[i].size() > margin ? lines[i].substr(margin) : "";
        }
    }

    while (!lines.empty() && isBlank(lines.back())) {
        lines.pop_back();
    }
    size_t start = 0;
    while (start < lines.size() && isBlank(lines[start])) {
        ++start;
    }

    std::string cleaned;
    for (size_t i = start; i < lines.size(); ++i) {
        if (i > start) cleaned += '\n';
        cleaned += lines[i];
    }
    return cleaned;
}

bool PythonSummarizer::decodeStringLiteral(const std::string& literal, std::string& value) {
    size_t quote = literal.find_first_of("'\"");
    if (quote == std::string::npos) {
        return false;
    }

    std::string prefix = literal.substr(0, quote);
    std::transform(prefix.begin(), prefix.end(), prefix.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (prefix.find_first_of("bft") != std::string::npos) {
        return false;
    }
    bool raw = prefix.find('r') != std::string::npos;

    char quote_char = literal[quote];
    std::string triple(3, quote_char);
    size_t delimiter = literal.compare(quote, 3, triple) == 0 ? 3 : 1;
    if (literal.size() < quote + 2 * delimiter) {
        return false;
    }

    std::string body = literal.substr(quote + delimiter, literal.size() - quote - 2 * delimiter);
    value = raw ? body : decodeEscapes(body);
    return true;
}

} // namespace GenContext
