// =================================================================
// include/GenContext/PythonSummarizer.hpp
// =================================================================
// Header for the Python declaration digest built on tree-sitter.

#pragma once

#include "Summarizer.hpp"
#include <string>

namespace GenContext {

/**
 * @brief How function signatures are reconstructed
 */
struct SignatureOptions {
    bool omit_self = false;     ///< Drop parameters named "self"
};

/**
 * @brief Declaration digest for Python modules
 *
 * Emits one line per function and class at an indentation equal to its
 * nesting depth, the cleaned docstring of each on the following line, and
 * the field declarations found directly in class bodies:
 *
 *     class C(Base):
 *         """doc"""
 *         name: str = ...
 *         def g(self, x):
 *
 * Source that fails to parse yields "# SyntaxError while parsing: ...".
 */
class PythonSummarizer : public Summarizer {
public:
    explicit PythonSummarizer(SignatureOptions options = SignatureOptions());

    std::string name() const override { return "python"; }
    bool supports(const std::filesystem::path& path) const override;
    std::string summarize(const std::string& source_text) const override;

    /**
     * @brief Apply Python's docstring cleaning rules
     *
     * Tabs are expanded, the first line is left-stripped, the common
     * indentation of the remaining lines is removed, and leading and
     * trailing blank lines are dropped.
     */
    static std::string cleanDocstring(const std::string& raw);

    /**
     * @brief Value of a Python string literal token
     * @param literal Literal text including prefix and quotes
     * @param value Receives the decoded value
     * @return false for bytes and f-strings, which are never docstrings
     */
    static bool decodeStringLiteral(const std::string& literal, std::string& value);

private:
    SignatureOptions m_options;
};

} // namespace GenContext
