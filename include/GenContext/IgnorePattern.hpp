// =================================================================
// include/GenContext/IgnorePattern.hpp
// =================================================================
// Header for directory-scoped ignore rules and inclusion decisions.

#pragma once

#include <string>
#include <vector>
#include <regex>
#include <filesystem>

namespace GenContext {

/**
 * @brief One ignore rule, resolved against the directory that declared it
 *
 * The raw pattern is joined with the declaring directory into an absolute
 * glob and compiled once. Supported syntax:
 * - Wildcards: * and ** (any characters, separators included), ?
 * - Character classes: [abc], [!abc]
 * - Negation: !pattern
 * - Directory patterns: pattern/ (recursive below the directory)
 * - Comment lines: # comment
 */
class IgnorePattern {
public:
    /**
     * @brief Construct a pattern matcher
     * @param pattern The raw pattern line
     * @param base_dir Absolute directory the pattern is relative to
     */
    IgnorePattern(const std::string& pattern, const std::string& base_dir);

    /**
     * @brief Check if an absolute path matches this pattern
     * @param path Normalized absolute path
     * @param is_directory True if the path is a directory
     * @return true if path matches the pattern
     */
    bool matches(const std::string& path, bool is_directory = false) const;

    bool isNegation() const { return m_is_negation; }
    bool isDirectoryOnly() const { return m_directory_only; }

    /**
     * @brief Check if pattern is empty, a comment, or failed to compile
     * @return true if pattern should be skipped
     */
    bool isEmpty() const { return m_is_empty; }

private:
    bool m_is_negation;
    bool m_directory_only;
    bool m_is_empty;
    std::regex m_regex;

    void processPattern(const std::string& pattern, const std::string& base_dir);

    /**
     * @brief Convert a glob pattern to an ECMAScript regex fragment
     * @param glob_pattern Glob pattern string
     * @return Equivalent regex fragment
     */
    static std::string globToRegex(const std::string& glob_pattern);

    /**
     * @brief Escape every regex metacharacter in a literal string
     */
    static std::string escapeRegex(const std::string& str);
};

/**
 * @brief The ordered patterns declared by one directory's rule file
 *
 * Within a rule set the last matching pattern decides, so a later
 * "!pattern" re-includes a path excluded by an earlier one.
 */
class IgnoreRuleSet {
public:
    /**
     * @brief Create an empty rule set scoped to a directory
     * @param directory Absolute directory that declares the rules
     */
    explicit IgnoreRuleSet(const std::filesystem::path& directory);

    /**
     * @brief Add a pattern relative to the declaring directory
     * @param pattern Pattern string
     */
    void addPattern(const std::string& pattern);

    /**
     * @brief Load patterns from a rule file
     * @param file_path Path to the rule file
     * @return Number of patterns loaded
     */
    size_t loadFromFile(const std::filesystem::path& file_path);

    /**
     * @brief Check whether this rule set excludes a path
     *
     * The path is excluded when it, or any ancestor below the declaring
     * directory, is matched by the rules.
     *
     * @param path Normalized absolute path
     * @param is_directory True if path is a directory
     */
    bool shouldIgnore(const std::string& path, bool is_directory = false) const;

    /**
     * @brief Check whether a path lies inside the declaring directory
     */
    bool appliesTo(const std::string& path) const;

    const std::string& getDirectory() const { return m_directory; }
    size_t size() const { return m_patterns.size(); }

private:
    std::string m_directory;
    std::vector<IgnorePattern> m_patterns;

    bool decide(const std::string& path, bool is_directory) const;
};

/**
 * @brief Decides inclusion for paths given the rule sets discovered so far
 *
 * Rule sets are registered as the walk enters directories, so a query only
 * sees the rule sets known at the time it is made. A path visited before a
 * matching rule set is discovered is not excluded by it.
 */
class IgnoreMatcher {
public:
    /**
     * @param hidden_prefix Name prefix marking hidden files and directories
     * @param include_ignored Include hidden files and rule-matched paths anyway
     * @param excluded_names Base names, or root-relative paths when they contain '/', that are always excluded
     */
    explicit IgnoreMatcher(std::string hidden_prefix = ".",
                           bool include_ignored = false,
                           std::vector<std::string> excluded_names = {});

    /**
     * @brief Load the rule file of a directory, if it has one
     * @param directory Directory being entered
     * @param rule_file_name Name of the rule file (e.g., ".gitignore")
     * @return true if a rule file was found and registered
     */
    bool discoverRuleSet(const std::filesystem::path& directory, const std::string& rule_file_name);

    /**
     * @brief Set the directory deny-list paths are relative to
     *
     * ProjectScanner sets it to the scan root. Until it is set, the
     * current directory is used.
     */
    void setRoot(const std::filesystem::path& root);

    /**
     * @brief Decide whether a file is left out
     * @param path File path
     * @return true if the file must not be emitted
     */
    bool isExcluded(const std::filesystem::path& path) const;

    /**
     * @brief Decide whether a directory is never descended into
     *
     * Hidden directories are always pruned, regardless of include_ignored.
     */
    bool shouldPrune(const std::filesystem::path& directory) const;

    /**
     * @brief Check a path against the known rule sets only
     */
    bool isIgnoredByRules(const std::filesystem::path& path, bool is_directory) const;

    bool isHiddenName(const std::string& name) const;
    bool isDenied(const std::filesystem::path& path) const;

    const std::vector<IgnoreRuleSet>& ruleSets() const { return m_rule_sets; }

    /**
     * @brief Absolute, lexically normalized form used for matching
     */
    static std::string normalize(const std::filesystem::path& path);

private:
    std::string m_hidden_prefix;
    bool m_include_ignored;
    std::vector<std::string> m_excluded_names;
    std::string m_root;
    std::vector<IgnoreRuleSet> m_rule_sets;
};

} // namespace GenContext
