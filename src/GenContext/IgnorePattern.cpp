// =================================================================
// src/GenContext/IgnorePattern.cpp
// =================================================================
// Implementation for directory-scoped ignore rules.

#include "GenContext/IgnorePattern.hpp"
#include "GenContext/Logger.hpp"
#include <fstream>
#include <algorithm>
#include <utility>

namespace GenContext {

namespace fs = std::filesystem;

IgnorePattern::IgnorePattern(const std::string& pattern, const std::string& base_dir)
    : m_is_negation(false),
      m_directory_only(false),
      m_is_empty(false)
{
    processPattern(pattern, base_dir);
}

bool IgnorePattern::matches(const std::string& path, bool is_directory) const {
    if (m_is_empty) {
        return false;
    }

    // Directory patterns end in "/.*", so a directory is tested with its
    // trailing separator and a plain file of the same name never matches.
    if (m_directory_only && is_directory) {
        return std::regex_match(path + "/", m_regex);
    }
    return std::regex_match(path, m_regex);
}

void IgnorePattern::processPattern(const std::string& pattern, const std::string& base_dir) {
    std::string working_pattern = pattern;

    // Trim whitespace (including the '\r' of CRLF rule files)
    working_pattern.erase(0, working_pattern.find_first_not_of(" \t\r"));
    working_pattern.erase(working_pattern.find_last_not_of(" \t\r") + 1);

    // Skip empty lines and comments
    if (working_pattern.empty() || working_pattern[0] == '#') {
        m_is_empty = true;
        return;
    }

    if (working_pattern[0] == '!') {
        m_is_negation = true;
        working_pattern = working_pattern.substr(1);
    }

    // A trailing separator turns the pattern into a recursive wildcard
    while (!working_pattern.empty() && working_pattern.back() == '/') {
        m_directory_only = true;
        working_pattern.pop_back();
    }

    // Every pattern is already anchored at its directory
    working_pattern.erase(0, working_pattern.find_first_not_of('/'));

    if (working_pattern.empty()) {
        m_is_empty = true;
        return;
    }

    std::string separator = (!base_dir.empty() && base_dir.back() == '/') ? "" : "/";
    std::string regex_pattern = escapeRegex(base_dir) + separator + globToRegex(working_pattern);
    if (m_directory_only) {
        regex_pattern += "/.*";
    }

    try {
        m_regex = std::regex(regex_pattern, std::regex_constants::ECMAScript);
    } catch (const std::regex_error& e) {
        LOG_WARNING("IgnorePattern", "Failed to compile pattern '" + pattern + "': " + e.what());
        m_is_empty = true;
    }
}

std::string IgnorePattern::globToRegex(const std::string& glob_pattern) {
    std::string regex_pattern;

    for (size_t i = 0; i < glob_pattern.length(); ++i) {
        char c = glob_pattern[i];

        switch (c) {
            case '*':
                // '*' and '**' both cross separators
                while (i + 1 < glob_pattern.length() && glob_pattern[i + 1] == '*') {
                    ++i;
                }
                regex_pattern += ".*";
                break;

            case '?':
                regex_pattern += "[^/]";
                break;

            case '[': {
                size_t j = i + 1;
                bool negated = false;
                if (j < glob_pattern.length() && (glob_pattern[j] == '!' || glob_pattern[j] == '^')) {
                    negated = true;
                    ++j;
                }
                // A ']' right after the opening bracket is a literal member
                size_t close = glob_pattern.find(']', j < glob_pattern.length() && glob_pattern[j] == ']' ? j + 1 : j);
                if (close == std::string::npos) {
                    regex_pattern += "\\[";
                    break;
                }
                regex_pattern += negated ? "[^" : "[";
                for (size_t k = j; k < close; ++k) {
                    if (glob_pattern[k] == '\\' || glob_pattern[k] == '[' || glob_pattern[k] == ']') {
                        regex_pattern += '\\';
                    }
                    regex_pattern += glob_pattern[k];
                }
                regex_pattern += ']';
                i = close;
                break;
            }

            case '\\':
                if (i + 1 < glob_pattern.length()) {
                    regex_pattern += escapeRegex(std::string(1, glob_pattern[++i]));
                } else {
                    regex_pattern += "\\\\";
                }
                break;

            default:
                regex_pattern += escapeRegex(std::string(1, c));
                break;
        }
    }

    return regex_pattern;
}

std::string IgnorePattern::escapeRegex(const std::string& str) {
    static const std::string special = ".^$|()[]{}*+?\\";
    std::string result;
    result.reserve(str.size());
    for (char c : str) {
        if (special.find(c) != std::string::npos) {
            result += '\\';
        }
        result += c;
    }
    return result;
}

// IgnoreRuleSet implementation

IgnoreRuleSet::IgnoreRuleSet(const fs::path& directory)
    : m_directory(IgnoreMatcher::normalize(directory)) {}

void IgnoreRuleSet::addPattern(const std::string& pattern) {
    IgnorePattern ignore_pattern(pattern, m_directory);
    if (!ignore_pattern.isEmpty()) {
        m_patterns.push_back(std::move(ignore_pattern));
    }
}

size_t IgnoreRuleSet::loadFromFile(const fs::path& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        return 0;
    }

    size_t patterns_loaded = 0;
    std::string line;
    while (std::getline(file, line)) {
        IgnorePattern pattern(line, m_directory);
        if (!pattern.isEmpty()) {
            m_patterns.push_back(std::move(pattern));
            patterns_loaded++;
        }
    }

    return patterns_loaded;
}

bool IgnoreRuleSet::appliesTo(const std::string& path) const {
    if (m_directory == "/") {
        return !path.empty() && path[0] == '/';
    }
    return path.size() > m_directory.size() &&
           path.compare(0, m_directory.size(), m_directory) == 0 &&
           path[m_directory.size()] == '/';
}

bool IgnoreRuleSet::shouldIgnore(const std::string& path, bool is_directory) const {
    if (m_patterns.empty() || !appliesTo(path)) {
        return false;
    }

    // Ancestors strictly between the declaring directory and the path
    size_t pos = (m_directory == "/") ? 0 : m_directory.size();
    while ((pos = path.find('/', pos + 1)) != std::string::npos) {
        if (decide(path.substr(0, pos), true)) {
            return true;
        }
    }

    return decide(path, is_directory);
}

bool IgnoreRuleSet::decide(const std::string& path, bool is_directory) const {
    bool should_ignore = false;

    // Later patterns override earlier ones
    for (const auto& pattern : m_patterns) {
        if (pattern.matches(path, is_directory)) {
            should_ignore = !pattern.isNegation();
        }
    }

    return should_ignore;
}

// IgnoreMatcher implementation

IgnoreMatcher::IgnoreMatcher(std::string hidden_prefix, bool include_ignored,
                             std::vector<std::string> excluded_names)
    : m_hidden_prefix(std::move(hidden_prefix)),
      m_include_ignored(include_ignored),
      m_excluded_names(std::move(excluded_names)) {}

bool IgnoreMatcher::discoverRuleSet(const fs::path& directory, const std::string& rule_file_name) {
    fs::path rule_file = directory / rule_file_name;
    std::error_code ec;
    if (!fs::is_regular_file(rule_file, ec)) {
        return false;
    }

    IgnoreRuleSet rule_set(directory);
    size_t loaded = rule_set.loadFromFile(rule_file);
    if (loaded == 0 && !std::ifstream(rule_file).is_open()) {
        LOG_WARNING("IgnoreMatcher", "Cannot read rule file " + rule_file.string() +
                    "; the directory still counts as a repository root");
    }

    LOG_DEBUG("IgnoreMatcher", "Loaded " + std::to_string(loaded) + " patterns from " + rule_file.string());
    m_rule_sets.push_back(std::move(rule_set));
    return true;
}

void IgnoreMatcher::setRoot(const fs::path& root) {
    m_root = normalize(root);
}

bool IgnoreMatcher::isExcluded(const fs::path& path) const {
    if (isDenied(path)) {
        return true;
    }
    if (m_include_ignored) {
        return false;
    }
    if (isHiddenName(path.filename().string())) {
        return true;
    }
    return isIgnoredByRules(path, false);
}

bool IgnoreMatcher::shouldPrune(const fs::path& directory) const {
    fs::path name = directory.filename();
    if (name.empty()) {
        name = directory.parent_path().filename();
    }
    if (isHiddenName(name.string()) || isDenied(directory)) {
        return true;
    }
    if (m_include_ignored) {
        return false;
    }
    return isIgnoredByRules(directory, true);
}

bool IgnoreMatcher::isIgnoredByRules(const fs::path& path, bool is_directory) const {
    std::string normalized = normalize(path);
    return std::any_of(m_rule_sets.begin(), m_rule_sets.end(),
                       [&](const IgnoreRuleSet& rule_set) {
                           return rule_set.shouldIgnore(normalized, is_directory);
                       });
}

bool IgnoreMatcher::isHiddenName(const std::string& name) const {
    if (name == "." || name == "..") {
        return false;
    }
    return name.compare(0, m_hidden_prefix.size(), m_hidden_prefix) == 0;
}

bool IgnoreMatcher::isDenied(const fs::path& path) const {
    if (m_excluded_names.empty()) {
        return false;
    }
    std::string name = path.filename().string();
    fs::path root(m_root.empty() ? normalize(fs::path(".")) : m_root);
    std::string relative = fs::path(normalize(path)).lexically_relative(root).generic_string();

    for (auto excluded : m_excluded_names) {
        while (excluded.size() > 1 && excluded.back() == '/') {
            excluded.pop_back();
        }
        if (excluded.find('/') == std::string::npos) {
            if (excluded == name) {
                return true;
            }
        } else if (fs::path(excluded).lexically_normal().generic_string() == relative) {
            return true;
        }
    }
    return false;
}

std::string IgnoreMatcher::normalize(const fs::path& path) {
    std::error_code ec;
    fs::path absolute = fs::absolute(path, ec);
    if (ec) {
        absolute = path;
    }
    std::string normalized = absolute.lexically_normal().generic_string();
    while (normalized.size() > 1 && normalized.back() == '/') {
        normalized.pop_back();
    }
    return normalized;
}

} // namespace GenContext
