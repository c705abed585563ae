// =================================================================
// src/GenContext/ProjectScanner.cpp
// =================================================================
// Implementation for the ignore-aware directory walk.

#include "GenContext/ProjectScanner.hpp"
#include "GenContext/Logger.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace GenContext {

namespace fs = std::filesystem;

ProjectScanner::ProjectScanner(const std::string& root_path, IgnoreMatcher& matcher,
                               std::string rule_file_name, WalkOrder order)
    : m_root_path(IgnoreMatcher::normalize(root_path)),
      m_matcher(matcher),
      m_rule_file_name(std::move(rule_file_name)),
      m_order(order)
{
    m_matcher.setRoot(m_root_path);
}

std::vector<ScanEntry> ProjectScanner::scan() {
    std::error_code ec;
    if (!fs::is_directory(m_root_path, ec)) {
        throw std::runtime_error("Root is not a directory: " + m_root_path.string());
    }

    m_primary_root.clear();
    m_related_roots.clear();
    m_primary_found = false;

    std::vector<ScanEntry> entries;
    enterDirectory(m_root_path);
    walkDirectory(m_root_path, 0, entries);

    std::vector<std::string> related;
    related.reserve(m_related_roots.size());
    for (const auto& root : m_related_roots) {
        related.push_back(getRelativePath(root).generic_string());
    }
    Logger::getInstance().logScan(m_root_path.string(), entries.size(),
                                  m_matcher.ruleSets().size(), related);
    return entries;
}

TreeRole ProjectScanner::classify(const fs::path& path) const {
    std::string normalized = IgnoreMatcher::normalize(path);
    for (const auto& root : m_related_roots) {
        std::string prefix = root.generic_string() + "/";
        if (normalized.compare(0, prefix.size(), prefix) == 0) {
            return TreeRole::RELATED;
        }
    }
    return TreeRole::PRIMARY;
}

void ProjectScanner::walkDirectory(const fs::path& directory, size_t depth,
                                   std::vector<ScanEntry>& entries) {
    std::vector<fs::directory_entry> children;
    try {
        children = listDirectory(directory);
    } catch (const fs::filesystem_error& e) {
        if (directory == m_root_path) {
            throw std::runtime_error("Cannot list root directory " + directory.string() + ": " + e.what());
        }
        LOG_WARNING("ProjectScanner", "Skipping unreadable directory " +
                    getRelativePath(directory).generic_string() + ": " + e.code().message());
        return;
    }

    for (const auto& child : children) {
        std::error_code ec;
        const fs::path& child_path = child.path();

        if (child.is_directory(ec)) {
            // Linked directories are listed by the OS walk but never entered
            if (child.is_symlink(ec)) {
                LOG_DEBUG("ProjectScanner", "Not following directory link " + child_path.string());
                continue;
            }
            if (m_matcher.shouldPrune(child_path)) {
                LOG_DEBUG("ProjectScanner", "Pruned " + getRelativePath(child_path).generic_string());
                continue;
            }

            ScanEntry entry;
            entry.path = child_path;
            entry.relative_path = getRelativePath(child_path);
            entry.is_directory = true;
            entry.depth = depth;
            entry.role = classify(child_path);
            entries.push_back(std::move(entry));

            enterDirectory(child_path);
            walkDirectory(child_path, depth + 1, entries);
            continue;
        }

        if (!child.is_regular_file(ec)) {
            continue;
        }
        if (m_matcher.isExcluded(child_path)) {
            continue;
        }

        ScanEntry entry;
        entry.path = child_path;
        entry.relative_path = getRelativePath(child_path);
        entry.is_directory = false;
        entry.depth = depth;
        entry.role = classify(child_path);
        entries.push_back(std::move(entry));
    }
}

void ProjectScanner::enterDirectory(const fs::path& directory) {
    if (!m_matcher.discoverRuleSet(directory, m_rule_file_name)) {
        return;
    }

    if (!m_primary_found) {
        m_primary_found = true;
        m_primary_root = directory;
        LOG_DEBUG("ProjectScanner", "Primary repository root: " + directory.string());
    } else {
        m_related_roots.push_back(directory);
        LOG_DEBUG("ProjectScanner", "Related repository root: " + directory.string());
    }
}

std::vector<fs::directory_entry> ProjectScanner::listDirectory(const fs::path& directory) const {
    std::vector<fs::directory_entry> children;
    for (const auto& entry : fs::directory_iterator(directory)) {
        children.push_back(entry);
    }

    if (m_order == WalkOrder::SORTED) {
        std::sort(children.begin(), children.end(),
                  [](const fs::directory_entry& a, const fs::directory_entry& b) {
                      return a.path().filename().string() < b.path().filename().string();
                  });
    }
    return children;
}

fs::path ProjectScanner::getRelativePath(const fs::path& abs_path) const {
    return abs_path.lexically_relative(m_root_path);
}

} // namespace GenContext
