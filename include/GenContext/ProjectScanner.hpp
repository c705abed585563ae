// =================================================================
// include/GenContext/ProjectScanner.hpp
// =================================================================
// Header for the ignore-aware directory walk.

#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "IgnorePattern.hpp"

namespace GenContext {

/**
 * @brief Which logical repository a file belongs to
 */
enum class TreeRole {
    PRIMARY,    ///< Main repository (or no rule file seen yet)
    RELATED     ///< Nested repository discovered after the first rule file
};

/**
 * @brief One surviving filesystem entry, in walk order
 */
struct ScanEntry {
    std::filesystem::path path;           ///< Absolute, normalized
    std::filesystem::path relative_path;  ///< Relative to the scan root
    bool is_directory = false;
    size_t depth = 0;                     ///< 0 for direct children of the root
    TreeRole role = TreeRole::PRIMARY;
};

/**
 * @brief Entry order inside a directory
 *
 * LISTING keeps whatever order the filesystem returns, which is not
 * reproducible across machines; SORTED orders entries by name.
 */
enum class WalkOrder {
    LISTING,
    SORTED
};

/**
 * @brief Walks a root directory depth-first, consulting an IgnoreMatcher
 *
 * Rule files are discovered as directories are entered and registered with
 * the matcher before any entry of that directory is tested. The first rule
 * file found marks the primary repository root; every rule file found after
 * it marks the root of a related (nested) repository. Both facts depend on
 * the walk order, which is therefore an explicit parameter.
 */
class ProjectScanner {
public:
    /**
     * @brief Construct a new ProjectScanner
     * @param root_path The root directory to scan from
     * @param matcher Matcher that receives discovered rule sets
     * @param rule_file_name Name of the per-directory rule file
     * @param order Entry order inside each directory
     */
    ProjectScanner(const std::string& root_path, IgnoreMatcher& matcher,
                   std::string rule_file_name = ".gitignore",
                   WalkOrder order = WalkOrder::SORTED);

    /**
     * @brief Walk the root and return every surviving entry in pre-order
     *
     * Directories come before their contents. Throws std::runtime_error if
     * the root is not a readable directory; unreadable subdirectories are
     * logged and skipped.
     */
    std::vector<ScanEntry> scan();

    /**
     * @brief Directory of the first rule file, empty if none was found
     */
    const std::filesystem::path& getPrimaryRoot() const { return m_primary_root; }

    /**
     * @brief Directories of rule files found after the first, in discovery order
     */
    const std::vector<std::filesystem::path>& getRelatedRoots() const { return m_related_roots; }

    /**
     * @brief Classify a path against the related roots discovered so far
     */
    TreeRole classify(const std::filesystem::path& path) const;

    const std::filesystem::path& getRootPath() const { return m_root_path; }

private:
    std::filesystem::path m_root_path;
    IgnoreMatcher& m_matcher;
    std::string m_rule_file_name;
    WalkOrder m_order;
    std::filesystem::path m_primary_root;
    std::vector<std::filesystem::path> m_related_roots;
    bool m_primary_found = false;

    void walkDirectory(const std::filesystem::path& directory, size_t depth,
                       std::vector<ScanEntry>& entries);

    /**
     * @brief Register the directory's rule file and record its root kind
     */
    void enterDirectory(const std::filesystem::path& directory);

    std::vector<std::filesystem::directory_entry> listDirectory(const std::filesystem::path& directory) const;

    /**
     * @brief Convert filesystem path to a path relative to the root
     */
    std::filesystem::path getRelativePath(const std::filesystem::path& abs_path) const;
};

} // namespace GenContext
