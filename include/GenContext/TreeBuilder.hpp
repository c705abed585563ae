// =================================================================
// include/GenContext/TreeBuilder.hpp
// =================================================================
// Header for building and rendering the repository structure tree.

#pragma once

#include <string>
#include <vector>
#include "ProjectScanner.hpp"

namespace GenContext {

/**
 * @brief Directory tree node; leaves are files
 *
 * Children keep the order in which the walk produced them.
 */
struct TreeNode {
    std::string name;
    bool is_directory = false;
    std::vector<TreeNode> children;

    /**
     * @brief Find a direct child by name
     * @return The child, or nullptr if there is none
     */
    const TreeNode* find(const std::string& child_name) const;
};

class TreeBuilder {
public:
    /**
     * @brief Walk a root and build its tree
     * @param root_path Root directory
     * @param matcher Matcher used (and extended with rule sets) by the walk
     * @param rule_file_name Per-directory rule file name
     * @param order Entry order inside each directory
     * @return Node keyed by the root directory's base name
     */
    static TreeNode build(const std::string& root_path, IgnoreMatcher& matcher,
                          const std::string& rule_file_name = ".gitignore",
                          WalkOrder order = WalkOrder::SORTED);

    /**
     * @brief Build a tree from entries an earlier walk already produced
     * @param root_name Name of the top-level node
     * @param entries Walk output, directories before their contents
     */
    static TreeNode build(const std::string& root_name, const std::vector<ScanEntry>& entries);

    /**
     * @brief Render one line per node, indented by depth
     *
     * Every line carries the same connector; each level of depth adds one
     * vertical guide. Directory names end with '/'.
     */
    static std::vector<std::string> formatTree(const TreeNode& root);

    /**
     * @brief Base name used as the top-level key for a root path
     */
    static std::string rootName(const std::string& root_path);

private:
    static TreeNode& insertPath(TreeNode& root, const std::filesystem::path& relative_path, bool is_directory);
    static void formatNode(const TreeNode& node, size_t depth, std::vector<std::string>& lines);
};

} // namespace GenContext
