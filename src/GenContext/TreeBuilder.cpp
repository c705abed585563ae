// =================================================================
// src/GenContext/TreeBuilder.cpp
// =================================================================
// Implementation for building and rendering the repository structure tree.

#include "GenContext/TreeBuilder.hpp"
#include <algorithm>
#include <iterator>

namespace GenContext {

namespace fs = std::filesystem;

static const char* const kConnector = "├── ";
static const char* const kGuide = "│   ";

const TreeNode* TreeNode::find(const std::string& child_name) const {
    auto it = std::find_if(children.begin(), children.end(),
                           [&](const TreeNode& child) { return child.name == child_name; });
    return it == children.end() ? nullptr : &*it;
}

TreeNode TreeBuilder::build(const std::string& root_path, IgnoreMatcher& matcher,
                            const std::string& rule_file_name, WalkOrder order) {
    ProjectScanner scanner(root_path, matcher, rule_file_name, order);
    return build(rootName(root_path), scanner.scan());
}

TreeNode TreeBuilder::build(const std::string& root_name, const std::vector<ScanEntry>& entries) {
    TreeNode root;
    root.name = root_name;
    root.is_directory = true;

    for (const auto& entry : entries) {
        insertPath(root, entry.relative_path, entry.is_directory);
    }
    return root;
}

std::vector<std::string> TreeBuilder::formatTree(const TreeNode& root) {
    std::vector<std::string> lines;
    formatNode(root, 0, lines);
    return lines;
}

std::string TreeBuilder::rootName(const std::string& root_path) {
    fs::path normalized(IgnoreMatcher::normalize(root_path));
    std::string name = normalized.filename().string();
    return name.empty() ? normalized.generic_string() : name;
}

TreeNode& TreeBuilder::insertPath(TreeNode& root, const fs::path& relative_path, bool is_directory) {
    TreeNode* current = &root;
    if (relative_path.empty()) {
        return *current;
    }
    auto last = std::prev(relative_path.end());

    for (auto it = relative_path.begin(); it != relative_path.end(); ++it) {
        std::string segment = it->string();
        bool segment_is_directory = (it != last) || is_directory;

        auto child = std::find_if(current->children.begin(), current->children.end(),
                                  [&](const TreeNode& node) { return node.name == segment; });
        if (child == current->children.end()) {
            TreeNode node;
            node.name = segment;
            node.is_directory = segment_is_directory;
            current->children.push_back(std::move(node));
            current = &current->children.back();
        } else {
            current = &*child;
        }
    }
    return *current;
}

void TreeBuilder::formatNode(const TreeNode& node, size_t depth, std::vector<std::string>& lines) {
    std::string line;
    for (size_t i = 0; i < depth; ++i) {
        line += kGuide;
    }
    line += kConnector;
    line += node.name;
    if (node.is_directory) {
        line += '/';
    }
    lines.push_back(std::move(line));

    for (const auto& child : node.children) {
        formatNode(child, depth + 1, lines);
    }
}

} // namespace GenContext
