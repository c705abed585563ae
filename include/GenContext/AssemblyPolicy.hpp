// =================================================================
// include/GenContext/AssemblyPolicy.hpp
// =================================================================
// Configuration structures for document assembly.

#pragma once

#include <string>
#include <vector>

namespace GenContext {

class ConfigParser;
struct Commands;

/**
 * @brief Settings that decide which files are emitted and how
 *
 * Built once per run from defaults, the configuration file and the
 * command line; never mutated during assembly.
 */
struct AssemblyPolicy {
    // Selection
    bool skip_related = false;
    bool include_ignored = false;
    std::vector<std::string> explicit_files;
    std::vector<std::string> excluded_names;
    std::vector<std::string> related_allowed_extensions = {".md"};

    // Walk
    std::string ignore_file_name = ".gitignore";
    std::string hidden_prefix = ".";
    bool sort_entries = true;

    // Rendering
    bool include_tree = true;
    bool omit_self_parameter = false;
    size_t truncate_lines = 500;
    std::string task;

    /**
     * @brief Load settings from ConfigParser
     * @param config ConfigParser instance
     */
    void loadFromConfig(const ConfigParser& config);

    /**
     * @brief Apply command-line overrides
     * @param commands Command-line arguments
     */
    void applyCommandOverrides(const Commands& commands);

    /**
     * @brief Validate settings
     * @return True if the policy can be used
     */
    bool validate() const;

    /**
     * @brief Whether a related-tree file survives when related trees are skipped
     * @param extension Extension including the dot (e.g., ".md")
     */
    bool isRelatedExtensionAllowed(const std::string& extension) const;
};

/**
 * @brief Fixed text surrounding the generated blocks
 */
struct PromptTemplate {
    std::string preamble;
    std::string structure_open = "<repository_structure>";
    std::string structure_close = "</repository_structure>";
    std::string files_open = "<files_content>";
    std::string files_close = "</files_content>";
    std::string input_close = "</input>";
    std::string task_open = "<task>";
    std::string task_close = "</task>";
    std::string file_label = "File: ";

    /**
     * @brief Template with the stock preamble
     */
    static PromptTemplate defaults();

    /**
     * @brief Replace the preamble with the content of preamble_file, if configured
     * @param config ConfigParser instance
     * @return False if a preamble file was configured but could not be read
     */
    bool loadFromConfig(const ConfigParser& config);
};

} // namespace GenContext
