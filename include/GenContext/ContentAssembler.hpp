// =================================================================
// include/GenContext/ContentAssembler.hpp
// =================================================================
// Header for assembling the tree and file contents into one document.

#pragma once

#include <string>
#include <vector>
#include <stdexcept>
#include <filesystem>
#include "AssemblyPolicy.hpp"
#include "ProjectScanner.hpp"
#include "Summarizer.hpp"
#include "SysInteraction.hpp"

namespace GenContext {

/**
 * @brief Fatal setup problem: bad root, or an explicit file that is
 *        missing or escapes the root. Raised before any output exists.
 */
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief How a file's content was produced
 */
enum class ContentMode {
    FULL,           ///< Raw content, unmodified
    TRUNCATED,      ///< First truncate_lines lines of a longer file
    SUMMARIZED,     ///< Declaration digest
    READ_ERROR      ///< "Error reading <path>: <message>" placeholder
};

/**
 * @brief One emitted file, before it is flattened into the document
 */
struct FileRecord {
    std::filesystem::path path;
    std::string display_path;
    std::string content;
    TreeRole role = TreeRole::PRIMARY;
    ContentMode mode = ContentMode::FULL;
    size_t tokens = 0;
};

/**
 * @brief Counters from the last assembly
 */
struct AssemblyStats {
    size_t files_included = 0;
    size_t files_summarized = 0;
    size_t files_truncated = 0;
    size_t files_skipped_related = 0;
    size_t read_errors = 0;
    size_t tokens = 0;
    std::string primary_root;
    std::vector<std::string> related_roots;
};

struct AssemblyResult {
    std::string text;
    size_t token_count = 0;
    AssemblyStats stats;
};

/**
 * @brief Builds the prompt document for a root directory
 *
 * One walk feeds both the tree rendering and the file blocks. Per-file
 * policy: related-tree source files are summarized (or dropped when
 * related trees are skipped), files without a summarizer are cut to the
 * line limit, primary-tree source files are emitted in full. Read errors
 * become inline placeholders and never abort the run.
 */
class ContentAssembler {
public:
    /**
     * @brief Construct a new ContentAssembler
     * @param policy Selection and rendering settings
     * @param prompt_template Preamble and block delimiters
     */
    explicit ContentAssembler(AssemblyPolicy policy,
                              PromptTemplate prompt_template = PromptTemplate::defaults());

    /**
     * @brief Assemble the complete document
     * @param root_path Root directory
     * @return Document text and estimated token count.
     *         Throws ConfigurationError before producing anything on fatal setup errors.
     */
    AssemblyResult assemble(const std::string& root_path);

    /**
     * @brief Produce the file records without rendering the document
     * @param root_path Root directory
     */
    std::vector<FileRecord> collectFiles(const std::string& root_path);

    /**
     * @brief Render the repository structure block's lines for a root
     */
    std::vector<std::string> renderTree(const std::string& root_path);

    /**
     * @brief Summarizers consulted for source files; starts with Python
     */
    SummarizerRegistry& getSummarizers() { return m_summarizers; }

    /**
     * @brief Get statistics from the last assembly
     */
    const AssemblyStats& getLastStats() const { return m_last_stats; }

    /**
     * @brief Remove every occurrence of the closing delimiter from task text
     *
     * Removal repeats until no occurrence remains, so text like
     * "</ta</task>sk>" cannot reassemble a closing tag.
     */
    static std::string sanitizeTask(const std::string& task, const std::string& closing_delimiter);

private:
    AssemblyPolicy m_policy;
    PromptTemplate m_template;
    SummarizerRegistry m_summarizers;
    SysInteraction m_sys;
    AssemblyStats m_last_stats;
    std::vector<ScanEntry> m_entries;

    void checkRoot(const std::string& root_path);

    /**
     * @brief Walk the root once and keep the entries for tree and files
     */
    void scanRoot(const std::string& root_path);

    /**
     * @brief Resolve the allow-list against the root
     * @return Absolute paths. Throws ConfigurationError for missing or escaping files.
     */
    std::vector<std::filesystem::path> resolveExplicitFiles(const std::string& root_path);

    std::vector<FileRecord> loadExplicitFiles(const std::string& root_path,
                                              const std::vector<std::filesystem::path>& files);
    std::vector<FileRecord> loadWalkedFiles(const std::string& root_path);

    /**
     * @brief Read one file according to its role and extension
     * @return false if the file is dropped (related tree skipped)
     */
    bool loadFile(FileRecord& record, bool force_full);

    std::string composeDocument(const std::vector<std::string>& tree_lines,
                                const std::vector<FileRecord>& records) const;

    std::string displayPath(const std::string& root_path, const std::filesystem::path& relative) const;
};

} // namespace GenContext
