// =================================================================
// src/GenContext/ContentAssembler.cpp
// =================================================================
// Implementation for assembling the tree and file contents into one document.

#include "GenContext/ContentAssembler.hpp"
#include "GenContext/PythonSummarizer.hpp"
#include "GenContext/SysInteraction.hpp"
#include "GenContext/TokenEstimator.hpp"
#include "GenContext/TreeBuilder.hpp"
#include "GenContext/Logger.hpp"
#include <sstream>
#include <utility>

namespace GenContext {

namespace fs = std::filesystem;

ContentAssembler::ContentAssembler(AssemblyPolicy policy, PromptTemplate prompt_template)
    : m_policy(std::move(policy)), m_template(std::move(prompt_template)) {
    SignatureOptions options;
    options.omit_self = m_policy.omit_self_parameter;
    m_summarizers.add(std::make_unique<PythonSummarizer>(options));
}

AssemblyResult ContentAssembler::assemble(const std::string& root_path) {
    m_last_stats = AssemblyStats();
    checkRoot(root_path);

    // The allow-list is checked before anything else is read
    std::vector<fs::path> explicit_files;
    if (!m_policy.explicit_files.empty()) {
        explicit_files = resolveExplicitFiles(root_path);
    }

    std::vector<std::string> tree_lines;
    std::vector<FileRecord> records;
    if (explicit_files.empty()) {
        scanRoot(root_path);
        records = loadWalkedFiles(root_path);
    } else {
        if (m_policy.include_tree) {
            scanRoot(root_path);
        }
        records = loadExplicitFiles(root_path, explicit_files);
    }
    if (m_policy.include_tree) {
        tree_lines = TreeBuilder::formatTree(TreeBuilder::build(TreeBuilder::rootName(root_path), m_entries));
    }

    AssemblyResult result;
    result.text = composeDocument(tree_lines, records);
    result.token_count = m_last_stats.tokens;
    result.stats = m_last_stats;

    Logger::getInstance().logAssembly(m_last_stats.files_included, m_last_stats.files_summarized,
                                      m_last_stats.files_truncated, m_last_stats.read_errors,
                                      m_last_stats.tokens);
    return result;
}

std::vector<FileRecord> ContentAssembler::collectFiles(const std::string& root_path) {
    m_last_stats = AssemblyStats();
    checkRoot(root_path);

    if (!m_policy.explicit_files.empty()) {
        return loadExplicitFiles(root_path, resolveExplicitFiles(root_path));
    }
    scanRoot(root_path);
    return loadWalkedFiles(root_path);
}

std::vector<std::string> ContentAssembler::renderTree(const std::string& root_path) {
    checkRoot(root_path);
    scanRoot(root_path);
    return TreeBuilder::formatTree(TreeBuilder::build(TreeBuilder::rootName(root_path), m_entries));
}

std::string ContentAssembler::sanitizeTask(const std::string& task, const std::string& closing_delimiter) {
    std::string sanitized = task;
    if (closing_delimiter.empty()) {
        return sanitized;
    }

    size_t pos = sanitized.find(closing_delimiter);
    while (pos != std::string::npos) {
        sanitized.erase(pos, closing_delimiter.size());
        // Removal can join the surrounding text into a new delimiter
        pos = sanitized.find(closing_delimiter, pos >= closing_delimiter.size() ? pos - closing_delimiter.size() : 0);
    }
    return sanitized;
}

void ContentAssembler::checkRoot(const std::string& root_path) {
    if (!m_sys.directoryExists(root_path)) {
        throw ConfigurationError("Root directory does not exist: " + root_path);
    }
}

void ContentAssembler::scanRoot(const std::string& root_path) {
    IgnoreMatcher matcher(m_policy.hidden_prefix, m_policy.include_ignored, m_policy.excluded_names);
    ProjectScanner scanner(root_path, matcher, m_policy.ignore_file_name,
                           m_policy.sort_entries ? WalkOrder::SORTED : WalkOrder::LISTING);
    try {
        m_entries = scanner.scan();
    } catch (const std::runtime_error& e) {
        throw ConfigurationError(e.what());
    }
    const fs::path& root = scanner.getRootPath();

    m_last_stats.primary_root.clear();
    m_last_stats.related_roots.clear();
    if (!scanner.getPrimaryRoot().empty()) {
        m_last_stats.primary_root = scanner.getPrimaryRoot().lexically_relative(root).generic_string();
    }
    for (const auto& related : scanner.getRelatedRoots()) {
        m_last_stats.related_roots.push_back(related.lexically_relative(root).generic_string());
    }
}

std::vector<fs::path> ContentAssembler::resolveExplicitFiles(const std::string& root_path) {
    std::error_code ec;
    fs::path root = fs::weakly_canonical(fs::absolute(root_path, ec), ec);
    if (ec) {
        throw ConfigurationError("Cannot resolve root directory " + root_path + ": " + ec.message());
    }

    std::vector<fs::path> resolved;
    for (const auto& name : m_policy.explicit_files) {
        fs::path candidate = fs::path(name).is_absolute() ? fs::path(name) : root / name;
        fs::path canonical = fs::weakly_canonical(candidate, ec);
        if (ec) {
            throw ConfigurationError("Cannot resolve explicit file " + name + ": " + ec.message());
        }

        fs::path relative = canonical.lexically_relative(root);
        if (relative.empty() || *relative.begin() == "..") {
            throw ConfigurationError("Explicit file escapes the root directory: " + name);
        }
        if (!m_sys.fileExists(canonical.string())) {
            throw ConfigurationError("Explicit file not found: " + name);
        }
        resolved.push_back(canonical);
    }

    LOG_DEBUG("ContentAssembler", "Resolved " + std::to_string(resolved.size()) + " explicit files");
    return resolved;
}

std::vector<FileRecord> ContentAssembler::loadExplicitFiles(const std::string& root_path,
                                                            const std::vector<fs::path>& files) {
    std::vector<FileRecord> records;
    records.reserve(files.size());

    for (size_t i = 0; i < files.size(); ++i) {
        FileRecord record;
        record.path = files[i];
        record.display_path = displayPath(root_path, m_policy.explicit_files[i]);
        record.role = TreeRole::PRIMARY;
        if (loadFile(record, true)) {
            records.push_back(std::move(record));
        }
    }
    return records;
}

std::vector<FileRecord> ContentAssembler::loadWalkedFiles(const std::string& root_path) {
    std::vector<FileRecord> records;

    for (const auto& entry : m_entries) {
        if (entry.is_directory) {
            continue;
        }

        FileRecord record;
        record.path = entry.path;
        record.display_path = displayPath(root_path, entry.relative_path);
        record.role = entry.role;
        if (loadFile(record, false)) {
            records.push_back(std::move(record));
        }
    }
    return records;
}

bool ContentAssembler::loadFile(FileRecord& record, bool force_full) {
    const Summarizer* summarizer = m_summarizers.find(record.path);
    std::string extension = record.path.extension().string();

    if (record.role == TreeRole::RELATED && m_policy.skip_related &&
        !m_policy.isRelatedExtensionAllowed(extension)) {
        LOG_DEBUG("ContentAssembler", "Skipping related file " + record.display_path);
        m_last_stats.files_skipped_related++;
        return false;
    }

    try {
        if (force_full) {
            record.content = m_sys.readFile(record.path.string());
            record.mode = ContentMode::FULL;
        } else if (summarizer != nullptr && record.role == TreeRole::RELATED) {
            record.content = summarizer->summarize(m_sys.readFile(record.path.string()));
            record.mode = ContentMode::SUMMARIZED;
            m_last_stats.files_summarized++;
        } else if (summarizer != nullptr) {
            record.content = m_sys.readFile(record.path.string());
            record.mode = ContentMode::FULL;
        } else {
            bool truncated = false;
            record.content = m_sys.readLines(record.path.string(), m_policy.truncate_lines, truncated);
            if (truncated) {
                record.mode = ContentMode::TRUNCATED;
                m_last_stats.files_truncated++;
            } else {
                record.mode = ContentMode::FULL;
            }
        }
        record.tokens = TokenEstimator::estimate(record.content);
    } catch (const std::exception& e) {
        LOG_WARNING("ContentAssembler", "Error reading " + record.display_path + ": " + e.what());
        record.content = "Error reading " + record.display_path + ": " + e.what() + "\n";
        record.mode = ContentMode::READ_ERROR;
        record.tokens = 0;
        m_last_stats.read_errors++;
    }

    m_last_stats.files_included++;
    m_last_stats.tokens += record.tokens;
    return true;
}

std::string ContentAssembler::composeDocument(const std::vector<std::string>& tree_lines,
                                              const std::vector<FileRecord>& records) const {
    std::ostringstream document;

    document << m_template.preamble << "\n";

    if (m_policy.include_tree) {
        document << m_template.structure_open << "\n";
        for (const auto& line : tree_lines) {
            document << line << "\n";
        }
        document << m_template.structure_close << "\n\n";
    }

    document << m_template.files_open << "\n\n";
    for (const auto& record : records) {
        document << m_template.file_label << record.display_path << "\n";
        document << record.content << "\n";
    }
    document << m_template.files_close << "\n\n";

    document << m_template.input_close << "\n";
    document << m_template.task_open << "\n";
    document << sanitizeTask(m_policy.task, m_template.task_close) << "\n";
    document << m_template.task_close << "\n";

    return document.str();
}

std::string ContentAssembler::displayPath(const std::string& root_path, const fs::path& relative) const {
    return (fs::path(root_path) / relative).lexically_normal().generic_string();
}

} // namespace GenContext
