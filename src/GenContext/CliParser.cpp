// =================================================================
// src/GenContext/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "GenContext/CliParser.hpp"

namespace GenContext {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>(
        "generate_context: assemble a directory tree and file contents into one prompt document.");

    m_app->add_option("root", m_commands.root_path, "Root directory of the repository (default: .)")
        ->check(CLI::ExistingDirectory);

    setupSelectionOptions(*m_app);
    setupRenderingOptions(*m_app);
    setupOutputOptions(*m_app);

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::setupSelectionOptions(CLI::App& app) {
    app.add_option("-f,--file", m_commands.explicit_files,
                   "Include only these files (relative to root); skips the directory walk");
    app.add_option("-x,--exclude", m_commands.excluded_names,
                   "File names that are always excluded");
    app.add_flag("--skip-related", m_commands.skip_related,
                 "Drop files of nested repositories instead of summarizing them");
    app.add_flag("--include-ignored", m_commands.include_ignored,
                 "Include hidden files and files matched by ignore rules");
}

void CliParser::setupRenderingOptions(CLI::App& app) {
    app.add_flag("--no-tree", m_commands.no_tree, "Omit the repository structure block");
    app.add_flag("--omit-self", m_commands.omit_self,
                 "Drop 'self' parameters from summarized signatures");
    app.add_flag("--unsorted", m_commands.unsorted,
                 "Keep raw directory-listing order instead of sorting entries");
    app.add_option("-t,--task", m_commands.task, "Text placed inside the <task> block")
        ->each([this](const std::string&) { m_commands.task_given = true; });
}

void CliParser::setupOutputOptions(CLI::App& app) {
    app.add_option("-o,--output", m_commands.output_path, "Output file (default: stdout)");
    app.add_option("--config", m_commands.config_path,
                   "Configuration file (default: <root>/.gencontext.yml)");
    app.add_option("--stats", m_commands.stats_path, "Write run statistics as JSON to this file");
    app.add_option("--log-dir", m_commands.log_dir, "Also write log files into this directory");
    app.add_flag("-v,--verbose", m_commands.verbose, "Enable debug logging");
}

} // namespace GenContext
