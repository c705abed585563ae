// =================================================================
// include/GenContext/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <memory>
#include <string>
#include <vector>

namespace GenContext {

// A simple struct to hold parsed command information.
struct Commands {
    std::string root_path = ".";
    std::string output_path;        // Empty: write the document to stdout
    std::string config_path;        // Empty: <root>/.gencontext.yml
    std::string stats_path;         // Empty: no JSON statistics report
    std::string log_dir;            // Empty: console logging only

    // Selection
    std::vector<std::string> explicit_files;
    std::vector<std::string> excluded_names;
    bool skip_related = false;
    bool include_ignored = false;

    // Rendering
    bool no_tree = false;
    bool omit_self = false;
    bool unsorted = false;
    std::string task;
    bool task_given = false;

    bool verbose = false;
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all CLI options and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    /**
     * @brief Retrieves the parsed command data.
     * @return A const reference to the Commands struct.
     */
    const Commands& getCommands() const;

private:
    void setupSelectionOptions(CLI::App& app);
    void setupRenderingOptions(CLI::App& app);
    void setupOutputOptions(CLI::App& app);

    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
};

} // namespace GenContext
