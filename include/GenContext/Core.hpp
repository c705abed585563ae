// =================================================================
// include/GenContext/Core.hpp
// =================================================================
// Defines the application orchestrator.

#pragma once

#include "GenContext/CliParser.hpp"
#include <memory>
#include <string>

// Forward declarations to reduce header dependencies
namespace GenContext {
    class ConfigParser;
    class SysInteraction;
    struct AssemblyResult;
}

namespace GenContext {

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     * @param commands The parsed command-line arguments.
     */
    explicit Core(const Commands& commands);

    /**
     * @brief Destructor must be declared here and defined in the .cpp file.
     * This is required because we are using unique_ptr with forward-declared types.
     */
    ~Core();

    /**
     * @brief Loads the configuration, assembles the document and writes it out.
     * @return 0 on success, 1 on a configuration error or when the output cannot be written.
     */
    int run();

private:
    void configureLogging() const;
    std::string resolveConfigPath() const;
    int writeDocument(const AssemblyResult& result) const;
    bool writeStats(const AssemblyResult& result) const;

    const Commands& m_commands;
    std::unique_ptr<ConfigParser> m_config;
    std::unique_ptr<SysInteraction> m_sys;
};

} // namespace GenContext
