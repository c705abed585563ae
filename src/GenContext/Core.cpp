// =================================================================
// src/GenContext/Core.cpp
// =================================================================
// Implementation for the application orchestrator.

#include "GenContext/Core.hpp"
#include "GenContext/ConfigParser.hpp"
#include "GenContext/AssemblyPolicy.hpp"
#include "GenContext/ContentAssembler.hpp"
#include "GenContext/SysInteraction.hpp"
#include "GenContext/Logger.hpp"
#include "nlohmann/json.hpp"
#include <iostream>
#include <filesystem>
#include <chrono>

namespace GenContext {

static const char* const kDefaultConfigName = ".gencontext.yml";

Core::Core(const Commands& commands)
    : m_commands(commands),
      m_sys(std::make_unique<SysInteraction>())
{
    m_config = std::make_unique<ConfigParser>(resolveConfigPath());
}

Core::~Core() = default;

int Core::run() {
    auto start_time = std::chrono::steady_clock::now();

    configureLogging();
    Logger& logger = Logger::getInstance();
    logger.logSessionStart(m_commands.root_path);

    int exit_code = 0;
    auto finish = [&](int code) {
        auto end_time = std::chrono::steady_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
        logger.logSessionEnd(code, duration.count());
        logger.flush();
        return code;
    };

    // An explicitly named configuration file must exist
    if (!m_commands.config_path.empty() && !m_config->isLoaded()) {
        LOG_ERROR("Core", "Configuration file not found: " + m_commands.config_path);
        return finish(1);
    }
    if (m_config->isLoaded()) {
        LOG_DEBUG("Core", "Loaded configuration from " + m_config->getPath());
    }

    AssemblyPolicy policy;
    policy.loadFromConfig(*m_config);
    policy.applyCommandOverrides(m_commands);
    if (!policy.validate()) {
        return finish(1);
    }

    PromptTemplate prompt_template = PromptTemplate::defaults();
    if (!prompt_template.loadFromConfig(*m_config)) {
        return finish(1);
    }

    ContentAssembler assembler(policy, prompt_template);
    AssemblyResult result;
    try {
        result = assembler.assemble(m_commands.root_path);
    } catch (const ConfigurationError& e) {
        LOG_ERROR("Core", e.what());
        return finish(1);
    }

    exit_code = writeDocument(result);
    if (exit_code == 0 && !writeStats(result)) {
        exit_code = 1;
    }
    return finish(exit_code);
}

void Core::configureLogging() const {
    Logger& logger = Logger::getInstance();
    if (m_commands.verbose) {
        logger.setConsoleLogLevel(LogLevel::DEBUG);
    }
    if (!m_commands.log_dir.empty()) {
        logger.enableFileLogging(m_commands.log_dir);
    }
}

std::string Core::resolveConfigPath() const {
    if (!m_commands.config_path.empty()) {
        return m_commands.config_path;
    }
    return (std::filesystem::path(m_commands.root_path) / kDefaultConfigName).string();
}

int Core::writeDocument(const AssemblyResult& result) const {
    if (m_commands.output_path.empty()) {
        std::cout << result.text << std::flush;
        if (!std::cout) {
            LOG_ERROR("Core", "Failed to write the document to stdout");
            return 1;
        }
        return 0;
    }

    if (!m_sys->writeFile(m_commands.output_path, result.text)) {
        LOG_ERROR("Core", "Failed to write output file: " + m_commands.output_path);
        return 1;
    }
    LOG_INFO("Core", "Context written to " + m_commands.output_path);
    return 0;
}

bool Core::writeStats(const AssemblyResult& result) const {
    if (m_commands.stats_path.empty()) {
        return true;
    }

    const AssemblyStats& stats = result.stats;
    nlohmann::json report = {
        {"files", stats.files_included},
        {"summarized", stats.files_summarized},
        {"truncated", stats.files_truncated},
        {"skipped_related", stats.files_skipped_related},
        {"read_errors", stats.read_errors},
        {"tokens", result.token_count},
        {"primary_root", stats.primary_root},
        {"related_roots", stats.related_roots}
    };

    if (!m_sys->writeFile(m_commands.stats_path, report.dump(2) + "\n")) {
        LOG_ERROR("Core", "Failed to write statistics file: " + m_commands.stats_path);
        return false;
    }
    LOG_DEBUG("Core", "Statistics written to " + m_commands.stats_path);
    return true;
}

} // namespace GenContext
