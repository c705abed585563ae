// =================================================================
// include/GenContext/ConfigParser.hpp
// =================================================================
// Defines a simple parser for the .gencontext.yml file.

#pragma once

#include <string>
#include <vector>
#include <map>

namespace GenContext {

class ConfigParser {
public:
    /**
     * @brief Constructs the parser and loads the configuration file.
     * @param config_path The path to the configuration file.
     *
     * A missing file is not an error; every lookup then reports "not set".
     */
    explicit ConfigParser(const std::string& config_path);

    /**
     * @brief Retrieves a string value for a given key.
     * @param key The configuration key (e.g., "ignore_file").
     * @return The corresponding value, or an empty string if not found.
     */
    std::string getStringValue(const std::string& key) const;

    /**
     * @brief Retrieves a comma-separated list value.
     * @param key The configuration key (e.g., "exclude").
     * @return The trimmed, non-empty items; empty if the key is not set.
     */
    std::vector<std::string> getListValue(const std::string& key) const;

    bool hasValue(const std::string& key) const;

    /**
     * @brief Whether a configuration file was actually read.
     */
    bool isLoaded() const { return m_loaded; }

    const std::string& getPath() const { return m_config_path; }

private:
    std::string m_config_path;
    bool m_loaded = false;
    std::map<std::string, std::string> m_config_values;
};

} // namespace GenContext
