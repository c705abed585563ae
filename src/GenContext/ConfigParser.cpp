// =================================================================
// src/GenContext/ConfigParser.cpp
// =================================================================
// Implementation for the flat key/value configuration parser.

#include "GenContext/ConfigParser.hpp"
#include <fstream>
#include <sstream>

namespace GenContext {

// Helper function to trim whitespace from both ends of a string.
static std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\n\r");
    if (std::string::npos == first) {
        return "";
    }
    size_t last = s.find_last_not_of(" \t\n\r");
    return s.substr(first, (last - first + 1));
}

// Removes one pair of matching surrounding quotes.
static std::string unquote(const std::string& s) {
    if (s.size() >= 2 && (s.front() == '\'' || s.front() == '"') && s.back() == s.front()) {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

ConfigParser::ConfigParser(const std::string& config_path)
    : m_config_path(config_path)
{
    std::ifstream config_file(config_path);
    if (!config_file.is_open()) {
        return;
    }
    m_loaded = true;

    std::string line;
    while (std::getline(config_file, line)) {
        std::string trimmed = trim(line);
        // Ignore comments and empty lines
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }

        size_t delimiter_pos = trimmed.find(':');
        if (delimiter_pos != std::string::npos) {
            std::string key = trim(trimmed.substr(0, delimiter_pos));
            std::string value = trim(trimmed.substr(delimiter_pos + 1));
            m_config_values[key] = unquote(value);
        }
    }
}

std::string ConfigParser::getStringValue(const std::string& key) const {
    auto it = m_config_values.find(key);
    if (it != m_config_values.end()) {
        return it->second;
    }
    return "";
}

std::vector<std::string> ConfigParser::getListValue(const std::string& key) const {
    std::vector<std::string> items;
    std::istringstream stream(getStringValue(key));
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = unquote(trim(item));
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

bool ConfigParser::hasValue(const std::string& key) const {
    return m_config_values.find(key) != m_config_values.end();
}

} // namespace GenContext
