// =================================================================
// src/GenContext/AssemblyPolicy.cpp
// =================================================================
// Implementation for assembly configuration management.

#include "GenContext/AssemblyPolicy.hpp"
#include "GenContext/ConfigParser.hpp"
#include "GenContext/CliParser.hpp"
#include "GenContext/Logger.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <stdexcept>
#include <cctype>

namespace GenContext {

static bool parseBool(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == "true" || lower == "1" || lower == "yes" || lower == "on";
}

static void loadBool(const ConfigParser& config, const std::string& key, bool& target) {
    if (config.hasValue(key)) {
        target = parseBool(config.getStringValue(key));
    }
}

static void loadString(const ConfigParser& config, const std::string& key, std::string& target) {
    std::string value = config.getStringValue(key);
    if (!value.empty()) {
        target = value;
    }
}

void AssemblyPolicy::loadFromConfig(const ConfigParser& config) {
    loadBool(config, "skip_related", skip_related);
    loadBool(config, "include_ignored", include_ignored);
    loadBool(config, "include_tree", include_tree);
    loadBool(config, "sort_entries", sort_entries);
    loadBool(config, "omit_self", omit_self_parameter);

    loadString(config, "ignore_file", ignore_file_name);
    loadString(config, "hidden_prefix", hidden_prefix);
    loadString(config, "task", task);

    std::string truncate_str = config.getStringValue("truncate_lines");
    if (!truncate_str.empty()) {
        try {
            truncate_lines = std::stoul(truncate_str);
        } catch (const std::exception&) {
            LOG_WARNING("Config", "Invalid truncate_lines value '" + truncate_str + "', using default");
        }
    }

    auto excluded = config.getListValue("exclude");
    excluded_names.insert(excluded_names.end(), excluded.begin(), excluded.end());

    if (config.hasValue("related_allowed_extensions")) {
        related_allowed_extensions = config.getListValue("related_allowed_extensions");
    }
}

void AssemblyPolicy::applyCommandOverrides(const Commands& commands) {
    if (commands.skip_related) {
        skip_related = true;
    }
    if (commands.include_ignored) {
        include_ignored = true;
    }
    if (commands.no_tree) {
        include_tree = false;
    }
    if (commands.omit_self) {
        omit_self_parameter = true;
    }
    if (commands.unsorted) {
        sort_entries = false;
    }
    if (commands.task_given) {
        task = commands.task;
    }
    if (!commands.explicit_files.empty()) {
        explicit_files = commands.explicit_files;
    }
    excluded_names.insert(excluded_names.end(),
                          commands.excluded_names.begin(), commands.excluded_names.end());
}

bool AssemblyPolicy::validate() const {
    bool valid = true;

    if (truncate_lines == 0) {
        LOG_ERROR("Config", "truncate_lines must be greater than 0");
        valid = false;
    }

    if (ignore_file_name.empty() || ignore_file_name.find('/') != std::string::npos) {
        LOG_ERROR("Config", "ignore_file must be a plain file name");
        valid = false;
    }

    if (hidden_prefix.empty()) {
        LOG_ERROR("Config", "hidden_prefix cannot be empty");
        valid = false;
    }

    return valid;
}

bool AssemblyPolicy::isRelatedExtensionAllowed(const std::string& extension) const {
    return std::find(related_allowed_extensions.begin(), related_allowed_extensions.end(),
                     extension) != related_allowed_extensions.end();
}

PromptTemplate PromptTemplate::defaults() {
    PromptTemplate tmpl;
    tmpl.preamble = R"(You are an experienced software engineer working inside an existing repository.
The repository is provided below as context. Files of the main repository are
included in full; files of related repositories nested inside it are reduced to
their declarations (signatures, base classes, fields and docstrings) so that you
can see which APIs are available without their implementation.

Instructions:
1. Read the repository structure and the file contents to understand the
   architecture, conventions and existing abstractions.
2. Reuse existing functions and classes instead of re-implementing them.
3. Write clean, documented code that fits the style of the repository.
4. Solve the task given at the end of this document.

<input>)";
    return tmpl;
}

bool PromptTemplate::loadFromConfig(const ConfigParser& config) {
    std::string preamble_file = config.getStringValue("preamble_file");
    if (preamble_file.empty()) {
        return true;
    }

    std::ifstream file(preamble_file);
    if (!file.is_open()) {
        LOG_ERROR("Config", "Cannot read preamble_file: " + preamble_file);
        return false;
    }
    std::ostringstream content;
    content << file.rdbuf();
    preamble = content.str();
    while (!preamble.empty() && (preamble.back() == '\n' || preamble.back() == '\r')) {
        preamble.pop_back();
    }
    return true;
}

} // namespace GenContext
