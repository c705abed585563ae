// =================================================================
// include/GenContext/SysInteraction.hpp
// =================================================================
// Defines the interface for file I/O used by the assembler and the CLI.

#pragma once

#include <string>

namespace GenContext {

class SysInteraction {
public:
    /**
     * @brief Reads the entire content of a file into a string.
     * @param file_path The path to the file.
     * @return The content of the file. Throws std::runtime_error on failure,
     *         including content that is not UTF-8 text.
     */
    std::string readFile(const std::string& file_path);

    /**
     * @brief Reads at most max_lines lines of a text file.
     * @param file_path The path to the file.
     * @param max_lines Line limit; line endings are kept.
     * @param truncated Set to true if the file had more lines.
     * @return The leading lines. Throws std::runtime_error on failure.
     */
    std::string readLines(const std::string& file_path, size_t max_lines, bool& truncated);

    /**
     * @brief Writes content to a file, overwriting it.
     * @param file_path The path to the file.
     * @param content The content to write.
     * @return True on success, false on failure.
     */
    bool writeFile(const std::string& file_path, const std::string& content);

    /**
     * @brief Checks if a file exists.
     */
    bool fileExists(const std::string& file_path);

    /**
     * @brief Checks if a directory exists.
     */
    bool directoryExists(const std::string& dir_path);

    /**
     * @brief Check that content looks like text
     * @return An empty string for text, otherwise the reason it is not
     */
    static std::string checkTextContent(const std::string& content);
};

} // namespace GenContext
