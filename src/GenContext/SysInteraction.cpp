// =================================================================
// src/GenContext/SysInteraction.cpp
// =================================================================
// Implementation for file I/O.

#include "GenContext/SysInteraction.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <cerrno>
#include <cstring>
#include <sys/stat.h>

namespace GenContext {

static std::ifstream openForReading(const std::string& file_path) {
    errno = 0;
    std::ifstream file_stream(file_path, std::ios::binary);
    if (!file_stream) {
        std::string reason = errno != 0 ? std::strerror(errno) : "cannot open file";
        throw std::runtime_error(reason);
    }
    return file_stream;
}

std::string SysInteraction::readFile(const std::string& file_path) {
    std::ifstream file_stream = openForReading(file_path);

    std::stringstream buffer;
    buffer << file_stream.rdbuf();
    if (file_stream.bad()) {
        throw std::runtime_error("I/O error while reading");
    }

    std::string content = buffer.str();
    std::string problem = checkTextContent(content);
    if (!problem.empty()) {
        throw std::runtime_error(problem);
    }
    return content;
}

std::string SysInteraction::readLines(const std::string& file_path, size_t max_lines, bool& truncated) {
    std::ifstream file_stream = openForReading(file_path);

    std::string content;
    std::string line;
    size_t count = 0;
    truncated = false;

    while (count < max_lines && std::getline(file_stream, line)) {
        content += line;
        // getline only stops at end of file when the last line has no newline
        if (!file_stream.eof()) {
            content += '\n';
        }
        count++;
    }
    if (file_stream.bad()) {
        throw std::runtime_error("I/O error while reading");
    }
    if (count == max_lines && file_stream.peek() != std::ifstream::traits_type::eof()) {
        truncated = true;
    }

    std::string problem = checkTextContent(content);
    if (!problem.empty()) {
        throw std::runtime_error(problem);
    }
    return content;
}

bool SysInteraction::writeFile(const std::string& file_path, const std::string& content) {
    std::ofstream file_stream(file_path, std::ios::binary);
    if (!file_stream) {
        return false;
    }
    file_stream << content;
    return file_stream.good();
}

bool SysInteraction::fileExists(const std::string& file_path) {
    struct stat buffer;
    return (stat(file_path.c_str(), &buffer) == 0 && S_ISREG(buffer.st_mode));
}

bool SysInteraction::directoryExists(const std::string& dir_path) {
    struct stat buffer;
    return (stat(dir_path.c_str(), &buffer) == 0 && S_ISDIR(buffer.st_mode));
}

std::string SysInteraction::checkTextContent(const std::string& content) {
    size_t i = 0;
    while (i < content.size()) {
        unsigned char c = static_cast<unsigned char>(content[i]);

        if (c == 0) {
            return "binary content (NUL byte at offset " + std::to_string(i) + ")";
        }
        if (c < 0x80) {
            i++;
            continue;
        }

        size_t length = 0;
        unsigned int code_point = 0;
        if ((c & 0xE0) == 0xC0) {
            length = 2;
            code_point = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            length = 3;
            code_point = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            length = 4;
            code_point = c & 0x07;
        } else {
            return "invalid UTF-8 start byte at offset " + std::to_string(i);
        }

        if (i + length > content.size()) {
            return "truncated UTF-8 sequence at offset " + std::to_string(i);
        }
        for (size_t k = 1; k < length; ++k) {
            unsigned char cont = static_cast<unsigned char>(content[i + k]);
            if ((cont & 0xC0) != 0x80) {
                return "invalid UTF-8 continuation byte at offset " + std::to_string(i + k);
            }
            code_point = (code_point << 6) | (cont & 0x3F);
        }

        // Overlong encodings, surrogates and out-of-range code points
        static const unsigned int min_for_length[] = {0, 0, 0x80, 0x800, 0x10000};
        if (code_point < min_for_length[length] || code_point > 0x10FFFF ||
            (code_point >= 0xD800 && code_point <= 0xDFFF)) {
            return "invalid UTF-8 sequence at offset " + std::to_string(i);
        }
        i += length;
    }
    return "";
}

} // namespace GenContext
