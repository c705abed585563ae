// =================================================================
// include/GenContext/Summarizer.hpp
// =================================================================
// Interface for language-specific declaration digests.

#pragma once

#include <memory>
#include <string>
#include <vector>
#include <filesystem>

namespace GenContext {

/**
 * @brief Produces a structural digest of one language's source text
 *
 * A digest keeps declaration signatures, base types, documentation and
 * field declarations and drops every body. Implementations never throw
 * on malformed input: they return a one-line error marker instead.
 */
class Summarizer {
public:
    virtual ~Summarizer() = default;

    /**
     * @brief Short language name (e.g., "python")
     */
    virtual std::string name() const = 0;

    /**
     * @brief Whether this summarizer handles a file
     * @param path File path; only the extension is inspected
     */
    virtual bool supports(const std::filesystem::path& path) const = 0;

    /**
     * @brief Build the digest of a source text
     * @param source_text Complete file content
     * @return Digest lines joined by '\n', or an error marker line
     */
    virtual std::string summarize(const std::string& source_text) const = 0;
};

/**
 * @brief Looks up the summarizer for a file, if any
 */
class SummarizerRegistry {
public:
    void add(std::unique_ptr<Summarizer> summarizer);

    /**
     * @brief Find the first registered summarizer supporting a path
     * @return The summarizer, or nullptr for files outside every language
     */
    const Summarizer* find(const std::filesystem::path& path) const;

    /**
     * @brief A file is a source file when some summarizer supports it
     */
    bool isSourceFile(const std::filesystem::path& path) const { return find(path) != nullptr; }

    size_t size() const { return m_summarizers.size(); }

private:
    std::vector<std::unique_ptr<Summarizer>> m_summarizers;
};

} // namespace GenContext
