// =================================================================
// src/GenContext/Summarizer.cpp
// =================================================================
// Implementation for the summarizer registry.

#include "GenContext/Summarizer.hpp"
#include <utility>

namespace GenContext {

void SummarizerRegistry::add(std::unique_ptr<Summarizer> summarizer) {
    if (summarizer) {
        m_summarizers.push_back(std::move(summarizer));
    }
}

const Summarizer* SummarizerRegistry::find(const std::filesystem::path& path) const {
    for (const auto& summarizer : m_summarizers) {
        if (summarizer->supports(path)) {
            return summarizer.get();
        }
    }
    return nullptr;
}

} // namespace GenContext
