// =================================================================
// include/GenContext/TokenEstimator.hpp
// =================================================================
// Header for the word-run token approximation.

#pragma once

#include <string>

namespace GenContext {

/**
 * @brief Crude token count: maximal runs of word characters
 *
 * Word characters are ASCII letters, digits, '_' and non-ASCII code
 * points outside the common punctuation and symbol blocks, so dashes,
 * arrows and currency signs separate words. This is a size signal,
 * not a tokenizer.
 */
class TokenEstimator {
public:
    static size_t estimate(const std::string& text);
};

} // namespace GenContext
