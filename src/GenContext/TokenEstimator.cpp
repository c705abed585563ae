// =================================================================
// src/GenContext/TokenEstimator.cpp
// =================================================================
// Implementation for the word-run token approximation.

#include "GenContext/TokenEstimator.hpp"
#include <cctype>
#include <cstdint>

namespace GenContext {

// Punctuation and symbol blocks whose code points are not word characters
static bool isSymbolCodePoint(uint32_t cp) {
    if (cp >= 0xA0 && cp <= 0xBF) {
        // Latin-1 punctuation, except ª ² ³ µ ¹ º ¼ ½ ¾
        return cp != 0xAA && cp != 0xB2 && cp != 0xB3 && cp != 0xB5 &&
               cp != 0xB9 && cp != 0xBA && (cp < 0xBC || cp > 0xBE);
    }
    return cp == 0xD7 || cp == 0xF7 ||
           (cp >= 0x2000 && cp <= 0x206F) ||   // General punctuation
           (cp >= 0x20A0 && cp <= 0x20CF) ||   // Currency symbols
           (cp >= 0x2190 && cp <= 0x23FF) ||   // Arrows, math operators, technical
           (cp >= 0x2500 && cp <= 0x27BF) ||   // Box drawing through dingbats
           (cp >= 0x2900 && cp <= 0x2BFF) ||   // Supplemental arrows and symbols
           (cp >= 0x3000 && cp <= 0x303F) ||   // CJK punctuation
           (cp >= 0xFE30 && cp <= 0xFE4F) ||
           (cp >= 0xFF00 && cp <= 0xFF0F) ||   // Fullwidth punctuation
           (cp >= 0x1F000 && cp <= 0x1FAFF);   // Emoji and pictographs
}

/**
 * @brief Decode one UTF-8 sequence starting at pos
 * @return Sequence length; a malformed sequence counts as one byte
 */
static size_t decodeAt(const std::string& text, size_t pos, uint32_t& cp) {
    unsigned char lead = static_cast<unsigned char>(text[pos]);
    size_t length = lead >= 0xF0 ? 4 : lead >= 0xE0 ? 3 : lead >= 0xC0 ? 2 : 1;
    cp = lead & (length == 4 ? 0x07 : length == 3 ? 0x0F : length == 2 ? 0x1F : 0xFF);
    if (length == 1 || pos + length > text.size()) {
        return 1;
    }
    for (size_t i = 1; i < length; ++i) {
        unsigned char next = static_cast<unsigned char>(text[pos + i]);
        if ((next & 0xC0) != 0x80) {
            cp = lead;
            return 1;
        }
        cp = (cp << 6) | (next & 0x3F);
    }
    return length;
}

size_t TokenEstimator::estimate(const std::string& text) {
    size_t tokens = 0;
    bool in_word = false;

    size_t pos = 0;
    while (pos < text.size()) {
        unsigned char c = static_cast<unsigned char>(text[pos]);
        bool word;
        if (c < 0x80) {
            word = std::isalnum(c) || c == '_';
            pos++;
        } else {
            uint32_t cp = 0;
            pos += decodeAt(text, pos, cp);
            word = !isSymbolCodePoint(cp);
        }

        if (word && !in_word) {
            tokens++;
        }
        in_word = word;
    }

    return tokens;
}

} // namespace GenContext
