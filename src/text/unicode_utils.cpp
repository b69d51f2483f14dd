// src/text/unicode_utils.cpp
#include "cmg/text/unicode_utils.hpp"
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utf8.h>

namespace cmg::unicode {

bool is_whitespace(uint32_t codepoint) {
    // Information separators U+001C..U+001F also split tokens
    if (codepoint >= 0x1C && codepoint <= 0x1F) {
        return true;
    }
    return u_isUWhiteSpace(static_cast<UChar32>(codepoint));
}

std::vector<std::string> split_whitespace(const std::string& text) {
    std::vector<std::string> pieces;
    const auto* data = reinterpret_cast<const uint8_t*>(text.data());
    const int32_t length = static_cast<int32_t>(text.size());

    int32_t i = 0;
    int32_t piece_start = -1;
    while (i < length) {
        int32_t start = i;
        UChar32 codepoint;
        U8_NEXT(data, i, length, codepoint);

        // Invalid bytes are kept as part of the current piece
        bool space = codepoint >= 0 && is_whitespace(static_cast<uint32_t>(codepoint));
        if (space) {
            if (piece_start >= 0) {
                pieces.emplace_back(text, piece_start, start - piece_start);
                piece_start = -1;
            }
        } else if (piece_start < 0) {
            piece_start = start;
        }
    }

    if (piece_start >= 0) {
        pieces.emplace_back(text, piece_start, length - piece_start);
    }

    return pieces;
}

} // namespace cmg::unicode
