// include/cmg/collation/padder.hpp
#pragma once

#include <vector>
#include "cmg/data/example.hpp"

namespace cmg {

enum class PadSide {
    LEFT,   // fill before content, keeps the last real token in the last column
    RIGHT   // fill after content
};

// One logical field after padding: every row has the field's max length and a
// parallel 0/1 mask (1 = real token).
struct PaddedField {
    std::vector<TokenSequence> ids;
    std::vector<TokenSequence> masks;

    size_t rows() const { return ids.size(); }
    size_t width() const { return ids.empty() ? 0 : ids.front().size(); }
};

// Pads every sequence to the longest sequence of this field only.
// Throws ConfigurationError when sequences is empty, or when require_content
// is set and every sequence is empty.
PaddedField pad(const std::vector<TokenSequence>& sequences, PadSide side,
                TokenID fill_value, bool require_content = false);

} // namespace cmg
