// src/collation/padder.cpp
#include "cmg/collation/padder.hpp"
#include "cmg/errors.hpp"
#include <algorithm>
#include <utility>

namespace cmg {

PaddedField pad(const std::vector<TokenSequence>& sequences, PadSide side,
                TokenID fill_value, bool require_content) {
    if (sequences.empty()) {
        throw ConfigurationError("cannot pad an empty list of sequences");
    }

    size_t target_len = 0;
    for (const auto& seq : sequences) {
        target_len = std::max(target_len, seq.size());
    }

    if (require_content && target_len == 0) {
        throw ConfigurationError("every sequence of the field is empty");
    }

    PaddedField field;
    field.ids.reserve(sequences.size());
    field.masks.reserve(sequences.size());

    for (const auto& seq : sequences) {
        const size_t fill = target_len - seq.size();

        TokenSequence ids;
        TokenSequence mask;
        ids.reserve(target_len);
        mask.reserve(target_len);

        if (side == PadSide::LEFT) {
            ids.assign(fill, fill_value);
            mask.assign(fill, 0);
            ids.insert(ids.end(), seq.begin(), seq.end());
            mask.resize(target_len, 1);
        } else {
            ids.assign(seq.begin(), seq.end());
            mask.assign(seq.size(), 1);
            ids.resize(target_len, fill_value);
            mask.resize(target_len, 0);
        }

        field.ids.push_back(std::move(ids));
        field.masks.push_back(std::move(mask));
    }

    return field;
}

} // namespace cmg
