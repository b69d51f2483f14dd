// include/cmg/data/example.hpp
#pragma once

#include <cstdint>
#include <utility>
#include <vector>
#include <cereal/types/vector.hpp>

namespace cmg {

using TokenID = int32_t;
using TokenSequence = std::vector<TokenID>;

// One training row: a tokenized diff, the commit message being predicted and
// the author's earlier messages ordered oldest to newest.
struct Example {
    TokenSequence context_tokens;
    TokenSequence current_tokens;
    std::vector<TokenSequence> history_tokens;

    Example() = default;
    Example(TokenSequence context, TokenSequence current,
            std::vector<TokenSequence> history = {})
        : context_tokens(std::move(context)),
          current_tokens(std::move(current)),
          history_tokens(std::move(history)) {}

    template <class Archive>
    void serialize(Archive& archive) {
        archive(
            cereal::make_nvp("context_tokens", context_tokens),
            cereal::make_nvp("current_tokens", current_tokens),
            cereal::make_nvp("history_tokens", history_tokens)
        );
    }
};

// Result of merging history into one example.
// training_ids and training_labels always have the same length.
struct AssembledExample {
    TokenSequence training_ids;
    TokenSequence training_labels;
    TokenSequence generation_prompt_ids;
};

} // namespace cmg
