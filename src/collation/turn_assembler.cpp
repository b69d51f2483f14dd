// src/collation/turn_assembler.cpp
#include "cmg/collation/turn_assembler.hpp"
#include "cmg/errors.hpp"
#include <algorithm>
#include <string>

namespace cmg {

TurnAssembler::TurnAssembler(const CollatorConfig& config) : config_(config) {
    config_.validate();
}

void TurnAssembler::check_tokens(const TokenSequence& tokens, const char* field) const {
    for (size_t i = 0; i < tokens.size(); i++) {
        if (tokens[i] < 0) {
            throw InvalidInput(std::string(field) + " holds negative token id " +
                               std::to_string(tokens[i]) + " at position " + std::to_string(i));
        }
    }
}

size_t TurnAssembler::count_mergeable_turns(const Example& example, size_t current_len) const {
    if (!config_.include_history) {
        return 0;
    }

    const size_t budget = static_cast<size_t>(config_.max_len);
    const size_t sep_len = config_.separator.size();
    size_t merged = 0;

    for (auto turn = example.history_tokens.rbegin(); turn != example.history_tokens.rend(); ++turn) {
        size_t extra = turn->size() + sep_len;
        if (current_len + extra > budget) {
            break;
        }
        current_len += extra;
        merged++;
    }

    return merged;
}

AssembledExample TurnAssembler::assemble(const Example& example) const {
    check_tokens(example.context_tokens, "context_tokens");
    check_tokens(example.current_tokens, "current_tokens");
    for (const auto& turn : example.history_tokens) {
        check_tokens(turn, "history_tokens");
    }

    const auto& special = config_.target_tokens;
    const auto& sep = config_.separator;
    const bool wrap = config_.wrap_special_tokens;

    const size_t budget = static_cast<size_t>(config_.max_len);
    const size_t reserved = config_.reserved_slots();
    const size_t keep = std::min(example.current_tokens.size(), budget - reserved);

    const size_t merged = count_mergeable_turns(example, keep + reserved);
    const size_t first_turn = example.history_tokens.size() - merged;

    size_t history_len = 0;
    for (size_t i = first_turn; i < example.history_tokens.size(); i++) {
        history_len += example.history_tokens[i].size() + sep.size();
    }

    AssembledExample out;
    out.training_ids.reserve(reserved + history_len + keep);
    out.training_labels.reserve(reserved + history_len + keep);

    if (wrap) {
        out.training_ids.push_back(special.bos_id);
        out.training_labels.push_back(special.ignore_label);
    }

    // Oldest merged turn first; every history position is hidden from the loss
    for (size_t i = first_turn; i < example.history_tokens.size(); i++) {
        const auto& turn = example.history_tokens[i];
        out.training_ids.insert(out.training_ids.end(), turn.begin(), turn.end());
        out.training_ids.insert(out.training_ids.end(), sep.begin(), sep.end());
    }
    out.training_labels.resize(out.training_labels.size() + history_len, special.ignore_label);

    auto current_end = example.current_tokens.begin() + static_cast<std::ptrdiff_t>(keep);
    out.training_ids.insert(out.training_ids.end(), example.current_tokens.begin(), current_end);
    out.training_labels.insert(out.training_labels.end(), example.current_tokens.begin(), current_end);

    if (wrap) {
        out.training_ids.push_back(special.eos_id);
        out.training_labels.push_back(special.ignore_label);
    }

    if (config_.emit_generation_prompt) {
        out.generation_prompt_ids.reserve(1 + history_len);
        out.generation_prompt_ids.push_back(special.bos_id);
        for (size_t i = first_turn; i < example.history_tokens.size(); i++) {
            const auto& turn = example.history_tokens[i];
            out.generation_prompt_ids.insert(out.generation_prompt_ids.end(), turn.begin(), turn.end());
            out.generation_prompt_ids.insert(out.generation_prompt_ids.end(), sep.begin(), sep.end());
        }
    }

    return out;
}

} // namespace cmg
