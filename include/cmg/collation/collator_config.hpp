// include/cmg/collation/collator_config.hpp
#pragma once

#include <cstddef>
#include <iostream>
#include "cmg/data/example.hpp"

namespace cmg {

// Ids owned by the target (message) tokenizer
struct SpecialTokens {
    TokenID bos_id = 50256;
    TokenID eos_id = 50256;
    TokenID pad_id = 50256;
    TokenID ignore_label = -100;  // Excluded from the loss, outside the vocabulary
};

struct CollatorConfig {
    // Budget for the assembled message sequence
    int max_len = 512;

    // Inserted after every merged history turn
    TokenSequence separator;

    SpecialTokens target_tokens;

    // Pad id of the source (diff) tokenizer
    TokenID diff_pad_id = 1;

    bool include_history = true;
    bool emit_generation_prompt = true;

    // Surround the message with bos/eos (two budget slots)
    bool wrap_special_tokens = false;

    // Concurrent assembly tasks per batch; 0 picks the hardware concurrency
    size_t num_workers = 1;

    bool debug_logging = false;

    // Throws ConfigurationError when no batch could be built from these settings
    void validate() const;

    size_t reserved_slots() const { return wrap_special_tokens ? 2 : 0; }

    void print(std::ostream& out = std::cout) const;
};

} // namespace cmg
