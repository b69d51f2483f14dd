// include/cmg/collation/turn_assembler.hpp
#pragma once

#include <cstddef>
#include "cmg/collation/collator_config.hpp"
#include "cmg/data/example.hpp"

namespace cmg {

// Merges an author's most recent messages in front of the current message
// under the max_len budget.
//
// Layout of the produced sequences (bos/eos only when wrapping):
//   training_ids:          [bos] h_k sep ... h_n sep cur [eos]
//   training_labels:       [ign] ign ... ign ... ign cur [ign]
//   generation_prompt_ids: bos h_k sep ... h_n sep
//
// History is consumed newest first and merging stops at the first turn that
// does not fit, so the merged turns are always a contiguous suffix.
class TurnAssembler {
public:
    explicit TurnAssembler(const CollatorConfig& config);

    AssembledExample assemble(const Example& example) const;

    // Number of newest history turns that fit next to a current message of
    // current_len tokens (wrap tokens included)
    size_t count_mergeable_turns(const Example& example, size_t current_len) const;

    const CollatorConfig& config() const { return config_; }

private:
    CollatorConfig config_;

    void check_tokens(const TokenSequence& tokens, const char* field) const;
};

} // namespace cmg
