// include/cmg/collation/history_collator.hpp
#pragma once

#include <cstdint>
#include <vector>
#include "cmg/collation/batch.hpp"
#include "cmg/collation/batch_materializer.hpp"
#include "cmg/collation/collator_config.hpp"
#include "cmg/collation/turn_assembler.hpp"

namespace cmg {

// Turns a list of examples into a padded Batch:
// - diff_ids/diff_mask: diffs, right padded with diff_pad_id
// - msg_ids/msg_mask/msg_labels: history + current message, right padded;
//   labels hide history, separators, wrap tokens and padding
// - generation_ids/generation_mask: bos + history, left padded so that
//   generated tokens start in the same column for every row
class HistoryCollator {
public:
    explicit HistoryCollator(const CollatorConfig& config);

    Batch operator()(const std::vector<Example>& examples) const;

    // Per-example assembly only, in input order
    std::vector<AssembledExample> assemble_all(const std::vector<Example>& examples) const;

    // Random ids with correct shapes, for exercising a training loop without data
    Batch synthetic_batch(size_t batch_size, uint32_t seed = 42) const;

    const CollatorConfig& config() const { return assembler_.config(); }

private:
    TurnAssembler assembler_;
    size_t workers_;

    void log_batch(const Batch& batch) const;
};

} // namespace cmg
