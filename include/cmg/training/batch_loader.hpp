// include/cmg/training/batch_loader.hpp
#pragma once

#include <cstdint>
#include <random>
#include <vector>
#include "cmg/collation/history_collator.hpp"
#include "cmg/data/example.hpp"

namespace cmg {

// Walks an in-memory example set in batch_size chunks and collates each chunk.
// Holds its own copy of the collator.
class BatchLoader {
public:
    BatchLoader(std::vector<Example> examples, const HistoryCollator& collator,
                size_t batch_size, bool shuffle = false, uint32_t seed = 42);

    bool has_next() const;
    Batch next_batch();

    // Rewinds; reshuffles when shuffling is enabled
    void reset();
    size_t num_batches() const;
    size_t num_examples() const { return examples_.size(); }

private:
    std::vector<Example> examples_;
    HistoryCollator collator_;
    size_t batch_size_;
    bool shuffle_;
    std::mt19937 rng_;
    std::vector<size_t> order_;
    size_t current_index_;

    void reorder();
};

} // namespace cmg
