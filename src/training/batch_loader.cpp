// src/training/batch_loader.cpp
#include "cmg/training/batch_loader.hpp"
#include "cmg/errors.hpp"
#include <algorithm>
#include <iostream>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace cmg {

BatchLoader::BatchLoader(std::vector<Example> examples, const HistoryCollator& collator,
                         size_t batch_size, bool shuffle, uint32_t seed)
    : examples_(std::move(examples)), collator_(collator), batch_size_(batch_size),
      shuffle_(shuffle), rng_(seed), current_index_(0) {
    if (batch_size_ == 0) {
        throw ConfigurationError("batch_size must be positive");
    }

    order_.resize(examples_.size());
    reorder();

    if (collator_.config().debug_logging) {
        std::cout << "[LOADER] " << examples_.size() << " examples, "
                  << num_batches() << " batches of up to " << batch_size_ << std::endl;
    }
}

void BatchLoader::reorder() {
    std::iota(order_.begin(), order_.end(), 0);
    if (shuffle_) {
        std::shuffle(order_.begin(), order_.end(), rng_);
    }
}

bool BatchLoader::has_next() const {
    return current_index_ < examples_.size();
}

Batch BatchLoader::next_batch() {
    if (!has_next()) {
        throw std::out_of_range("No more batches available");
    }

    size_t end_index = std::min(current_index_ + batch_size_, examples_.size());

    std::vector<Example> chunk;
    chunk.reserve(end_index - current_index_);
    for (size_t i = current_index_; i < end_index; i++) {
        chunk.push_back(examples_[order_[i]]);
    }

    current_index_ = end_index;
    return collator_(chunk);
}

void BatchLoader::reset() {
    current_index_ = 0;
    reorder();
}

size_t BatchLoader::num_batches() const {
    return (examples_.size() + batch_size_ - 1) / batch_size_;
}

} // namespace cmg
