// src/collation/history_collator.cpp
#include "cmg/collation/history_collator.hpp"
#include "cmg/errors.hpp"
#include <algorithm>
#include <future>
#include <iostream>
#include <random>
#include <thread>
#include <utility>

namespace cmg {

namespace {

constexpr Eigen::Index kSyntheticDiffLen = 500;
constexpr int32_t kSyntheticVocab = 10;

} // anonymous namespace

HistoryCollator::HistoryCollator(const CollatorConfig& config)
    : assembler_(config),
      workers_(config.num_workers > 0 ? config.num_workers
                                      : std::max(1u, std::thread::hardware_concurrency())) {}

std::vector<AssembledExample> HistoryCollator::assemble_all(const std::vector<Example>& examples) const {
    std::vector<AssembledExample> assembled(examples.size());

    size_t threads = std::min(workers_, examples.size());
    if (threads <= 1) {
        for (size_t i = 0; i < examples.size(); i++) {
            assembled[i] = assembler_.assemble(examples[i]);
        }
        return assembled;
    }

    // Contiguous ranges, each task writes only its own slots
    size_t per_chunk = (examples.size() + threads - 1) / threads;
    std::vector<std::future<void>> jobs;
    for (size_t t = 0; t < threads; ++t) {
        size_t start = t * per_chunk;
        if (start >= examples.size()) break;
        size_t end = std::min(examples.size(), start + per_chunk);
        jobs.emplace_back(std::async(std::launch::async, [&, start, end]() {
            for (size_t i = start; i < end; ++i) {
                assembled[i] = assembler_.assemble(examples[i]);
            }
        }));
    }

    // Wait for every task before rethrowing so no task outlives the buffers
    for (auto& job : jobs) job.wait();
    for (auto& job : jobs) job.get();

    return assembled;
}

Batch HistoryCollator::operator()(const std::vector<Example>& examples) const {
    if (examples.empty()) {
        throw InvalidInput("cannot collate an empty list of examples");
    }

    const auto& cfg = config();
    auto assembled = assemble_all(examples);

    std::vector<TokenSequence> diff_rows;
    std::vector<TokenSequence> msg_rows;
    std::vector<TokenSequence> label_rows;
    std::vector<TokenSequence> generation_rows;
    diff_rows.reserve(examples.size());
    msg_rows.reserve(examples.size());
    label_rows.reserve(examples.size());
    generation_rows.reserve(examples.size());

    for (size_t i = 0; i < examples.size(); i++) {
        diff_rows.push_back(examples[i].context_tokens);
        msg_rows.push_back(std::move(assembled[i].training_ids));
        label_rows.push_back(std::move(assembled[i].training_labels));
        generation_rows.push_back(std::move(assembled[i].generation_prompt_ids));
    }

    PaddedFieldMap fields;
    fields[FieldName::DIFF_IDS] = pad(diff_rows, PadSide::RIGHT, cfg.diff_pad_id);
    fields[FieldName::MSG_IDS] = pad(msg_rows, PadSide::RIGHT, cfg.target_tokens.pad_id);
    fields[FieldName::MSG_LABELS] = pad(label_rows, PadSide::RIGHT, cfg.target_tokens.ignore_label);
    if (cfg.emit_generation_prompt) {
        fields[FieldName::GENERATION_IDS] = pad(generation_rows, PadSide::LEFT,
                                                cfg.target_tokens.pad_id, true);
    }

    Batch batch = materialize(fields);

    if (cfg.debug_logging) {
        log_batch(batch);
    }

    return batch;
}

Batch HistoryCollator::synthetic_batch(size_t batch_size, uint32_t seed) const {
    if (batch_size == 0) {
        throw InvalidInput("synthetic batch needs at least one row");
    }

    const auto& cfg = config();
    const auto rows = static_cast<Eigen::Index>(batch_size);
    const auto msg_len = static_cast<Eigen::Index>(cfg.max_len);

    std::mt19937 gen(seed);
    std::uniform_int_distribution<int32_t> dist(0, kSyntheticVocab - 1);
    auto random_ids = [&](Eigen::Index cols) {
        IdMatrix m(rows, cols);
        for (Eigen::Index i = 0; i < m.size(); i++) {
            m.data()[i] = dist(gen);
        }
        return m;
    };

    Batch batch;
    batch.diff_ids = random_ids(kSyntheticDiffLen);
    batch.diff_mask = IdMatrix::Ones(rows, kSyntheticDiffLen);
    batch.msg_ids = random_ids(msg_len);
    batch.msg_mask = IdMatrix::Ones(rows, msg_len);
    batch.msg_labels = random_ids(msg_len);
    batch.generation_ids = IdMatrix(rows, 0);
    batch.generation_mask = IdMatrix(rows, 0);
    return batch;
}

void HistoryCollator::log_batch(const Batch& batch) const {
    std::cout << "[COLLATE] batch of " << batch.batch_size() << " examples" << std::endl;
    for (FieldName field : kAllFields) {
        const auto& m = batch.field(field);
        std::cout << "[COLLATE]   " << field_name_to_string(field)
                  << ": [" << m.rows() << ", " << m.cols() << "]" << std::endl;
    }
}

} // namespace cmg
