// include/cmg/data/serialization.hpp
#pragma once

#include <filesystem>
#include <vector>
#include "cmg/collation/batch.hpp"
#include "cmg/data/example.hpp"

namespace cmg {

// cereal binary archives of tokenized examples and materialized batches
void save_examples(const std::filesystem::path& path, const std::vector<Example>& examples);
std::vector<Example> load_examples(const std::filesystem::path& path);

void save_batch(const std::filesystem::path& path, const Batch& batch);
Batch load_batch(const std::filesystem::path& path);

} // namespace cmg
