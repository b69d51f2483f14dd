// include/cmg/data/example_io.hpp
#pragma once

#include <filesystem>
#include <vector>
#include <nlohmann/json.hpp>
#include "cmg/data/example.hpp"

namespace cmg {

// Record keys: "diff_input_ids" (ids), "msg_input_ids" (ids),
// "history_input_ids" (list of ids, oldest first, may be omitted).
// Throws InvalidInput naming the offending key.
Example example_from_json(const nlohmann::json& record);
nlohmann::json example_to_json(const Example& example);

// One record per non-empty line
std::vector<Example> load_examples_jsonl(const std::filesystem::path& path);

} // namespace cmg
