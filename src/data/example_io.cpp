// src/data/example_io.cpp
#include "cmg/data/example_io.hpp"
#include "cmg/errors.hpp"
#include <cstdint>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string>

namespace cmg {

namespace {

TokenSequence read_ids(const nlohmann::json& value, const std::string& key) {
    if (!value.is_array()) {
        throw InvalidInput("'" + key + "' is not an array of token ids");
    }

    TokenSequence ids;
    ids.reserve(value.size());
    for (const auto& id : value) {
        if (!id.is_number_integer()) {
            throw InvalidInput("'" + key + "' holds a non-integer token id");
        }
        bool in_range = id.is_number_unsigned()
            ? id.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<TokenID>::max())
            : id.get<int64_t>() >= std::numeric_limits<TokenID>::min() &&
              id.get<int64_t>() <= std::numeric_limits<TokenID>::max();
        if (!in_range) {
            throw InvalidInput("'" + key + "' holds token id " + id.dump() + " outside the 32-bit range");
        }
        ids.push_back(static_cast<TokenID>(id.get<int64_t>()));
    }
    return ids;
}

} // anonymous namespace

Example example_from_json(const nlohmann::json& record) {
    if (!record.is_object()) {
        throw InvalidInput("example record is not an object");
    }
    if (!record.contains("diff_input_ids")) {
        throw InvalidInput("example record lacks 'diff_input_ids'");
    }
    if (!record.contains("msg_input_ids")) {
        throw InvalidInput("example record lacks 'msg_input_ids'");
    }

    Example example;
    example.context_tokens = read_ids(record["diff_input_ids"], "diff_input_ids");
    example.current_tokens = read_ids(record["msg_input_ids"], "msg_input_ids");

    if (record.contains("history_input_ids")) {
        const auto& history = record["history_input_ids"];
        if (!history.is_array()) {
            throw InvalidInput("'history_input_ids' is not a list of turns");
        }
        example.history_tokens.reserve(history.size());
        for (const auto& turn : history) {
            example.history_tokens.push_back(read_ids(turn, "history_input_ids"));
        }
    }

    return example;
}

nlohmann::json example_to_json(const Example& example) {
    return nlohmann::json{
        {"diff_input_ids", example.context_tokens},
        {"msg_input_ids", example.current_tokens},
        {"history_input_ids", example.history_tokens}
    };
}

std::vector<Example> load_examples_jsonl(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open example file: " + path.string());
    }

    std::vector<Example> examples;
    std::string line;
    size_t line_no = 0;
    while (std::getline(file, line)) {
        line_no++;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }

        nlohmann::json record;
        try {
            record = nlohmann::json::parse(line);
        } catch (const nlohmann::json::parse_error& e) {
            throw InvalidInput(path.string() + ":" + std::to_string(line_no) + ": " + e.what());
        }

        try {
            examples.push_back(example_from_json(record));
        } catch (const InvalidInput& e) {
            throw InvalidInput(path.string() + ":" + std::to_string(line_no) + ": " + e.what());
        }
    }

    return examples;
}

} // namespace cmg
