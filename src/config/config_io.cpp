// src/config/config_io.cpp
#include "cmg/config/config_io.hpp"
#include "cmg/errors.hpp"
#include <cstdint>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string>

namespace cmg {

namespace {

const nlohmann::json& section(const nlohmann::json& config, const char* name) {
    static const nlohmann::json empty = nlohmann::json::object();
    if (!config.contains(name)) {
        return empty;
    }
    if (!config[name].is_object()) {
        throw ConfigurationError(std::string("section '") + name + "' is not an object");
    }
    return config[name];
}

// Integers outside the 32-bit range are rejected rather than wrapped
int32_t to_int32(const nlohmann::json& value, const std::string& key) {
    if (!value.is_number_integer()) {
        throw ConfigurationError("value is not an integer: " + key);
    }
    if (value.is_number_unsigned()) {
        if (value.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int32_t>::max())) {
            throw ConfigurationError("value out of 32-bit range: " + key);
        }
        return static_cast<int32_t>(value.get<uint64_t>());
    }

    int64_t wide = value.get<int64_t>();
    if (wide < std::numeric_limits<int32_t>::min() || wide > std::numeric_limits<int32_t>::max()) {
        throw ConfigurationError("value out of 32-bit range: " + key);
    }
    return static_cast<int32_t>(wide);
}

int read_int(const nlohmann::json& sec, const char* key, int default_val) {
    if (!sec.contains(key)) {
        return default_val;
    }
    return to_int32(sec[key], key);
}

bool read_bool(const nlohmann::json& sec, const char* key, bool default_val) {
    if (!sec.contains(key)) {
        return default_val;
    }
    if (!sec[key].is_boolean()) {
        throw ConfigurationError(std::string("value is not a boolean: ") + key);
    }
    return sec[key].get<bool>();
}

} // anonymous namespace

CollatorConfig collator_config_from_json(const nlohmann::json& config) {
    if (!config.is_object()) {
        throw ConfigurationError("config root is not an object");
    }

    CollatorConfig result;

    const auto& collator = section(config, "collator");
    result.max_len = read_int(collator, "max_len", result.max_len);
    result.include_history = read_bool(collator, "include_history", result.include_history);
    result.emit_generation_prompt = read_bool(collator, "emit_generation_prompt",
                                              result.emit_generation_prompt);
    result.wrap_special_tokens = read_bool(collator, "wrap_special_tokens", result.wrap_special_tokens);
    result.debug_logging = read_bool(collator, "debug_logging", result.debug_logging);

    int workers = read_int(collator, "num_workers", static_cast<int>(result.num_workers));
    if (workers < 0) {
        throw ConfigurationError("num_workers must not be negative");
    }
    result.num_workers = static_cast<size_t>(workers);

    if (collator.contains("separator")) {
        const auto& sep = collator["separator"];
        if (!sep.is_array()) {
            throw ConfigurationError("separator is not an array of token ids");
        }
        for (const auto& id : sep) {
            result.separator.push_back(to_int32(id, "separator"));
        }
    }

    const auto& target = section(config, "target_tokens");
    auto& tokens = result.target_tokens;
    tokens.bos_id = read_int(target, "bos_id", tokens.bos_id);
    tokens.eos_id = read_int(target, "eos_id", tokens.eos_id);
    tokens.pad_id = read_int(target, "pad_id", tokens.pad_id);
    tokens.ignore_label = read_int(target, "ignore_label", tokens.ignore_label);

    const auto& source = section(config, "source_tokens");
    result.diff_pad_id = read_int(source, "pad_id", result.diff_pad_id);

    result.validate();
    return result;
}

nlohmann::json collator_config_to_json(const CollatorConfig& config) {
    return nlohmann::json{
        {"collator", {
            {"max_len", config.max_len},
            {"separator", config.separator},
            {"include_history", config.include_history},
            {"emit_generation_prompt", config.emit_generation_prompt},
            {"wrap_special_tokens", config.wrap_special_tokens},
            {"num_workers", config.num_workers},
            {"debug_logging", config.debug_logging}
        }},
        {"target_tokens", {
            {"bos_id", config.target_tokens.bos_id},
            {"eos_id", config.target_tokens.eos_id},
            {"pad_id", config.target_tokens.pad_id},
            {"ignore_label", config.target_tokens.ignore_label}
        }},
        {"source_tokens", {
            {"pad_id", config.diff_pad_id}
        }}
    };
}

CollatorConfig load_collator_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path.string());
    }

    nlohmann::json config;
    try {
        config = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigurationError("malformed JSON in " + path.string() + ": " + e.what());
    }

    return collator_config_from_json(config);
}

void save_collator_config(const CollatorConfig& config, const std::filesystem::path& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file for writing: " + path.string());
    }

    file << collator_config_to_json(config).dump(2);
    if (!file) {
        throw std::runtime_error("Failed to save config: " + path.string());
    }
}

} // namespace cmg
