// tests/test_config_io.cpp
#include "cmg/config/config_io.hpp"
#include "cmg/errors.hpp"
#include "test_support.hpp"
#include <filesystem>
#include <fstream>

using namespace cmg;
using namespace cmg::test;

namespace {

nlohmann::json sample_config() {
    return nlohmann::json{
        {"collator", {
            {"max_len", 200},
            {"separator", {220, 59, 77, 220}},
            {"include_history", true},
            {"emit_generation_prompt", false},
            {"wrap_special_tokens", true},
            {"num_workers", 4}
        }},
        {"target_tokens", {{"bos_id", 50256}, {"eos_id", 50256}, {"pad_id", 50256}, {"ignore_label", -100}}},
        {"source_tokens", {{"pad_id", 1}}}
    };
}

void test_reads_every_section() {
    CollatorConfig config = collator_config_from_json(sample_config());

    expect(config.max_len == 200, "max_len");
    expect_seq(config.separator, {220, 59, 77, 220}, "separator");
    expect(config.include_history, "include_history");
    expect(!config.emit_generation_prompt, "emit_generation_prompt");
    expect(config.wrap_special_tokens, "wrap_special_tokens");
    expect(config.num_workers == 4, "num_workers");
    expect(config.target_tokens.pad_id == 50256, "pad_id");
    expect(config.diff_pad_id == 1, "source pad id");
}

void test_missing_keys_keep_defaults() {
    nlohmann::json partial = {{"collator", {{"separator", {198}}}}};
    CollatorConfig config = collator_config_from_json(partial);
    CollatorConfig defaults;

    expect(config.max_len == defaults.max_len, "default max_len");
    expect(config.target_tokens.ignore_label == -100, "default sentinel");
    expect(config.include_history == defaults.include_history, "default include_history");
}

void test_rejects_bad_values() {
    auto config = sample_config();
    config["collator"]["max_len"] = "long";
    expect_throws<ConfigurationError>([&] { collator_config_from_json(config); }, "string max_len");

    config = sample_config();
    config["collator"]["max_len"] = -1;
    expect_throws<ConfigurationError>([&] { collator_config_from_json(config); }, "negative max_len");

    config = sample_config();
    config["collator"]["separator"] = nlohmann::json::array();
    expect_throws<ConfigurationError>([&] { collator_config_from_json(config); }, "empty separator");

    config = sample_config();
    config["target_tokens"]["ignore_label"] = 50256;
    expect_throws<ConfigurationError>([&] { collator_config_from_json(config); }, "sentinel equals pad");

    config = sample_config();
    config["collator"]["include_history"] = 1;
    expect_throws<ConfigurationError>([&] { collator_config_from_json(config); }, "non-boolean flag");

    config = sample_config();
    config["collator"]["max_len"] = 4294967306ULL;
    expect_throws<ConfigurationError>([&] { collator_config_from_json(config); }, "max_len past 32 bits");

    config = sample_config();
    config["target_tokens"]["bos_id"] = 4294967297LL;
    expect_throws<ConfigurationError>([&] { collator_config_from_json(config); }, "bos_id past 32 bits");

    config = sample_config();
    config["target_tokens"]["ignore_label"] = -4294967396LL;
    expect_throws<ConfigurationError>([&] { collator_config_from_json(config); }, "sentinel below 32 bits");

    config = sample_config();
    config["collator"]["separator"] = {220, 4294967516ULL};
    expect_throws<ConfigurationError>([&] { collator_config_from_json(config); }, "separator id past 32 bits");

    config = sample_config();
    config["target_tokens"] = 3;
    expect_throws<ConfigurationError>([&] { collator_config_from_json(config); }, "section not an object");
}

void test_accepts_32_bit_extremes() {
    auto config = sample_config();
    config["target_tokens"]["pad_id"] = 2147483647ULL;
    config["target_tokens"]["ignore_label"] = -2147483647LL - 1;
    CollatorConfig loaded = collator_config_from_json(config);

    expect(loaded.target_tokens.pad_id == 2147483647, "largest pad id");
    expect(loaded.target_tokens.ignore_label == -2147483647 - 1, "smallest sentinel");
}

void test_file_round_trip() {
    auto path = std::filesystem::temp_directory_path() / "cmg_test_config.json";
    CollatorConfig original = collator_config_from_json(sample_config());
    save_collator_config(original, path);

    CollatorConfig loaded = load_collator_config(path);
    expect(collator_config_to_json(loaded) == collator_config_to_json(original), "same settings");
    std::filesystem::remove(path);
}

void test_file_errors() {
    auto dir = std::filesystem::temp_directory_path();
    expect_throws<std::runtime_error>([&] { load_collator_config(dir / "cmg_missing_config.json"); },
                                      "missing file");

    auto path = dir / "cmg_broken_config.json";
    {
        std::ofstream out(path);
        out << "{ \"collator\": ";
    }
    expect_throws<ConfigurationError>([&] { load_collator_config(path); }, "malformed JSON");
    std::filesystem::remove(path);
}

} // anonymous namespace

int main() {
    return run_tests("ConfigIO", {
        {"reads every section", test_reads_every_section},
        {"missing keys keep defaults", test_missing_keys_keep_defaults},
        {"rejects bad values", test_rejects_bad_values},
        {"accepts 32-bit extremes", test_accepts_32_bit_extremes},
        {"file round trip", test_file_round_trip},
        {"file errors", test_file_errors},
    });
}
