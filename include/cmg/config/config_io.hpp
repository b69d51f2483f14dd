// include/cmg/config/config_io.hpp
#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include "cmg/collation/collator_config.hpp"

namespace cmg {

// Sections: "collator", "target_tokens", "source_tokens". Missing keys keep
// their defaults; a value of the wrong type is a ConfigurationError. The
// result is validated before it is returned.
CollatorConfig collator_config_from_json(const nlohmann::json& config);
nlohmann::json collator_config_to_json(const CollatorConfig& config);

CollatorConfig load_collator_config(const std::filesystem::path& path);
void save_collator_config(const CollatorConfig& config, const std::filesystem::path& path);

} // namespace cmg
