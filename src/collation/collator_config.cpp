// src/collation/collator_config.cpp
#include "cmg/collation/collator_config.hpp"
#include "cmg/errors.hpp"
#include <string>

namespace cmg {

void CollatorConfig::validate() const {
    if (max_len <= 0) {
        throw ConfigurationError("max_len must be positive, got " + std::to_string(max_len));
    }

    if (wrap_special_tokens && max_len < 2) {
        throw ConfigurationError("max_len must leave room for bos/eos when wrapping, got " +
                                 std::to_string(max_len));
    }

    if (include_history && separator.empty()) {
        throw ConfigurationError("separator must not be empty when history is merged");
    }

    const auto& t = target_tokens;
    if (t.ignore_label >= 0) {
        throw ConfigurationError("ignore_label must lie outside the vocabulary (negative), got " +
                                 std::to_string(t.ignore_label));
    }
    if (t.ignore_label == t.pad_id || t.ignore_label == t.bos_id || t.ignore_label == t.eos_id) {
        throw ConfigurationError("ignore_label collides with a special token id");
    }

    for (TokenID id : separator) {
        if (id == t.ignore_label) {
            throw ConfigurationError("separator contains the ignore_label value");
        }
    }
}

void CollatorConfig::print(std::ostream& out) const {
    out << "=== Collator Configuration ===" << std::endl;
    out << "Max Length: " << max_len << std::endl;
    out << "Separator: [";
    for (size_t i = 0; i < separator.size(); i++) {
        out << separator[i];
        if (i + 1 < separator.size()) out << ", ";
    }
    out << "]" << std::endl;
    out << "BOS/EOS/PAD: " << target_tokens.bos_id << "/" << target_tokens.eos_id
        << "/" << target_tokens.pad_id << std::endl;
    out << "Ignore Label: " << target_tokens.ignore_label << std::endl;
    out << "Diff PAD: " << diff_pad_id << std::endl;
    out << "Include History: " << (include_history ? "true" : "false") << std::endl;
    out << "Emit Generation Prompt: " << (emit_generation_prompt ? "true" : "false") << std::endl;
    out << "Wrap Special Tokens: " << (wrap_special_tokens ? "true" : "false") << std::endl;
    out << "Workers: " << num_workers << std::endl;
    out << "Debug Logging: " << (debug_logging ? "true" : "false") << std::endl;
    out << "==============================" << std::endl;
}

} // namespace cmg
