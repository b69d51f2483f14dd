// include/cmg/collation/batch.hpp
#pragma once

#include <Eigen/Dense>
#include <cstdint>
#include <string>
#include <array>
#include <cereal/cereal.hpp>
#include "cmg/core/eigen_serialization.hpp"

namespace cmg {

// [batch_size, field_len] integer array
using IdMatrix = Eigen::Matrix<int32_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

enum class FieldName {
    DIFF_IDS,
    DIFF_MASK,
    MSG_IDS,
    MSG_MASK,
    MSG_LABELS,
    GENERATION_IDS,
    GENERATION_MASK
};

inline constexpr std::array<FieldName, 7> kAllFields = {
    FieldName::DIFF_IDS, FieldName::DIFF_MASK,
    FieldName::MSG_IDS, FieldName::MSG_MASK, FieldName::MSG_LABELS,
    FieldName::GENERATION_IDS, FieldName::GENERATION_MASK
};

inline std::string field_name_to_string(FieldName field) {
    switch (field) {
        case FieldName::DIFF_IDS: return "diff_ids";
        case FieldName::DIFF_MASK: return "diff_mask";
        case FieldName::MSG_IDS: return "msg_ids";
        case FieldName::MSG_MASK: return "msg_mask";
        case FieldName::MSG_LABELS: return "msg_labels";
        case FieldName::GENERATION_IDS: return "generation_ids";
        case FieldName::GENERATION_MASK: return "generation_mask";
    }
    return "unknown";
}

// Materialized batch; row i of every array belongs to input example i
struct Batch {
    IdMatrix diff_ids;
    IdMatrix diff_mask;
    IdMatrix msg_ids;
    IdMatrix msg_mask;
    IdMatrix msg_labels;
    IdMatrix generation_ids;
    IdMatrix generation_mask;

    size_t batch_size() const { return static_cast<size_t>(msg_ids.rows()); }

    IdMatrix& field(FieldName name) {
        switch (name) {
            case FieldName::DIFF_IDS: return diff_ids;
            case FieldName::DIFF_MASK: return diff_mask;
            case FieldName::MSG_IDS: return msg_ids;
            case FieldName::MSG_MASK: return msg_mask;
            case FieldName::MSG_LABELS: return msg_labels;
            case FieldName::GENERATION_IDS: return generation_ids;
            case FieldName::GENERATION_MASK: return generation_mask;
        }
        return msg_ids;
    }

    const IdMatrix& field(FieldName name) const {
        switch (name) {
            case FieldName::DIFF_IDS: return diff_ids;
            case FieldName::DIFF_MASK: return diff_mask;
            case FieldName::MSG_IDS: return msg_ids;
            case FieldName::MSG_MASK: return msg_mask;
            case FieldName::MSG_LABELS: return msg_labels;
            case FieldName::GENERATION_IDS: return generation_ids;
            case FieldName::GENERATION_MASK: return generation_mask;
        }
        return msg_ids;
    }

    template <class Archive>
    void serialize(Archive& archive) {
        archive(
            cereal::make_nvp("diff_ids", diff_ids),
            cereal::make_nvp("diff_mask", diff_mask),
            cereal::make_nvp("msg_ids", msg_ids),
            cereal::make_nvp("msg_mask", msg_mask),
            cereal::make_nvp("msg_labels", msg_labels),
            cereal::make_nvp("generation_ids", generation_ids),
            cereal::make_nvp("generation_mask", generation_mask)
        );
    }
};

} // namespace cmg
