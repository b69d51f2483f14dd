// src/collation/batch_materializer.cpp
#include "cmg/collation/batch_materializer.hpp"
#include "cmg/errors.hpp"

namespace cmg {

namespace {

const PaddedField& require_field(const PaddedFieldMap& per_field, FieldName name) {
    auto it = per_field.find(name);
    if (it == per_field.end()) {
        throw InvalidInput("missing field " + field_name_to_string(name));
    }
    if (it->second.ids.size() != it->second.masks.size()) {
        throw InvalidInput("field " + field_name_to_string(name) + " has " +
                           std::to_string(it->second.ids.size()) + " rows but " +
                           std::to_string(it->second.masks.size()) + " mask rows");
    }
    return it->second;
}

void check_rows(const PaddedField& field, FieldName name, size_t batch_size) {
    if (field.rows() != batch_size) {
        throw InvalidInput("field " + field_name_to_string(name) + " has " +
                           std::to_string(field.rows()) + " rows, expected " +
                           std::to_string(batch_size));
    }
}

} // anonymous namespace

IdMatrix stack_rows(const std::vector<TokenSequence>& rows, const std::string& field) {
    const size_t width = rows.empty() ? 0 : rows.front().size();
    IdMatrix matrix(static_cast<Eigen::Index>(rows.size()), static_cast<Eigen::Index>(width));

    for (size_t i = 0; i < rows.size(); i++) {
        if (rows[i].size() != width) {
            throw InvalidInput("row " + std::to_string(i) + " of " + field + " has length " +
                               std::to_string(rows[i].size()) + ", expected " + std::to_string(width));
        }
        for (size_t j = 0; j < width; j++) {
            matrix(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = rows[i][j];
        }
    }

    return matrix;
}

Batch materialize(const PaddedFieldMap& per_field) {
    const auto& msg = require_field(per_field, FieldName::MSG_IDS);
    const auto& labels = require_field(per_field, FieldName::MSG_LABELS);
    const auto& diff = require_field(per_field, FieldName::DIFF_IDS);

    const size_t batch_size = msg.rows();
    check_rows(labels, FieldName::MSG_LABELS, batch_size);
    check_rows(diff, FieldName::DIFF_IDS, batch_size);

    if (labels.masks != msg.masks) {
        throw InvalidInput("msg_labels is not aligned with msg_ids");
    }

    Batch batch;
    batch.diff_ids = stack_rows(diff.ids, "diff_ids");
    batch.diff_mask = stack_rows(diff.masks, "diff_mask");
    batch.msg_ids = stack_rows(msg.ids, "msg_ids");
    batch.msg_mask = stack_rows(msg.masks, "msg_mask");
    batch.msg_labels = stack_rows(labels.ids, "msg_labels");

    auto gen = per_field.find(FieldName::GENERATION_IDS);
    if (gen != per_field.end()) {
        const auto& generation = require_field(per_field, FieldName::GENERATION_IDS);
        check_rows(generation, FieldName::GENERATION_IDS, batch_size);
        batch.generation_ids = stack_rows(generation.ids, "generation_ids");
        batch.generation_mask = stack_rows(generation.masks, "generation_mask");
    } else {
        batch.generation_ids = IdMatrix(static_cast<Eigen::Index>(batch_size), 0);
        batch.generation_mask = IdMatrix(static_cast<Eigen::Index>(batch_size), 0);
    }

    return batch;
}

} // namespace cmg
