// include/cmg/collation/batch_materializer.hpp
#pragma once

#include <map>
#include <vector>
#include "cmg/collation/batch.hpp"
#include "cmg/collation/padder.hpp"

namespace cmg {

// Padded fields keyed by the id array they produce:
//   DIFF_IDS       -> diff_ids, diff_mask
//   MSG_IDS        -> msg_ids, msg_mask
//   MSG_LABELS     -> msg_labels (mask must match the MSG_IDS mask)
//   GENERATION_IDS -> generation_ids, generation_mask (optional)
using PaddedFieldMap = std::map<FieldName, PaddedField>;

// Stacks equal-length rows into a [rows, width] array.
// Throws InvalidInput when the rows have different lengths.
IdMatrix stack_rows(const std::vector<TokenSequence>& rows, const std::string& field);

// Builds the seven named arrays, keeping row order. A missing
// GENERATION_IDS entry yields N x 0 generation arrays.
// Throws InvalidInput on a missing required field or when fields disagree on
// the number of rows.
Batch materialize(const PaddedFieldMap& per_field);

} // namespace cmg
