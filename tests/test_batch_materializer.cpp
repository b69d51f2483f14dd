// tests/test_batch_materializer.cpp
#include "cmg/collation/batch_materializer.hpp"
#include "cmg/errors.hpp"
#include "test_support.hpp"

using namespace cmg;
using namespace cmg::test;

namespace {

PaddedFieldMap two_row_fields() {
    PaddedFieldMap fields;
    fields[FieldName::DIFF_IDS] = pad({{11, 12, 13}, {14}}, PadSide::RIGHT, 3);
    fields[FieldName::MSG_IDS] = pad({{5, 6, 7}, {8}}, PadSide::RIGHT, 0);
    fields[FieldName::MSG_LABELS] = pad({{-100, 6, 7}, {8}}, PadSide::RIGHT, -100);
    fields[FieldName::GENERATION_IDS] = pad({{1, 4, 100}, {1}}, PadSide::LEFT, 0);
    return fields;
}

void test_stacks_each_field_to_its_own_width() {
    Batch batch = materialize(two_row_fields());

    expect(batch.batch_size() == 2, "two rows");
    for (FieldName field : kAllFields) {
        expect(batch.field(field).rows() == 2, field_name_to_string(field) + " has two rows");
    }

    const Batch& view = batch;
    for (FieldName field : kAllFields) {
        expect(&view.field(field) == &batch.field(field),
               field_name_to_string(field) + " same array through const access");
    }
    expect(&view.field(FieldName::DIFF_MASK) == &batch.diff_mask, "const lookup by name");
    expect(batch.diff_ids.cols() == 3, "diff width");
    expect(batch.msg_ids.cols() == 3, "msg width");
    expect(batch.generation_ids.cols() == 3, "generation width");

    expect_seq(row(batch.diff_ids, 1), {14, 3, 3}, "diff row 2");
    expect_seq(row(batch.diff_mask, 1), {1, 0, 0}, "diff mask row 2");
    expect_seq(row(batch.msg_labels, 1), {8, -100, -100}, "labels row 2");
    expect_seq(row(batch.generation_ids, 1), {0, 0, 1}, "generation row 2");
    expect_seq(row(batch.generation_mask, 1), {0, 0, 1}, "generation mask row 2");
}

void test_missing_generation_field() {
    auto fields = two_row_fields();
    fields.erase(FieldName::GENERATION_IDS);
    Batch batch = materialize(fields);

    expect(batch.generation_ids.rows() == 2 && batch.generation_ids.cols() == 0, "N x 0 generation ids");
    expect(batch.generation_mask.rows() == 2 && batch.generation_mask.cols() == 0, "N x 0 generation mask");
}

void test_row_count_mismatch() {
    auto fields = two_row_fields();
    fields[FieldName::DIFF_IDS] = pad({{11}}, PadSide::RIGHT, 3);
    expect_throws<InvalidInput>([&] { materialize(fields); }, "diff has one row");

    fields = two_row_fields();
    fields[FieldName::GENERATION_IDS] = pad({{1}, {1}, {1}}, PadSide::LEFT, 0);
    expect_throws<InvalidInput>([&] { materialize(fields); }, "generation has three rows");
}

void test_missing_required_field() {
    auto fields = two_row_fields();
    fields.erase(FieldName::MSG_LABELS);
    expect_throws<InvalidInput>([&] { materialize(fields); }, "labels missing");
}

void test_labels_must_align_with_ids() {
    auto fields = two_row_fields();
    fields[FieldName::MSG_LABELS] = pad({{-100, 6}, {8}}, PadSide::RIGHT, -100);
    expect_throws<InvalidInput>([&] { materialize(fields); }, "labels narrower than ids");
}

void test_ragged_rows_rejected() {
    expect_throws<InvalidInput>([] { stack_rows({{1, 2}, {3}}, "msg_ids"); }, "ragged rows");

    IdMatrix m = stack_rows({{1, 2}, {3, 4}}, "msg_ids");
    expect(m(1, 0) == 3 && m(0, 1) == 2, "row major placement");
}

} // anonymous namespace

int main() {
    return run_tests("BatchMaterializer", {
        {"stacks each field to its own width", test_stacks_each_field_to_its_own_width},
        {"missing generation field", test_missing_generation_field},
        {"row count mismatch", test_row_count_mismatch},
        {"missing required field", test_missing_required_field},
        {"labels must align with ids", test_labels_must_align_with_ids},
        {"ragged rows rejected", test_ragged_rows_rejected},
    });
}
