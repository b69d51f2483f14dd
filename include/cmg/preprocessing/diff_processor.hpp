// include/cmg/preprocessing/diff_processor.hpp
#pragma once

#include <string>
#include <vector>

namespace cmg {

// Reduces a tokenized git diff (lines separated by "<nl>") to the lines that
// describe the change: file headers, new/deleted/renamed file markers,
// binary notices and +/- lines. Unchanged context and index lines are dropped.
// Every kept line is followed by a literal "\n" token; tokens are joined by
// single spaces.
class DiffProcessor {
public:
    static std::string process_diff(const std::string& diff);

    // Whitespace tokens per "<nl>"-separated line
    static std::vector<std::vector<std::string>> split_lines(const std::string& diff);
};

} // namespace cmg
