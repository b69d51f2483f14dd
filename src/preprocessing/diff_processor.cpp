// src/preprocessing/diff_processor.cpp
#include "cmg/preprocessing/diff_processor.hpp"
#include "cmg/text/unicode_utils.hpp"
#include <utility>

namespace cmg {

namespace {

const std::string kLineMarker = "<nl>";

bool starts_with(const std::vector<std::string>& tokens, const char* first, const char* second) {
    return tokens.size() >= 2 && tokens[0] == first && tokens[1] == second;
}

} // anonymous namespace

std::vector<std::vector<std::string>> DiffProcessor::split_lines(const std::string& diff) {
    std::vector<std::vector<std::string>> lines;
    size_t start = 0;
    while (true) {
        size_t end = diff.find(kLineMarker, start);
        lines.push_back(unicode::split_whitespace(diff.substr(start, end - start)));
        if (end == std::string::npos) break;
        start = end + kLineMarker.size();
    }

    return lines;
}

std::string DiffProcessor::process_diff(const std::string& diff) {
    std::vector<std::vector<std::string>> kept;

    for (auto& tokens : split_lines(diff)) {
        if (tokens.empty()) {
            continue;
        }

        if (tokens[0] == "<FILE>") {
            kept.emplace_back(tokens.begin() + 1, tokens.end());
        } else if (starts_with(tokens, "new", "file") ||
                   starts_with(tokens, "rename", "from") ||
                   starts_with(tokens, "rename", "to")) {
            kept.push_back(std::move(tokens));
        } else if (starts_with(tokens, "deleted", "file")) {
            kept.push_back({tokens[0], tokens[1]});
        } else if (tokens[0] == "-" || tokens[0] == "+") {
            kept.push_back(std::move(tokens));
        } else if (tokens[0] == "index" || starts_with(tokens, "similarity", "index")) {
            continue;
        } else if (starts_with(tokens, "Binary", "files")) {
            kept.push_back(std::move(tokens));
        }
        // Anything else is an unchanged line
    }

    std::string result;
    for (const auto& line : kept) {
        for (const auto& token : line) {
            if (!result.empty()) result += ' ';
            result += token;
        }
        if (!result.empty()) result += ' ';
        result += "\\n";
    }

    return result;
}

} // namespace cmg
