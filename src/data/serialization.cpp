// src/data/serialization.cpp
#include "cmg/data/serialization.hpp"
#include <cereal/archives/binary.hpp>
#include <cereal/types/vector.hpp>
#include <fstream>
#include <stdexcept>
#include <string>

namespace cmg {

namespace {

template <typename T>
void write_archive(const std::filesystem::path& path, const T& value) {
    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file for writing: " + path.string());
    }

    try {
        cereal::BinaryOutputArchive archive(file);
        archive(value);
    } catch (const std::exception& e) {
        throw std::runtime_error("Failed to write " + path.string() + ": " + e.what());
    }
}

template <typename T>
T read_archive(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file for reading: " + path.string());
    }

    T value;
    try {
        cereal::BinaryInputArchive archive(file);
        archive(value);
    } catch (const std::exception& e) {
        throw std::runtime_error("Failed to read " + path.string() + ": " + e.what());
    }
    return value;
}

} // anonymous namespace

void save_examples(const std::filesystem::path& path, const std::vector<Example>& examples) {
    write_archive(path, examples);
}

std::vector<Example> load_examples(const std::filesystem::path& path) {
    return read_archive<std::vector<Example>>(path);
}

void save_batch(const std::filesystem::path& path, const Batch& batch) {
    write_archive(path, batch);
}

Batch load_batch(const std::filesystem::path& path) {
    return read_archive<Batch>(path);
}

} // namespace cmg
