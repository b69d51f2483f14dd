#pragma once

#include <Eigen/Dense>
#include <cereal/cereal.hpp>
#include <cstdint>

namespace cereal {

// Dynamic Eigen matrices (batch arrays), binary archives only
template <class Archive, typename Scalar, int Options, int MaxRows, int MaxCols>
void save(Archive& archive,
          const Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic, Options, MaxRows, MaxCols>& matrix) {
    int64_t rows = matrix.rows();
    int64_t cols = matrix.cols();
    archive(rows, cols);

    if (matrix.size() > 0) {
        archive(binary_data(matrix.data(), static_cast<std::size_t>(matrix.size()) * sizeof(Scalar)));
    }
}

template <class Archive, typename Scalar, int Options, int MaxRows, int MaxCols>
void load(Archive& archive,
          Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic, Options, MaxRows, MaxCols>& matrix) {
    int64_t rows = 0;
    int64_t cols = 0;
    archive(rows, cols);

    if (rows < 0 || cols < 0) {
        throw Exception("Corrupt matrix header");
    }

    matrix.resize(static_cast<Eigen::Index>(rows), static_cast<Eigen::Index>(cols));

    if (matrix.size() > 0) {
        archive(binary_data(matrix.data(), static_cast<std::size_t>(matrix.size()) * sizeof(Scalar)));
    }
}

} // namespace cereal
