#pragma once

// =============================================================================
// PhaseGrid - Sparse Matrix Builder
// =============================================================================
// Mutable accumulator used while the grid model is assembled. Every element
// contribution goes through accumulate(); duplicates are summed when the
// builder is finalized into a compressed Eigen matrix.
// =============================================================================

#include "phasegrid/v1/numeric_types.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

namespace phasegrid::v1 {

template<typename Scalar>
class SparseMatrixBuilder {
public:
    using Matrix = Eigen::SparseMatrix<Scalar, Eigen::ColMajor>;
    using Triplet = Eigen::Triplet<Scalar>;

    SparseMatrixBuilder(Index rows, Index cols)
        : rows_(rows)
        , cols_(cols) {
        if (rows < 0 || cols < 0) {
            throw std::invalid_argument("SparseMatrixBuilder: negative dimension");
        }
    }

    [[nodiscard]] Index rows() const { return rows_; }
    [[nodiscard]] Index cols() const { return cols_; }
    [[nodiscard]] std::size_t triplet_count() const { return triplets_.size(); }

    /// Add `value` to entry (row, col). Exact zeros are not recorded.
    void accumulate(Index row, Index col, const Scalar& value) {
        if (row < 0 || row >= rows_ || col < 0 || col >= cols_) {
            throw std::out_of_range("SparseMatrixBuilder: entry (" + std::to_string(row) + ", " +
                                    std::to_string(col) + ") outside " + std::to_string(rows_) +
                                    "x" + std::to_string(cols_));
        }
        if (value == Scalar(0)) return;
        triplets_.emplace_back(row, col, value);
    }

    /// Add a dense sub-matrix element by element at the given row/column positions.
    /// Positions need not be contiguous or sorted.
    template<typename Derived>
    void insert_sub_matrix(const Eigen::MatrixBase<Derived>& sub_matrix,
                           const PositionList& row_positions,
                           const PositionList& col_positions) {
        if (static_cast<std::size_t>(sub_matrix.rows()) != row_positions.size() ||
            static_cast<std::size_t>(sub_matrix.cols()) != col_positions.size()) {
            throw std::invalid_argument(
                "SparseMatrixBuilder: sub-matrix " + std::to_string(sub_matrix.rows()) + "x" +
                std::to_string(sub_matrix.cols()) + " does not match " +
                std::to_string(row_positions.size()) + "x" + std::to_string(col_positions.size()) +
                " positions");
        }
        for (std::size_t i = 0; i < row_positions.size(); ++i) {
            for (std::size_t j = 0; j < col_positions.size(); ++j) {
                accumulate(row_positions[i], col_positions[j],
                           static_cast<Scalar>(sub_matrix(static_cast<Eigen::Index>(i),
                                                          static_cast<Eigen::Index>(j))));
            }
        }
    }

    /// Compress into an immutable sparse matrix; summed-out entries are pruned
    [[nodiscard]] Matrix finalize() const {
        Matrix matrix(rows_, cols_);
        matrix.setFromTriplets(triplets_.begin(), triplets_.end());
        matrix.prune([](const auto&, const auto&, const Scalar& value) { return value != Scalar(0); });
        matrix.makeCompressed();
        return matrix;
    }

private:
    Index rows_;
    Index cols_;
    std::vector<Triplet> triplets_;
};

/// Dense copy of a sparse matrix, mainly for inspection and tests
template<typename Scalar>
[[nodiscard]] Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic> to_dense(
    const Eigen::SparseMatrix<Scalar, Eigen::ColMajor>& matrix) {
    return Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic>(matrix);
}

/// Rows that hold no nonzero entry
template<typename Scalar>
[[nodiscard]] std::vector<Index> empty_rows(const Eigen::SparseMatrix<Scalar, Eigen::ColMajor>& matrix) {
    std::vector<bool> seen(static_cast<std::size_t>(matrix.rows()), false);
    for (Eigen::Index k = 0; k < matrix.outerSize(); ++k) {
        for (typename Eigen::SparseMatrix<Scalar, Eigen::ColMajor>::InnerIterator it(matrix, k); it; ++it) {
            if (it.value() != Scalar(0)) {
                seen[static_cast<std::size_t>(it.row())] = true;
            }
        }
    }
    std::vector<Index> result;
    for (std::size_t row = 0; row < seen.size(); ++row) {
        if (!seen[row]) result.push_back(static_cast<Index>(row));
    }
    return result;
}

/// Entry-wise symmetry check within an absolute tolerance
template<typename Scalar>
[[nodiscard]] bool is_symmetric(const Eigen::SparseMatrix<Scalar, Eigen::ColMajor>& matrix,
                                Real tolerance = 0.0) {
    if (matrix.rows() != matrix.cols()) return false;
    const Eigen::SparseMatrix<Scalar, Eigen::ColMajor> transposed = matrix.transpose();
    const Eigen::SparseMatrix<Scalar, Eigen::ColMajor> difference = matrix - transposed;
    for (Eigen::Index k = 0; k < difference.outerSize(); ++k) {
        for (typename Eigen::SparseMatrix<Scalar, Eigen::ColMajor>::InnerIterator it(difference, k); it; ++it) {
            if (std::abs(it.value()) > tolerance) return false;
        }
    }
    return true;
}

}  // namespace phasegrid::v1
