// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <span>
#include <vector>

namespace optrisk {

/// Dense row-major matrix of doubles
///
/// Element (i, j) lives at data[i * cols + j]. Rows index the outer swept
/// axis of a surface, columns the inner one.
class Grid2D {
public:
    Grid2D() = default;

    Grid2D(size_t rows, size_t cols, double fill = 0.0)
        : rows_(rows), cols_(cols), data_(rows * cols, fill) {}

    size_t rows() const { return rows_; }
    size_t cols() const { return cols_; }
    bool empty() const { return data_.empty(); }

    double& operator()(size_t i, size_t j) { return data_[i * cols_ + j]; }
    double operator()(size_t i, size_t j) const { return data_[i * cols_ + j]; }

    /// One row as a contiguous view
    std::span<const double> row(size_t i) const {
        return std::span<const double>(data_).subspan(i * cols_, cols_);
    }

    /// Row-major storage
    const std::vector<double>& data() const { return data_; }

private:
    size_t rows_ = 0;
    size_t cols_ = 0;
    std::vector<double> data_;
};

}  // namespace optrisk
