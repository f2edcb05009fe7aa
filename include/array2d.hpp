#pragma once

#include <cstddef>
#include <limits>
#include <stdexcept>
#include <vector>

/**
 * @file array2d.hpp
 * @brief Contiguous row-major 2D double array.
 *
 * Holds allocation weights, projected areas per time step, and per-cell
 * land cover. Provides `(row, col)` access, row pointers for broadcast
 * updates, and overflow-safe allocation.
 */

namespace lcn
{

class Array2D
{
public:
    /**
     * @brief Constructs an empty array.
     */
    Array2D() : rows_(0), cols_(0) {}

    /**
     * @brief Constructs an array filled with a constant value.
     * @param rows Row count.
     * @param cols Column count.
     * @param init_value Fill value.
     */
    Array2D(std::size_t rows, std::size_t cols, double init_value = 0.0) : rows_(rows), cols_(cols)
    {
        data_.resize(checked_size(rows, cols), init_value);
    }

    double& operator()(std::size_t row, std::size_t col) { return data_[row * cols_ + col]; }
    const double& operator()(std::size_t row, std::size_t col) const { return data_[row * cols_ + col]; }

    double* row(std::size_t r) { return data_.data() + r * cols_; }
    const double* row(std::size_t r) const { return data_.data() + r * cols_; }

    /**
     * @brief Copies one column into a new vector.
     */
    std::vector<double> column(std::size_t col) const
    {
        if (col >= cols_)
        {
            throw std::out_of_range("Array2D column out of range");
        }
        std::vector<double> out(rows_);
        for (std::size_t r = 0; r < rows_; ++r)
        {
            out[r] = data_[r * cols_ + col];
        }
        return out;
    }

    /**
     * @brief Sum over one row.
     */
    double row_sum(std::size_t r) const
    {
        double total = 0.0;
        const double* values = row(r);
        for (std::size_t c = 0; c < cols_; ++c)
        {
            total += values[c];
        }
        return total;
    }

    std::size_t rows() const { return rows_; }
    std::size_t cols() const { return cols_; }
    std::size_t size() const { return data_.size(); }
    bool empty() const { return data_.empty(); }

    double* data() { return data_.data(); }
    const double* data() const { return data_.data(); }

private:
    static std::size_t checked_size(std::size_t rows, std::size_t cols)
    {
        if (cols != 0 && rows > std::numeric_limits<std::size_t>::max() / cols)
        {
            throw std::length_error("Array2D dimensions overflow size_t");
        }
        return rows * cols;
    }

    std::size_t rows_;
    std::size_t cols_;
    std::vector<double> data_;
};

} // namespace lcn
