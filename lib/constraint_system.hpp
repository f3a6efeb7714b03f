/**
 * @file constraint_system.hpp
 * @date 2026
 */

#pragma once

#include <algorithm>
#include <cstddef>
#include <vector>

namespace zkplayground {

/**
 * Column layout of a circuit, as seen by the commitment side.
 *
 * Only the quantities that decide how many rows of the domain are usable are
 * tracked: how many columns of each kind exist, and how many distinct
 * rotations each advice column is queried at.
 */
class constraint_system_shape {
public:
    constraint_system_shape()
        : num_fixed_columns_(0)
        , num_instance_columns_(0)
    {
    }

    size_t fixed_column() { return num_fixed_columns_++; }
    size_t instance_column() { return num_instance_columns_++; }
    size_t advice_column(size_t queries)
    {
        num_advice_queries_.push_back(queries);
        return num_advice_queries_.size() - 1;
    }

    size_t num_fixed_columns() const { return num_fixed_columns_; }
    size_t num_instance_columns() const { return num_instance_columns_; }
    size_t num_advice_columns() const { return num_advice_queries_.size(); }

    // Each advice column leaks one evaluation per query, plus one for the
    // opening at x and one for the permutation argument.
    size_t blinding_factors() const
    {
        size_t factors = 1;
        if (!num_advice_queries_.empty()) {
            factors = *std::max_element(num_advice_queries_.begin(), num_advice_queries_.end());
        }
        factors = std::max<size_t>(3, factors);
        return factors + 2;
    }

    size_t minimum_rows() const { return blinding_factors() + 3; }

    size_t usable_rows(size_t n) const
    {
        const size_t reserved = blinding_factors() + 1;
        return n > reserved ? n - reserved : 0;
    }

private:
    size_t num_fixed_columns_;
    size_t num_instance_columns_;
    std::vector<size_t> num_advice_queries_;
};

} // namespace zkplayground
