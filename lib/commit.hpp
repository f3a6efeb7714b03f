/**
 * @file commit.hpp
 * @date 2026
 */

#pragma once

#include "ffi.hpp"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * Commits instance columns against serialized KZG parameters.
 *
 * instances holds every scalar of every column back to back, 32 bytes big
 * endian each. set_columns[i] is the column count of set i; column_lengths
 * lists the length of each column, set after set.
 *
 * On success status is 0 and commitments holds one affine G1 point
 * ([x, y], 64 bytes) per column in input order. Otherwise status is one of
 * the zkplayground::error_code values and commitments is empty. The buffer is
 * released with __free.
 */
commit_result_t bn128_commit_instances(
    const uint8_t* params,
    int32_t params_length,
    int32_t num_instance_columns,
    int32_t blinding_factors,
    const uint8_t* instances,
    const int32_t* set_columns,
    const int32_t* column_lengths,
    int32_t num_sets);

#ifdef __cplusplus
} // extern "C"
#endif
