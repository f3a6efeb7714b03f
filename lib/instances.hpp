/**
 * @file instances.hpp
 * @date 2026
 *
 * Commitments to the public inputs of a circuit, computed the way a verifier
 * derives them, without running a prover.
 */

#pragma once

#include "kzg.hpp"
#include "verifying_key.hpp"

#include <vector>

#include <libff/algebra/curves/public_params.hpp>

namespace zkplayground {

// One instance set per proof, one column of scalars per instance column.
template <typename ppT>
using instance_column = std::vector<libff::Fr<ppT>>;

template <typename ppT>
using instance_set = std::vector<instance_column<ppT>>;

/**
 * Commits every instance column of every instance set in the Lagrange basis.
 *
 * Columns are zero-padded to the domain size and committed with the default
 * blind; the result is in affine form and mirrors the input ordering.
 *
 * Throws plonk_error with
 *   - error_code::invalid_instances when a set's column count differs from
 *     vk.num_instance_columns();
 *   - error_code::instance_too_large when a column is longer than
 *     n - (blinding_factors + 1).
 * Nothing is returned on failure.
 *
 * Touches no global state, libff profiling included, so independent calls
 * may run concurrently.
 */
template <typename ppT>
std::vector<std::vector<libff::G1<ppT>>> commit_instances(const kzg_params<ppT>& params,
    const verifying_key<ppT>& vk,
    const std::vector<instance_set<ppT>>& instances);

} // namespace zkplayground

#include "instances.tcc"
