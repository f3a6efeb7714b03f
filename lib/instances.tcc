#pragma once

#include "error.hpp"

#include <string>

namespace zkplayground {

template <typename ppT>
std::vector<std::vector<libff::G1<ppT>>> commit_instances(const kzg_params<ppT>& params,
    const verifying_key<ppT>& vk,
    const std::vector<instance_set<ppT>>& instances)
{
    typedef libff::Fr<ppT> scalar_t;

    for (size_t i = 0; i < instances.size(); ++i) {
        if (instances[i].size() != vk.num_instance_columns()) {
            throw plonk_error(error_code::invalid_instances,
                "instance set " + std::to_string(i) + " has " + std::to_string(instances[i].size())
                    + " columns, verifying key declares " + std::to_string(vk.num_instance_columns()));
        }
    }

    const size_t n = params.n();
    if (vk.domain().n() != n) {
        throw plonk_error(error_code::invalid_parameters,
            "verifying key domain of " + std::to_string(vk.domain().n()) + " rows does not match parameters of "
                + std::to_string(n) + " rows");
    }

    const size_t capacity = vk.usable_rows();

    std::vector<std::vector<libff::G1<ppT>>> commitments;
    commitments.reserve(instances.size());
    for (const instance_set<ppT>& set : instances) {
        std::vector<libff::G1<ppT>> set_commitments;
        set_commitments.reserve(set.size());
        for (const instance_column<ppT>& column : set) {
            if (column.size() > capacity) {
                throw plonk_error(error_code::instance_too_large,
                    "instance column of " + std::to_string(column.size()) + " values exceeds the "
                        + std::to_string(capacity) + " usable rows");
            }

            std::vector<scalar_t> values(column);
            values.resize(n, scalar_t::zero());
            const polynomial<scalar_t, lagrange_basis> poly = vk.domain().lagrange_from_vec(std::move(values));

            libff::G1<ppT> commitment = params.commit_lagrange(poly, blind<scalar_t>::default_blind());
            commitment.to_affine_coordinates();
            set_commitments.emplace_back(commitment);
        }
        commitments.emplace_back(std::move(set_commitments));
    }

    return commitments;
}

} // namespace zkplayground
