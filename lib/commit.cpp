/**
 * @file commit.cpp
 * @date 2026
 */

#include "commit.hpp"

#include "error.hpp"
#include "instances.hpp"
#include "util.tcc"

#include <exception>
#include <string>

// contains definition of alt_bn128 ec public parameters
#include <libff/algebra/curves/alt_bn128/alt_bn128_pp.hpp>

namespace zkplayground {
namespace ffi {

template <mp_size_t R, typename ppT>
std::vector<instance_set<ppT>> read_instances(const uint8_t* instances,
    const int32_t* set_columns,
    const int32_t* column_lengths,
    int32_t num_sets)
{
    const size_t SCALAR_SIZE = R * sizeof(mp_limb_t);

    if (num_sets < 0) {
        throw plonk_error(error_code::invalid_parameters, "negative instance set count");
    }

    std::vector<instance_set<ppT>> sets;
    sets.reserve(num_sets);

    const uint8_t* ptr = instances;
    size_t column_id = 0;
    for (int32_t s = 0; s < num_sets; s++) {
        if (set_columns[s] < 0) {
            throw plonk_error(error_code::invalid_parameters, "negative column count in set " + std::to_string(s));
        }

        instance_set<ppT> set;
        for (int32_t c = 0; c < set_columns[s]; c++, column_id++) {
            const int32_t length = column_lengths[column_id];
            if (length < 0) {
                throw plonk_error(error_code::invalid_parameters, "negative length for column " + std::to_string(column_id));
            }

            instance_column<ppT> column;
            column.reserve(length);
            for (int32_t i = 0; i < length; i++) {
                const libff::bigint<R> value = to_libff_bigint<R>(ptr);
                ptr += SCALAR_SIZE;

                const libff::Fr<ppT> scalar(value);
                if (scalar.as_bigint() != value) {
                    throw plonk_error(error_code::invalid_parameters, "scalar is not reduced modulo the field order");
                }
                column.emplace_back(scalar);
            }
            set.emplace_back(std::move(column));
        }
        sets.emplace_back(std::move(set));
    }
    return sets;
}

template <mp_size_t Q, mp_size_t R, typename ppT>
commit_result_t commit_serialized_instances(const uint8_t* params_data,
    int32_t params_length,
    int32_t num_instance_columns,
    int32_t blinding_factors,
    const uint8_t* instances,
    const int32_t* set_columns,
    const int32_t* column_lengths,
    int32_t num_sets)
{
    libff::inhibit_profiling_info = true;
    libff::inhibit_profiling_counters = true;

    // initialize curve parameters
    ppT::init_public_params();

    buffer_t empty;
    __alloc(&empty, 0);

    try {
        if (params_length < 0 || num_instance_columns < 0 || blinding_factors < 0) {
            throw plonk_error(error_code::invalid_parameters, "negative size argument");
        }

        const kzg_params<ppT> params = kzg_params<ppT>::read(params_data, params_length);
        const verifying_key<ppT> vk(evaluation_domain<libff::Fr<ppT>>(params.k()), num_instance_columns, blinding_factors);
        const std::vector<instance_set<ppT>> sets = read_instances<R, ppT>(instances, set_columns, column_lengths, num_sets);

        const std::vector<std::vector<libff::G1<ppT>>> commitments = commit_instances<ppT>(params, vk, sets);

        size_t count = 0;
        for (const auto& set : commitments)
            count += set.size();

        const size_t G1_SIZE = Q * sizeof(mp_limb_t) * 2; // [x, y]
        buffer_t buffer = create_buffer(count * G1_SIZE);

        uint8_t* ptr = buffer.data;
        for (const auto& set : commitments) {
            for (const auto& commitment : set)
                serialize_g1_affine<Q, libff::G1<ppT>>(commitment, ptr);
        }

        return commit_result_t(int32_t(error_code::ok), buffer);
    } catch (const plonk_error& e) {
        return commit_result_t(int32_t(e.code()), empty);
    } catch (const std::exception&) {
        return commit_result_t(int32_t(error_code::internal_error), empty);
    }
}

} // namespace ffi
} // namespace zkplayground

commit_result_t bn128_commit_instances(const uint8_t* params,
    int32_t params_length,
    int32_t num_instance_columns,
    int32_t blinding_factors,
    const uint8_t* instances,
    const int32_t* set_columns,
    const int32_t* column_lengths,
    int32_t num_sets)
{
    return zkplayground::ffi::commit_serialized_instances<libff::alt_bn128_q_limbs,
        libff::alt_bn128_r_limbs,
        libff::alt_bn128_pp>(params,
        params_length,
        num_instance_columns,
        blinding_factors,
        instances,
        set_columns,
        column_lengths,
        num_sets);
}
