#pragma once

#include "error.hpp"
#include "util.tcc"

#include <cassert>
#include <cstdio>
#include <string>

#include <libff/common/profiling.hpp>

namespace zkplayground {

template <typename ppT>
std::vector<uint8_t> verifying_key<ppT>::write() const
{
    // [ k, instance columns, blinding factors ]
    std::vector<uint8_t> buffer(12);
    uint8_t* ptr = buffer.data();

    write_u32_be(domain_.k(), ptr);
    write_u32_be(uint32_t(num_instance_columns_), ptr);
    write_u32_be(uint32_t(blinding_factors_), ptr);

    assert(ptr == buffer.data() + buffer.size());
    return buffer;
}

template <typename ppT>
verifying_key<ppT> keygen_vk(const kzg_params<ppT>& params, const constraint_system_shape& cs)
{
    if (params.n() < cs.minimum_rows()) {
        throw plonk_error(error_code::not_enough_rows,
            "circuit needs " + std::to_string(cs.minimum_rows()) + " rows, parameters provide " + std::to_string(params.n()));
    }

    libff::enter_block("Call to keygen_vk");

    if (!libff::inhibit_profiling_info) {
        libff::print_indent();
        printf("* Instance columns: %zu\n", cs.num_instance_columns());
        libff::print_indent();
        printf("* Blinding factors: %zu\n", cs.blinding_factors());
    }

    verifying_key<ppT> vk(evaluation_domain<libff::Fr<ppT>>(params.k()), cs.num_instance_columns(), cs.blinding_factors());

    libff::leave_block("Call to keygen_vk");
    return vk;
}

} // namespace zkplayground
