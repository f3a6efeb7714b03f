/**
 * @file verifying_key.hpp
 * @date 2026
 */

#pragma once

#include "constraint_system.hpp"
#include "domain.hpp"
#include "kzg.hpp"

#include <stdint.h>
#include <vector>

#include <libff/algebra/curves/public_params.hpp>

namespace zkplayground {

/**
 * Public shape of a circuit: the domain its polynomials live in, how many
 * instance columns a proof binds, and how many trailing rows of every column
 * are reserved for blinding.
 */
template <typename ppT>
class verifying_key {
public:
    typedef libff::Fr<ppT> scalar_t;

    verifying_key(const evaluation_domain<scalar_t>& domain, size_t num_instance_columns, size_t blinding_factors)
        : domain_(domain)
        , num_instance_columns_(num_instance_columns)
        , blinding_factors_(blinding_factors)
    {
    }

    const evaluation_domain<scalar_t>& domain() const { return domain_; }
    size_t num_instance_columns() const { return num_instance_columns_; }
    size_t blinding_factors() const { return blinding_factors_; }

    size_t usable_rows() const
    {
        const size_t reserved = blinding_factors_ + 1;
        return domain_.n() > reserved ? domain_.n() - reserved : 0;
    }

    std::vector<uint8_t> write() const;

private:
    evaluation_domain<scalar_t> domain_;
    size_t num_instance_columns_;
    size_t blinding_factors_;
};

template <typename ppT>
verifying_key<ppT> keygen_vk(const kzg_params<ppT>& params, const constraint_system_shape& cs);

} // namespace zkplayground

#include "verifying_key.tcc"
