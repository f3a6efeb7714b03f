#pragma once

#include "error.hpp"
#include "util.tcc"

#include <cassert>
#include <cstdio>
#include <string>

#include <libff/algebra/scalar_multiplication/multiexp.hpp>
#include <libff/common/profiling.hpp>

namespace zkplayground {

namespace detail {

template <typename ppT>
libff::G1<ppT> best_multiexp(const libff::G1_vector<ppT>& bases, const std::vector<libff::Fr<ppT>>& scalars)
{
    assert(scalars.size() <= bases.size());
    if (scalars.empty()) {
        return libff::G1<ppT>::zero();
    }
    return libff::multi_exp<libff::G1<ppT>, libff::Fr<ppT>, libff::multi_exp_method_BDLO12>(
        bases.begin(), bases.begin() + scalars.size(),
        scalars.begin(), scalars.end(),
        1);
}

} // namespace detail

template <typename ppT>
kzg_params<ppT>::kzg_params(uint32_t k,
    libff::G1_vector<ppT> g,
    libff::G1_vector<ppT> g_lagrange,
    const g2_t& g2,
    const g2_t& s_g2)
    : k_(k)
    , g_(std::move(g))
    , g_lagrange_(std::move(g_lagrange))
    , g2_(g2)
    , s_g2_(s_g2)
{
}

template <typename ppT>
kzg_params<ppT> kzg_params<ppT>::setup(uint32_t k, xorshift_rng& rng)
{
    const scalar_t s = random_field_element<scalar_t>(rng);
    return unsafe_setup_with_s(k, s);
}

template <typename ppT>
kzg_params<ppT> kzg_params<ppT>::unsafe_setup_with_s(uint32_t k, const scalar_t& s)
{
    const evaluation_domain<scalar_t> domain(k);
    const size_t n = domain.n();

    libff::enter_block("Call to kzg_params::setup");

    if (!libff::inhibit_profiling_info) {
        libff::print_indent();
        printf("* Domain size: %zu\n", n);
    }

    std::vector<scalar_t> powers;
    powers.reserve(n);
    scalar_t current = scalar_t::one();
    for (size_t i = 0; i < n; ++i) {
        powers.emplace_back(current);
        current *= s;
    }
    const std::vector<scalar_t> lagrange = domain.evaluate_all_lagrange_polynomials(s);

    const size_t g1_window = libff::get_exp_window_size<g1_t>(2 * n);
    if (!libff::inhibit_profiling_info) {
        libff::print_indent();
        printf("* G1 window: %zu\n", g1_window);
    }

    libff::enter_block("Generating G1 multiexp table");
    libff::window_table<g1_t> g1_table = libff::get_window_table(scalar_t::size_in_bits(), g1_window, g1_t::one());
    libff::leave_block("Generating G1 multiexp table");

    libff::enter_block("Compute monomial bases", false);
    libff::G1_vector<ppT> g = libff::batch_exp(scalar_t::size_in_bits(), g1_window, g1_table, powers);
    libff::leave_block("Compute monomial bases", false);

    libff::enter_block("Compute Lagrange bases", false);
    libff::G1_vector<ppT> g_lagrange = libff::batch_exp(scalar_t::size_in_bits(), g1_window, g1_table, lagrange);
    libff::leave_block("Compute Lagrange bases", false);

    const g2_t g2 = g2_t::one();
    const g2_t s_g2 = s * g2_t::one();

    libff::leave_block("Call to kzg_params::setup");

    return kzg_params<ppT>(k, std::move(g), std::move(g_lagrange), g2, s_g2);
}

template <typename ppT>
libff::G1<ppT> kzg_params<ppT>::commit(const polynomial<scalar_t, coeff_basis>& poly, const blind<scalar_t>&) const
{
    if (poly.size() > g_.size()) {
        throw plonk_error(error_code::invalid_polynomial_length,
            "polynomial of size " + std::to_string(poly.size()) + " exceeds the parameters' degree bound");
    }
    return detail::best_multiexp<ppT>(g_, poly.values());
}

template <typename ppT>
libff::G1<ppT> kzg_params<ppT>::commit_lagrange(const polynomial<scalar_t, lagrange_basis>& poly, const blind<scalar_t>&) const
{
    if (poly.size() > g_lagrange_.size()) {
        throw plonk_error(error_code::invalid_polynomial_length,
            "polynomial of size " + std::to_string(poly.size()) + " exceeds the parameters' domain");
    }
    return detail::best_multiexp<ppT>(g_lagrange_, poly.values());
}

template <typename ppT>
size_t kzg_params<ppT>::serialized_size() const
{
    const size_t Q = ppT::Fq_type::num_limbs;
    const size_t G1_SIZE = Q * sizeof(mp_limb_t) * 2; // [x, y]
    const size_t G2_SIZE = Q * sizeof(mp_limb_t) * 4; // [[x0, x1], [y0, y1]]

    return 4 + (g_.size() + g_lagrange_.size()) * G1_SIZE + 2 * G2_SIZE;
}

template <typename ppT>
std::vector<uint8_t> kzg_params<ppT>::write() const
{
    const mp_size_t Q = ppT::Fq_type::num_limbs;

    // [ ------------------- LENGTH ------------------- ]
    // [ k,  g[0..n],  g_lagrange[0..n],  g2,  s_g2     ]

    std::vector<uint8_t> buffer(serialized_size());
    uint8_t* ptr = buffer.data();

    write_u32_be(k_, ptr);
    for (size_t i = 0; i < g_.size(); ++i)
        serialize_g1_affine<Q, g1_t>(g_[i], ptr);
    for (size_t i = 0; i < g_lagrange_.size(); ++i)
        serialize_g1_affine<Q, g1_t>(g_lagrange_[i], ptr);
    serialize_g2_affine<Q, g2_t>(g2_, ptr);
    serialize_g2_affine<Q, g2_t>(s_g2_, ptr);

    assert(ptr == buffer.data() + buffer.size());
    return buffer;
}

template <typename ppT>
kzg_params<ppT> kzg_params<ppT>::read(const uint8_t* data, size_t length)
{
    const mp_size_t Q = ppT::Fq_type::num_limbs;
    const size_t G1_SIZE = Q * sizeof(mp_limb_t) * 2;
    const size_t G2_SIZE = Q * sizeof(mp_limb_t) * 4;

    if (data == nullptr || length < 4) {
        throw plonk_error(error_code::malformed_params, "parameter buffer is truncated");
    }

    const uint8_t* ptr = data;
    const uint32_t k = read_u32_be(ptr);
    if (k == 0 || k > scalar_t::s) {
        throw plonk_error(error_code::malformed_params, "parameter buffer declares k = " + std::to_string(k));
    }

    const size_t n = size_t(1) << k;
    if (length != 4 + 2 * n * G1_SIZE + 2 * G2_SIZE) {
        throw plonk_error(error_code::malformed_params,
            "parameter buffer of " + std::to_string(length) + " bytes does not match k = " + std::to_string(k));
    }

    libff::G1_vector<ppT> g;
    g.reserve(n);
    for (size_t i = 0; i < n; ++i)
        g.emplace_back(deserialize_g1_affine<Q, typename ppT::Fq_type, g1_t>(ptr));

    libff::G1_vector<ppT> g_lagrange;
    g_lagrange.reserve(n);
    for (size_t i = 0; i < n; ++i)
        g_lagrange.emplace_back(deserialize_g1_affine<Q, typename ppT::Fq_type, g1_t>(ptr));

    const g2_t g2 = deserialize_g2_affine<Q, typename ppT::Fqe_type, g2_t>(ptr);
    const g2_t s_g2 = deserialize_g2_affine<Q, typename ppT::Fqe_type, g2_t>(ptr);

    for (size_t i = 0; i < n; ++i) {
        if (!g[i].is_well_formed() || !g_lagrange[i].is_well_formed()) {
            throw plonk_error(error_code::malformed_params, "base " + std::to_string(i) + " is not on the curve");
        }
    }
    if (!g2.is_well_formed() || !s_g2.is_well_formed()) {
        throw plonk_error(error_code::malformed_params, "G2 element is not on the curve");
    }

    return kzg_params<ppT>(k, std::move(g), std::move(g_lagrange), g2, s_g2);
}

} // namespace zkplayground
