/**
 * @file kzg.hpp
 * @date 2026
 *
 * KZG commitment parameters over a pairing-friendly curve.
 *
 * The parameters carry the powers [s^i]G1 for committing to a polynomial in
 * coefficient form and the Lagrange bases [L_i(s)]G1 for committing to its
 * evaluations over the circuit domain directly. Both bases describe the same
 * commitment: commit(p) == commit_lagrange(evaluations of p).
 */

#pragma once

#include "domain.hpp"
#include "rng.hpp"

#include <stdint.h>
#include <vector>

#include <libff/algebra/curves/public_params.hpp>

namespace zkplayground {

template <typename FieldT>
struct blind {
    FieldT value;

    explicit blind(const FieldT& v)
        : value(v)
    {
    }

    static blind default_blind() { return blind(FieldT::zero()); }
};

template <typename ppT>
class kzg_params {
public:
    typedef libff::Fr<ppT> scalar_t;
    typedef libff::G1<ppT> g1_t;
    typedef libff::G2<ppT> g2_t;

    static kzg_params<ppT> setup(uint32_t k, xorshift_rng& rng);
    // s is public here; for demos and tests only
    static kzg_params<ppT> unsafe_setup_with_s(uint32_t k, const scalar_t& s);
    static kzg_params<ppT> read(const uint8_t* data, size_t length);

    uint32_t k() const { return k_; }
    size_t n() const { return g_.size(); }

    // KZG is not hiding; the blind is accepted for interface parity and ignored.
    g1_t commit(const polynomial<scalar_t, coeff_basis>& poly, const blind<scalar_t>& r) const;
    g1_t commit_lagrange(const polynomial<scalar_t, lagrange_basis>& poly, const blind<scalar_t>& r) const;

    kzg_params<ppT> verifier_params() const { return *this; }

    std::vector<uint8_t> write() const;
    size_t serialized_size() const;

    const libff::G1_vector<ppT>& g() const { return g_; }
    const libff::G1_vector<ppT>& g_lagrange() const { return g_lagrange_; }
    const g2_t& g2() const { return g2_; }
    const g2_t& s_g2() const { return s_g2_; }

private:
    kzg_params(uint32_t k,
        libff::G1_vector<ppT> g,
        libff::G1_vector<ppT> g_lagrange,
        const g2_t& g2,
        const g2_t& s_g2);

    uint32_t k_;
    libff::G1_vector<ppT> g_;
    libff::G1_vector<ppT> g_lagrange_;
    g2_t g2_;
    g2_t s_g2_;
};

} // namespace zkplayground

#include "kzg.tcc"
