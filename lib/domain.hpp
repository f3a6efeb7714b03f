/**
 * @file domain.hpp
 * @date 2026
 *
 * Evaluation domain of a circuit: n = 2^k rows, row i sitting at omega^i.
 * Polynomials are tagged with the basis their values are expressed in.
 */

#pragma once

#include <memory>
#include <stdint.h>
#include <vector>

#include <libfqfft/evaluation_domain/evaluation_domain.hpp>

namespace zkplayground {

struct coeff_basis {
};

struct lagrange_basis {
};

template <typename FieldT, typename Basis>
class polynomial {
public:
    polynomial() { }
    explicit polynomial(std::vector<FieldT> values)
        : values_(std::move(values))
    {
    }

    size_t size() const { return values_.size(); }
    const FieldT& operator[](size_t i) const { return values_[i]; }
    FieldT& operator[](size_t i) { return values_[i]; }
    const std::vector<FieldT>& values() const { return values_; }

    typename std::vector<FieldT>::const_iterator begin() const { return values_.begin(); }
    typename std::vector<FieldT>::const_iterator end() const { return values_.end(); }

private:
    std::vector<FieldT> values_;
};

template <typename FieldT>
class evaluation_domain {
public:
    explicit evaluation_domain(uint32_t k);

    uint32_t k() const { return k_; }
    size_t n() const { return n_; }

    polynomial<FieldT, lagrange_basis> lagrange_from_vec(std::vector<FieldT> values) const;
    polynomial<FieldT, coeff_basis> coeff_from_vec(std::vector<FieldT> values) const;
    polynomial<FieldT, lagrange_basis> empty_lagrange() const;

    polynomial<FieldT, coeff_basis> lagrange_to_coeff(const polynomial<FieldT, lagrange_basis>& poly) const;

    // L_i(x) for every row i
    std::vector<FieldT> evaluate_all_lagrange_polynomials(const FieldT& x) const;
    FieldT get_domain_element(size_t i) const;

private:
    static size_t checked_size(uint32_t k);

    uint32_t k_;
    size_t n_;
    std::shared_ptr<libfqfft::evaluation_domain<FieldT>> domain_;
};

} // namespace zkplayground

#include "domain.tcc"
