#pragma once

#include "error.hpp"

#include <string>

#include <libfqfft/evaluation_domain/get_evaluation_domain.hpp>

namespace zkplayground {

template <typename FieldT>
size_t evaluation_domain<FieldT>::checked_size(uint32_t k)
{
    if (k == 0 || k > FieldT::s) {
        throw plonk_error(error_code::invalid_parameters,
            "domain size 2^" + std::to_string(k) + " is not supported by the scalar field");
    }
    return size_t(1) << k;
}

template <typename FieldT>
evaluation_domain<FieldT>::evaluation_domain(uint32_t k)
    : k_(k)
    , n_(checked_size(k))
{
    domain_ = libfqfft::get_evaluation_domain<FieldT>(n_);
    if (domain_->m != n_) {
        throw plonk_error(error_code::invalid_parameters,
            "no radix-2 domain of size " + std::to_string(n_));
    }
}

template <typename FieldT>
polynomial<FieldT, lagrange_basis> evaluation_domain<FieldT>::lagrange_from_vec(std::vector<FieldT> values) const
{
    if (values.size() != n_) {
        throw plonk_error(error_code::invalid_polynomial_length,
            "expected " + std::to_string(n_) + " evaluations, got " + std::to_string(values.size()));
    }
    return polynomial<FieldT, lagrange_basis>(std::move(values));
}

template <typename FieldT>
polynomial<FieldT, coeff_basis> evaluation_domain<FieldT>::coeff_from_vec(std::vector<FieldT> values) const
{
    if (values.size() != n_) {
        throw plonk_error(error_code::invalid_polynomial_length,
            "expected " + std::to_string(n_) + " coefficients, got " + std::to_string(values.size()));
    }
    return polynomial<FieldT, coeff_basis>(std::move(values));
}

template <typename FieldT>
polynomial<FieldT, lagrange_basis> evaluation_domain<FieldT>::empty_lagrange() const
{
    return polynomial<FieldT, lagrange_basis>(std::vector<FieldT>(n_, FieldT::zero()));
}

template <typename FieldT>
polynomial<FieldT, coeff_basis> evaluation_domain<FieldT>::lagrange_to_coeff(const polynomial<FieldT, lagrange_basis>& poly) const
{
    std::vector<FieldT> values(poly.values());
    domain_->iFFT(values);
    return polynomial<FieldT, coeff_basis>(std::move(values));
}

template <typename FieldT>
std::vector<FieldT> evaluation_domain<FieldT>::evaluate_all_lagrange_polynomials(const FieldT& x) const
{
    return domain_->evaluate_all_lagrange_polynomials(x);
}

template <typename FieldT>
FieldT evaluation_domain<FieldT>::get_domain_element(size_t i) const
{
    return domain_->get_domain_element(i);
}

} // namespace zkplayground
