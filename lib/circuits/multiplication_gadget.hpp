/**
 * @file multiplication_gadget.hpp
 * @date 2026
 *
 * Knowledge of a factorization: private a and b, public c = a * b.
 */

#pragma once

#include "../constraint_system.hpp"

#include <string>
#include <vector>

#include <libsnark/gadgetlib1/gadget.hpp>
#include <libsnark/gadgetlib1/protoboard.hpp>

namespace zkplayground {

template <typename FieldT>
class multiplication_gadget : public libsnark::gadget<FieldT> {
public:
    // primary input, allocated first
    libsnark::pb_variable<FieldT> c;

    libsnark::pb_variable<FieldT> a;
    libsnark::pb_variable<FieldT> b;

    multiplication_gadget(libsnark::protoboard<FieldT>& pb, const std::string& annotation_prefix);

    void generate_r1cs_constraints();
    void generate_r1cs_witness(const FieldT& a_value, const FieldT& b_value);

    size_t num_public_inputs() const { return 1; }

    // Row 0 is unused; row 1 carries the product.
    std::vector<FieldT> instance_column() const;

    static constraint_system_shape shape();
};

} // namespace zkplayground

#include "multiplication_gadget.tcc"
