#pragma once

#include <libff/common/utils.hpp>

namespace zkplayground {

template <typename FieldT>
multiplication_gadget<FieldT>::multiplication_gadget(libsnark::protoboard<FieldT>& pb, const std::string& annotation_prefix)
    : libsnark::gadget<FieldT>(pb, annotation_prefix)
{
    c.allocate(pb, FMT(this->annotation_prefix, " c"));
    a.allocate(pb, FMT(this->annotation_prefix, " a"));
    b.allocate(pb, FMT(this->annotation_prefix, " b"));
}

template <typename FieldT>
void multiplication_gadget<FieldT>::generate_r1cs_constraints()
{
    this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(a, b, c), FMT(this->annotation_prefix, " mul"));
}

template <typename FieldT>
void multiplication_gadget<FieldT>::generate_r1cs_witness(const FieldT& a_value, const FieldT& b_value)
{
    this->pb.val(a) = a_value;
    this->pb.val(b) = b_value;
    this->pb.val(c) = a_value * b_value;
}

template <typename FieldT>
std::vector<FieldT> multiplication_gadget<FieldT>::instance_column() const
{
    return { FieldT::zero(), this->pb.val(c) };
}

template <typename FieldT>
constraint_system_shape multiplication_gadget<FieldT>::shape()
{
    constraint_system_shape cs;
    cs.advice_column(2); // lhs, and the product on the next row
    cs.advice_column(1); // rhs
    cs.instance_column();
    cs.fixed_column(); // s_mul
    return cs;
}

} // namespace zkplayground
