#pragma once

#include "error.hpp"
#include "util.tcc"

#include <cassert>
#include <cstdio>
#include <string>

#include <libff/common/profiling.hpp>
#include <libsnark/common/data_structures/accumulation_vector.hpp>
#include <libsnark/knowledge_commitment/knowledge_commitment.hpp>

namespace zkplayground {

namespace detail {

template <typename ppT>
struct encoded_sizes {
    static const mp_size_t Q = ppT::Fq_type::num_limbs;
    static const size_t G1_SIZE = Q * sizeof(mp_limb_t) * 2; // [x, y]
    static const size_t G2_SIZE = Q * sizeof(mp_limb_t) * 4; // [[x0, x1], [y0, y1]]
};

// Visits the fixed points of a verification key in encoding order:
// [ a, b, c, gamma, gamma_beta_1, gamma_beta_2, z, ic[0] ]
template <typename VerificationKey, typename Visitor>
void visit_verification_key(VerificationKey& vk, Visitor& visit)
{
    visit(vk.alphaA_g2);
    visit(vk.alphaB_g1);
    visit(vk.alphaC_g2);
    visit(vk.gamma_g2);
    visit(vk.gamma_beta_g1);
    visit(vk.gamma_beta_g2);
    visit(vk.rC_Z_g2);
    visit(vk.encoded_IC_query.first);
}

// [ a, a_p, b, b_p, c, c_p, h, k ]
template <typename Proof, typename Visitor>
void visit_proof(Proof& proof, Visitor& visit)
{
    visit(proof.g_A.g);
    visit(proof.g_A.h);
    visit(proof.g_B.g);
    visit(proof.g_B.h);
    visit(proof.g_C.g);
    visit(proof.g_C.h);
    visit(proof.g_H);
    visit(proof.g_K);
}

template <typename ppT>
class affine_encoder {
public:
    explicit affine_encoder(uint8_t* out)
        : ptr(out)
    {
    }

    void operator()(const libff::G1<ppT>& point) { serialize_g1_affine<encoded_sizes<ppT>::Q, libff::G1<ppT>>(point, ptr); }
    void operator()(const libff::G2<ppT>& point) { serialize_g2_affine<encoded_sizes<ppT>::Q, libff::G2<ppT>>(point, ptr); }

    uint8_t* ptr;
};

template <typename ppT>
class affine_decoder {
public:
    explicit affine_decoder(const uint8_t* in)
        : ptr(in)
    {
    }

    void operator()(libff::G1<ppT>& point)
    {
        point = deserialize_g1_affine<encoded_sizes<ppT>::Q, typename ppT::Fq_type, libff::G1<ppT>>(ptr);
    }
    void operator()(libff::G2<ppT>& point)
    {
        point = deserialize_g2_affine<encoded_sizes<ppT>::Q, typename ppT::Fqe_type, libff::G2<ppT>>(ptr);
    }

    const uint8_t* ptr;
};

template <typename ppT>
size_t verification_key_fixed_size()
{
    return (encoded_sizes<ppT>::G1_SIZE * 3) + (encoded_sizes<ppT>::G2_SIZE * 5);
}

template <typename ppT>
size_t proof_size()
{
    return (encoded_sizes<ppT>::G1_SIZE * 7) + encoded_sizes<ppT>::G2_SIZE;
}

} // namespace detail

template <typename ppT>
std::vector<uint8_t> serialize_verification_key(const libsnark::r1cs_ppzksnark_verification_key<ppT>& vk)
{
    const libsnark::sparse_vector<libff::G1<ppT>>& ic_rest = vk.encoded_IC_query.rest;

    std::vector<uint8_t> buffer(detail::verification_key_fixed_size<ppT>() + ic_rest.values.size() * detail::encoded_sizes<ppT>::G1_SIZE);
    detail::affine_encoder<ppT> encode(buffer.data());
    detail::visit_verification_key(vk, encode);
    for (const libff::G1<ppT>& point : ic_rest.values)
        encode(point);

    assert(encode.ptr == buffer.data() + buffer.size());
    return buffer;
}

template <typename ppT>
libsnark::r1cs_ppzksnark_verification_key<ppT> deserialize_verification_key(const std::vector<uint8_t>& buffer)
{
    const size_t fixed_size = detail::verification_key_fixed_size<ppT>();
    const size_t G1_SIZE = detail::encoded_sizes<ppT>::G1_SIZE;

    if (buffer.size() < fixed_size || (buffer.size() - fixed_size) % G1_SIZE != 0) {
        throw plonk_error(error_code::malformed_params,
            "verification key of " + std::to_string(buffer.size()) + " bytes is malformed");
    }

    libsnark::r1cs_ppzksnark_verification_key<ppT> vk;
    detail::affine_decoder<ppT> decode(buffer.data());
    detail::visit_verification_key(vk, decode);

    std::vector<libff::G1<ppT>> ic_rest((buffer.size() - fixed_size) / G1_SIZE);
    for (libff::G1<ppT>& point : ic_rest)
        decode(point);

    libff::G1<ppT> ic_first = vk.encoded_IC_query.first;
    vk.encoded_IC_query = libsnark::accumulation_vector<libff::G1<ppT>>(std::move(ic_first), std::move(ic_rest));
    return vk;
}

template <typename ppT>
std::vector<uint8_t> serialize_proof(const libsnark::r1cs_ppzksnark_proof<ppT>& proof)
{
    std::vector<uint8_t> buffer(detail::proof_size<ppT>());
    detail::affine_encoder<ppT> encode(buffer.data());
    detail::visit_proof(proof, encode);

    assert(encode.ptr == buffer.data() + buffer.size());
    return buffer;
}

template <typename ppT>
libsnark::r1cs_ppzksnark_proof<ppT> deserialize_proof(const std::vector<uint8_t>& buffer)
{
    if (buffer.size() != detail::proof_size<ppT>()) {
        throw plonk_error(error_code::malformed_params,
            "proof of " + std::to_string(buffer.size()) + " bytes is malformed");
    }

    libsnark::r1cs_ppzksnark_proof<ppT> proof;
    detail::affine_decoder<ppT> decode(buffer.data());
    detail::visit_proof(proof, decode);
    return proof;
}

template <typename ppT>
proof_report prove_and_verify(const libsnark::protoboard<libff::Fr<ppT>>& pb)
{
    libff::enter_block("Call to prove_and_verify");

    const libsnark::r1cs_ppzksnark_constraint_system<ppT> cs = pb.get_constraint_system();
    if (!libff::inhibit_profiling_info) {
        libff::print_indent();
        printf("* Constraints: %zu\n", cs.num_constraints());
        libff::print_indent();
        printf("* Public inputs: %zu\n", cs.num_inputs());
    }

    const libsnark::r1cs_ppzksnark_keypair<ppT> keypair = libsnark::r1cs_ppzksnark_generator<ppT>(cs);
    const libsnark::r1cs_ppzksnark_proof<ppT> proof = libsnark::r1cs_ppzksnark_prover<ppT>(keypair.pk, pb.primary_input(), pb.auxiliary_input());

    const std::vector<uint8_t> vk_buf = serialize_verification_key<ppT>(keypair.vk);
    const std::vector<uint8_t> proof_buf = serialize_proof<ppT>(proof);

    // verifier side: only the encodings cross over
    const libsnark::r1cs_ppzksnark_verification_key<ppT> vk = deserialize_verification_key<ppT>(vk_buf);
    const libsnark::r1cs_ppzksnark_proof<ppT> received = deserialize_proof<ppT>(proof_buf);

    proof_report report;
    report.proof_length = proof_buf.size();
    report.vk_length = vk_buf.size();
    report.verified = libsnark::r1cs_ppzksnark_verifier_strong_IC<ppT>(vk, pb.primary_input(), received);

    libff::leave_block("Call to prove_and_verify");
    return report;
}

} // namespace zkplayground
