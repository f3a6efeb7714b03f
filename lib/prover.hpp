/**
 * @file prover.hpp
 * @date 2026
 *
 * Runs a protoboard through key generation, proving and verification with
 * the r1cs_ppzksnark proof system, passing the verification key and the proof
 * through their byte encodings on the way.
 */

#pragma once

#include <stdint.h>
#include <vector>

#include <libff/algebra/curves/public_params.hpp>
#include <libsnark/gadgetlib1/protoboard.hpp>
#include <libsnark/zk_proof_systems/ppzksnark/r1cs_ppzksnark/r1cs_ppzksnark.hpp>

namespace zkplayground {

struct proof_report {
    size_t proof_length;
    size_t vk_length;
    bool verified;
};

template <typename ppT>
std::vector<uint8_t> serialize_verification_key(const libsnark::r1cs_ppzksnark_verification_key<ppT>& vk);

template <typename ppT>
libsnark::r1cs_ppzksnark_verification_key<ppT> deserialize_verification_key(const std::vector<uint8_t>& buffer);

template <typename ppT>
std::vector<uint8_t> serialize_proof(const libsnark::r1cs_ppzksnark_proof<ppT>& proof);

template <typename ppT>
libsnark::r1cs_ppzksnark_proof<ppT> deserialize_proof(const std::vector<uint8_t>& buffer);

template <typename ppT>
proof_report prove_and_verify(const libsnark::protoboard<libff::Fr<ppT>>& pb);

} // namespace zkplayground

#include "prover.tcc"
