/**
 * @file hash.cpp
 * @date 2026
 *
 * Proves knowledge of a 64-byte preimage of a public SHA-256 digest, over
 * parameters generated from the well-known secret GOD_PRIVATE_KEY.
 */

#include "circuits/hash_gadget.hpp"
#include "config.hpp"
#include "error.hpp"
#include "instances.hpp"
#include "kzg.hpp"
#include "prover.hpp"
#include "util.tcc"
#include "verifying_key.hpp"

#include <iostream>
#include <stdexcept>

#include <libff/algebra/curves/alt_bn128/alt_bn128_pp.hpp>
#include <libff/common/profiling.hpp>

using namespace zkplayground;

typedef libff::alt_bn128_pp ppT;
typedef libff::Fr<ppT> FieldT;

int main(int argc, char** argv)
{
    run_config config(7);
    try {
        config = parse_run_config(argc, argv, config);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << std::endl
                  << usage(argv[0]) << std::endl;
        return 1;
    }

    libff::inhibit_profiling_info = !config.verbose;
    libff::inhibit_profiling_counters = !config.verbose;

    // initialize curve parameters
    ppT::init_public_params();

    xorshift_rng rng(config.seed);
    std::vector<uint8_t> message(HASH_MESSAGE_BYTES);
    for (size_t i = 0; i < message.size(); i++) {
        message[i] = uint8_t(rng.next_u32());
    }

    libsnark::protoboard<FieldT> pb;
    hash_gadget<FieldT> circuit(pb, "hash");
    pb.set_input_sizes(circuit.num_public_inputs());
    circuit.generate_r1cs_constraints();
    circuit.generate_r1cs_witness(message);

    if (!pb.is_satisfied()) {
        std::cerr << "constraint system is not satisfied" << std::endl;
        return 1;
    }

    const std::vector<uint8_t> digest = circuit.digest_bytes();
    std::cout << "message : " << encode_to_hex_string<2>(message.data(), message.size()) << std::endl;
    std::cout << "digest : " << encode_to_hex_string<2>(digest.data(), digest.size()) << std::endl;

    try {
        const kzg_params<ppT> general_params = kzg_params<ppT>::unsafe_setup_with_s(config.k, FieldT(GOD_PRIVATE_KEY));
        const kzg_params<ppT> verifier_params = general_params.verifier_params();

        const verifying_key<ppT> vk = keygen_vk(general_params, hash_gadget<FieldT>::shape());

        std::vector<instance_set<ppT>> instances(1);
        instances[0].push_back(circuit.instance_column());
        const std::vector<std::vector<libff::G1<ppT>>> commitments = commit_instances(verifier_params, vk, instances);

        std::cout << "instance commitment : "
                  << g1_affine_as_hex<libff::alt_bn128_q_limbs>(commitments[0][0]) << std::endl;

        const proof_report report = prove_and_verify<ppT>(pb);
        std::cout << "proof length : " << report.proof_length << std::endl;
        std::cout << "verifier parameters length : " << verifier_params.serialized_size() << std::endl;
        std::cout << "vk length: " << report.vk_length + vk.write().size() << std::endl;

        if (!report.verified) {
            std::cerr << "verify_proof failed" << std::endl;
            return 1;
        }
    } catch (const plonk_error& e) {
        std::cerr << error_code_name(e.code()) << ": " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
