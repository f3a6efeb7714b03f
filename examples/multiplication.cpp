/**
 * @file multiplication.cpp
 * @date 2026
 *
 * Proves knowledge of a = 3, b = 5 with a * b = 15 public.
 */

#include "circuits/multiplication_gadget.hpp"
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
    run_config config(4);
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

    const FieldT a = FieldT(3);
    const FieldT b = FieldT(5);

    libsnark::protoboard<FieldT> pb;
    multiplication_gadget<FieldT> circuit(pb, "multiplication");
    pb.set_input_sizes(circuit.num_public_inputs());
    circuit.generate_r1cs_constraints();
    circuit.generate_r1cs_witness(a, b);

    if (!pb.is_satisfied()) {
        std::cerr << "constraint system is not satisfied" << std::endl;
        return 1;
    }

    try {
        xorshift_rng rng(config.seed);
        const kzg_params<ppT> general_params = kzg_params<ppT>::setup(config.k, rng);
        const kzg_params<ppT> verifier_params = general_params.verifier_params();

        const verifying_key<ppT> vk = keygen_vk(general_params, multiplication_gadget<FieldT>::shape());

        std::vector<instance_set<ppT>> instances(1);
        instances[0].push_back(circuit.instance_column());
        const std::vector<std::vector<libff::G1<ppT>>> commitments = commit_instances(verifier_params, vk, instances);

        std::cout << "instance commitment : "
                  << g1_affine_as_hex<libff::alt_bn128_q_limbs>(commitments[0][0]) << std::endl;

        const proof_report report = prove_and_verify<ppT>(pb);
        std::cout << "proof length : " << report.proof_length << std::endl;
        std::cout << "vk length : " << report.vk_length << std::endl;

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
