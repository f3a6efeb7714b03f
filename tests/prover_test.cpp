#include "circuits/multiplication_gadget.hpp"
#include "error.hpp"
#include "prover.hpp"
#include "util.tcc"

#include <gtest/gtest.h>

#include <libff/algebra/curves/alt_bn128/alt_bn128_pp.hpp>

using namespace zkplayground;

namespace {

typedef libff::alt_bn128_pp ppT;
typedef libff::Fr<ppT> FieldT;

class ProverTest : public ::testing::Test {
protected:
    ProverTest()
        : circuit(pb, "multiplication")
    {
        pb.set_input_sizes(circuit.num_public_inputs());
        circuit.generate_r1cs_constraints();
        circuit.generate_r1cs_witness(FieldT(3), FieldT(5));
    }

    libsnark::protoboard<FieldT> pb;
    multiplication_gadget<FieldT> circuit;
};

TEST_F(ProverTest, VerifiesMultiplication)
{
    const proof_report report = prove_and_verify<ppT>(pb);

    EXPECT_TRUE(report.verified);
    // 7 G1 + 1 G2
    EXPECT_EQ(576u, report.proof_length);
    // 3 G1 + 5 G2 + one IC entry per public input
    EXPECT_EQ(896u, report.vk_length);
}

TEST_F(ProverTest, RejectsOtherPublicInput)
{
    const libsnark::r1cs_ppzksnark_keypair<ppT> keypair = libsnark::r1cs_ppzksnark_generator<ppT>(pb.get_constraint_system());
    const libsnark::r1cs_ppzksnark_proof<ppT> proof = libsnark::r1cs_ppzksnark_prover<ppT>(keypair.pk, pb.primary_input(), pb.auxiliary_input());

    const libsnark::r1cs_ppzksnark_verification_key<ppT> vk = deserialize_verification_key<ppT>(serialize_verification_key<ppT>(keypair.vk));
    const libsnark::r1cs_ppzksnark_proof<ppT> received = deserialize_proof<ppT>(serialize_proof<ppT>(proof));

    EXPECT_TRUE(libsnark::r1cs_ppzksnark_verifier_strong_IC<ppT>(vk, pb.primary_input(), received));
    EXPECT_FALSE(libsnark::r1cs_ppzksnark_verifier_strong_IC<ppT>(vk, libsnark::r1cs_primary_input<FieldT>({ FieldT(16) }), received));
}

TEST_F(ProverTest, EncodingsSurviveDecoding)
{
    const libsnark::r1cs_ppzksnark_keypair<ppT> keypair = libsnark::r1cs_ppzksnark_generator<ppT>(pb.get_constraint_system());
    const libsnark::r1cs_ppzksnark_proof<ppT> proof = libsnark::r1cs_ppzksnark_prover<ppT>(keypair.pk, pb.primary_input(), pb.auxiliary_input());

    const std::vector<uint8_t> vk_buf = serialize_verification_key<ppT>(keypair.vk);
    EXPECT_EQ(vk_buf, serialize_verification_key<ppT>(deserialize_verification_key<ppT>(vk_buf)));

    const std::vector<uint8_t> proof_buf = serialize_proof<ppT>(proof);
    EXPECT_TRUE(deserialize_proof<ppT>(proof_buf) == proof);
}

TEST_F(ProverTest, EncodesPointsAtFixedOffsets)
{
    typedef libff::G1<ppT> G1;
    typedef libff::G2<ppT> G2;
    const mp_size_t Q = libff::alt_bn128_q_limbs;

    const libsnark::r1cs_ppzksnark_keypair<ppT> keypair = libsnark::r1cs_ppzksnark_generator<ppT>(pb.get_constraint_system());
    const libsnark::r1cs_ppzksnark_proof<ppT> proof = libsnark::r1cs_ppzksnark_prover<ppT>(keypair.pk, pb.primary_input(), pb.auxiliary_input());

    // vk: alphaA (G2) at 0, alphaB (G1) at 128, IC rest after the 832 fixed bytes
    std::vector<uint8_t> expected(128 + 64 + 64);
    uint8_t* ptr = expected.data();
    serialize_g2_affine<Q, G2>(keypair.vk.alphaA_g2, ptr);
    serialize_g1_affine<Q, G1>(keypair.vk.alphaB_g1, ptr);
    serialize_g1_affine<Q, G1>(keypair.vk.encoded_IC_query.rest.values[0], ptr);

    const std::vector<uint8_t> vk_buf = serialize_verification_key<ppT>(keypair.vk);
    ASSERT_EQ(896u, vk_buf.size());
    EXPECT_EQ(std::vector<uint8_t>(expected.begin(), expected.begin() + 192), std::vector<uint8_t>(vk_buf.begin(), vk_buf.begin() + 192));
    EXPECT_EQ(std::vector<uint8_t>(expected.begin() + 192, expected.end()), std::vector<uint8_t>(vk_buf.begin() + 832, vk_buf.end()));

    // proof: b (G2) at 128, k (G1) in the last 64 bytes
    std::vector<uint8_t> proof_expected(128 + 64);
    ptr = proof_expected.data();
    serialize_g2_affine<Q, G2>(proof.g_B.g, ptr);
    serialize_g1_affine<Q, G1>(proof.g_K, ptr);

    const std::vector<uint8_t> proof_buf = serialize_proof<ppT>(proof);
    ASSERT_EQ(576u, proof_buf.size());
    EXPECT_EQ(std::vector<uint8_t>(proof_expected.begin(), proof_expected.begin() + 128), std::vector<uint8_t>(proof_buf.begin() + 128, proof_buf.begin() + 256));
    EXPECT_EQ(std::vector<uint8_t>(proof_expected.begin() + 128, proof_expected.end()), std::vector<uint8_t>(proof_buf.end() - 64, proof_buf.end()));
}

TEST_F(ProverTest, RejectsMalformedEncodings)
{
    try {
        deserialize_proof<ppT>(std::vector<uint8_t>(575, 0));
        FAIL() << "575-byte proof accepted";
    } catch (const plonk_error& e) {
        EXPECT_EQ(error_code::malformed_params, e.code());
    }

    EXPECT_THROW(deserialize_verification_key<ppT>(std::vector<uint8_t>(832 + 1, 0)), plonk_error);
    EXPECT_THROW(deserialize_verification_key<ppT>(std::vector<uint8_t>(100, 0)), plonk_error);
}

} // namespace
