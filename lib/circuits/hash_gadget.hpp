/**
 * @file hash_gadget.hpp
 * @date 2026
 *
 * Knowledge of a 64-byte preimage of a public SHA-256 digest.
 *
 * The message fills one 512-bit block; a second compression runs over the
 * standard padding block. The 256 digest bits are packed into field elements,
 * which form the primary input.
 */

#pragma once

#include "../constraint_system.hpp"

#include <memory>
#include <stdint.h>
#include <string>
#include <vector>

#include <libsnark/gadgetlib1/gadget.hpp>
#include <libsnark/gadgetlib1/gadgets/basic_gadgets.hpp>
#include <libsnark/gadgetlib1/gadgets/hashes/hash_io.hpp>
#include <libsnark/gadgetlib1/gadgets/hashes/sha256/sha256_components.hpp>
#include <libsnark/gadgetlib1/gadgets/hashes/sha256/sha256_gadget.hpp>
#include <libsnark/gadgetlib1/protoboard.hpp>

namespace zkplayground {

const size_t HASH_MESSAGE_BYTES = 64;

template <typename FieldT>
class hash_gadget : public libsnark::gadget<FieldT> {
public:
    // primary input, allocated first
    libsnark::pb_variable_array<FieldT> packed_digest;

    libsnark::pb_variable_array<FieldT> message;

    hash_gadget(libsnark::protoboard<FieldT>& pb, const std::string& annotation_prefix);

    void generate_r1cs_constraints();
    void generate_r1cs_witness(const std::vector<uint8_t>& message_bytes);

    size_t num_public_inputs() const { return packed_digest.size(); }

    std::vector<FieldT> instance_column() const;
    std::vector<uint8_t> digest_bytes() const;

    static size_t packed_digest_size();
    static constraint_system_shape shape();

private:
    libsnark::pb_variable<FieldT> zero;

    std::shared_ptr<libsnark::block_variable<FieldT>> message_block;
    std::shared_ptr<libsnark::block_variable<FieldT>> padding_block;
    std::shared_ptr<libsnark::digest_variable<FieldT>> intermediate_hash;
    std::shared_ptr<libsnark::digest_variable<FieldT>> digest;

    std::shared_ptr<libsnark::sha256_compression_function_gadget<FieldT>> hasher1;
    std::shared_ptr<libsnark::sha256_compression_function_gadget<FieldT>> hasher2;
    std::shared_ptr<libsnark::multipacking_gadget<FieldT>> packer;

    libsnark::pb_variable_array<FieldT> padding_bits() const;
};

} // namespace zkplayground

#include "hash_gadget.tcc"
