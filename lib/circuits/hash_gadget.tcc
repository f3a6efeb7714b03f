#pragma once

#include <stdexcept>

#include <libff/common/utils.hpp>

namespace zkplayground {

template <typename FieldT>
hash_gadget<FieldT>::hash_gadget(libsnark::protoboard<FieldT>& pb, const std::string& annotation_prefix)
    : libsnark::gadget<FieldT>(pb, annotation_prefix)
{
    packed_digest.allocate(pb, packed_digest_size(), FMT(this->annotation_prefix, " packed_digest"));

    zero.allocate(pb, FMT(this->annotation_prefix, " zero"));
    message.allocate(pb, libsnark::SHA256_block_size, FMT(this->annotation_prefix, " message"));

    message_block.reset(new libsnark::block_variable<FieldT>(pb, { message }, FMT(this->annotation_prefix, " message_block")));

    // the message fills the first block, so all padding lands in a second one
    padding_block.reset(new libsnark::block_variable<FieldT>(pb, { padding_bits() }, FMT(this->annotation_prefix, " padding_block")));

    intermediate_hash.reset(new libsnark::digest_variable<FieldT>(pb, libsnark::SHA256_digest_size, FMT(this->annotation_prefix, " intermediate")));
    digest.reset(new libsnark::digest_variable<FieldT>(pb, libsnark::SHA256_digest_size, FMT(this->annotation_prefix, " digest")));

    hasher1.reset(new libsnark::sha256_compression_function_gadget<FieldT>(
        pb,
        libsnark::SHA256_default_IV<FieldT>(pb),
        message_block->bits,
        *intermediate_hash,
        FMT(this->annotation_prefix, " hasher1")));

    libsnark::pb_linear_combination_array<FieldT> iv2(intermediate_hash->bits);

    hasher2.reset(new libsnark::sha256_compression_function_gadget<FieldT>(
        pb,
        iv2,
        padding_block->bits,
        *digest,
        FMT(this->annotation_prefix, " hasher2")));

    packer.reset(new libsnark::multipacking_gadget<FieldT>(
        pb,
        digest->bits,
        packed_digest,
        FieldT::capacity(),
        FMT(this->annotation_prefix, " packer")));
}

template <typename FieldT>
libsnark::pb_variable_array<FieldT> hash_gadget<FieldT>::padding_bits() const
{
    const uint64_t message_length = libsnark::SHA256_block_size;
    const libsnark::pb_variable<FieldT> one(0);

    // a single 1 bit, zeros, then the message length as a 64-bit big endian integer
    libsnark::pb_variable_array<FieldT> bits;
    for (size_t i = 0; i < libsnark::SHA256_block_size; ++i) {
        bool bit = (i == 0);
        if (i >= libsnark::SHA256_block_size - 64) {
            bit = (message_length >> (libsnark::SHA256_block_size - 1 - i)) & 1;
        }
        bits.emplace_back(bit ? one : zero);
    }
    return bits;
}

template <typename FieldT>
void hash_gadget<FieldT>::generate_r1cs_constraints()
{
    libsnark::generate_r1cs_equals_const_constraint<FieldT>(this->pb, zero, FieldT::zero(), FMT(this->annotation_prefix, " zero"));

    for (size_t i = 0; i < message.size(); ++i) {
        libsnark::generate_boolean_r1cs_constraint<FieldT>(this->pb, message[i], FMT(this->annotation_prefix, " message_%zu", i));
    }

    hasher1->generate_r1cs_constraints();
    intermediate_hash->generate_r1cs_constraints();
    hasher2->generate_r1cs_constraints();
    digest->generate_r1cs_constraints();

    // digest bits are already boolean
    packer->generate_r1cs_constraints(false);
}

template <typename FieldT>
void hash_gadget<FieldT>::generate_r1cs_witness(const std::vector<uint8_t>& message_bytes)
{
    if (message_bytes.size() != HASH_MESSAGE_BYTES) {
        throw std::invalid_argument("hash_gadget expects a " + std::to_string(HASH_MESSAGE_BYTES) + "-byte message");
    }

    this->pb.val(zero) = FieldT::zero();

    libff::bit_vector bits;
    bits.reserve(8 * message_bytes.size());
    for (uint8_t byte : message_bytes) {
        for (int j = 7; j >= 0; --j) {
            bits.push_back((byte >> j) & 1);
        }
    }
    message.fill_with_bits(this->pb, bits);

    hasher1->generate_r1cs_witness();
    hasher2->generate_r1cs_witness();
    packer->generate_r1cs_witness_from_bits();
}

template <typename FieldT>
std::vector<FieldT> hash_gadget<FieldT>::instance_column() const
{
    return packed_digest.get_vals(this->pb);
}

template <typename FieldT>
std::vector<uint8_t> hash_gadget<FieldT>::digest_bytes() const
{
    const libff::bit_vector bits = digest->get_digest();

    std::vector<uint8_t> bytes(bits.size() / 8, 0);
    for (size_t i = 0; i < bits.size(); ++i) {
        if (bits[i]) {
            bytes[i / 8] |= uint8_t(1 << (7 - (i % 8)));
        }
    }
    return bytes;
}

template <typename FieldT>
size_t hash_gadget<FieldT>::packed_digest_size()
{
    const size_t chunk_size = FieldT::capacity();
    return (libsnark::SHA256_digest_size + chunk_size - 1) / chunk_size;
}

template <typename FieldT>
constraint_system_shape hash_gadget<FieldT>::shape()
{
    constraint_system_shape cs;
    // eight working variables, each round reading its successor row
    for (size_t i = 0; i < 8; ++i) {
        cs.advice_column(2);
    }
    cs.instance_column();
    cs.fixed_column(); // round constants
    cs.fixed_column(); // round selector
    return cs;
}

} // namespace zkplayground
