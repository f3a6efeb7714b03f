#pragma once

#include "ffi.hpp"

#include <cstring>
#include <iomanip>
#include <sstream>
#include <string>

#include <libff/algebra/fields/bigint.hpp>

namespace zkplayground {

template <int W>
std::string encode_to_hex_string(const uint8_t* in, size_t length)
{
    std::ostringstream out;
    out << std::setfill('0');
    for (size_t i = 0; i < length; i++) {
        out << std::hex << std::setw(W) << static_cast<unsigned int>(in[i]);
    }
    return out.str();
}

// conversion byte[N * 8] (big endian) -> libff bigint
template <mp_size_t N>
libff::bigint<N> to_libff_bigint(const uint8_t* input)
{
    libff::bigint<N> x;
    for (unsigned i = 0; i < N; i++) {
        for (unsigned j = 0; j < 8; j++) {
            x.data[N - 1 - i] |= uint64_t(input[i * 8 + j]) << (8 * (7 - j));
        }
    }
    return x;
}

// conversion libff bigint -> byte[N * 8] (big endian)
template <mp_size_t N>
void from_libff_bigint(const libff::bigint<N>& x, uint8_t* out)
{
    for (unsigned i = 0; i < N; i++) {
        for (unsigned j = 0; j < 8; j++) {
            out[i * 8 + j] = uint8_t(uint64_t(x.data[N - 1 - i]) >> (8 * (7 - j)));
        }
    }
}

inline void write_u32_be(uint32_t value, uint8_t*& buffer)
{
    for (unsigned i = 0; i < 4; i++) {
        buffer[i] = uint8_t(value >> (8 * (3 - i)));
    }
    buffer += 4;
}

inline uint32_t read_u32_be(const uint8_t*& buffer)
{
    uint32_t value = 0;
    for (unsigned i = 0; i < 4; i++) {
        value = (value << 8) | buffer[i];
    }
    buffer += 4;
    return value;
}

// The identity has no affine form; it is written as (0, 0).
template <mp_size_t Q, typename G1>
void serialize_g1_affine(const G1& point, uint8_t*& buffer)
{
    const size_t ELEMENT_SIZE = Q * sizeof(mp_limb_t);

    if (point.is_zero()) {
        std::memset(buffer, 0, 2 * ELEMENT_SIZE);
        buffer += 2 * ELEMENT_SIZE;
        return;
    }

    G1 aff = point;
    aff.to_affine_coordinates();

    from_libff_bigint<Q>(aff.X.as_bigint(), buffer);
    buffer += ELEMENT_SIZE;
    from_libff_bigint<Q>(aff.Y.as_bigint(), buffer);
    buffer += ELEMENT_SIZE;
}

template <mp_size_t Q, typename G2>
void serialize_g2_affine(const G2& point, uint8_t*& buffer)
{
    const size_t ELEMENT_SIZE = Q * sizeof(mp_limb_t);

    if (point.is_zero()) {
        std::memset(buffer, 0, 4 * ELEMENT_SIZE);
        buffer += 4 * ELEMENT_SIZE;
        return;
    }

    G2 aff = point;
    aff.to_affine_coordinates();

    from_libff_bigint<Q>(aff.X.c0.as_bigint(), buffer);
    buffer += ELEMENT_SIZE;
    from_libff_bigint<Q>(aff.X.c1.as_bigint(), buffer);
    buffer += ELEMENT_SIZE;
    from_libff_bigint<Q>(aff.Y.c0.as_bigint(), buffer);
    buffer += ELEMENT_SIZE;
    from_libff_bigint<Q>(aff.Y.c1.as_bigint(), buffer);
    buffer += ELEMENT_SIZE;
}

template <mp_size_t Q, typename Fq, typename G1>
G1 deserialize_g1_affine(const uint8_t*& buffer)
{
    const size_t ELEMENT_SIZE = Q * sizeof(mp_limb_t);

    auto x = to_libff_bigint<Q>(buffer);
    buffer += ELEMENT_SIZE;
    auto y = to_libff_bigint<Q>(buffer);
    buffer += ELEMENT_SIZE;

    if (x.is_zero() && y.is_zero()) {
        return G1::zero();
    }
    return G1(Fq(x), Fq(y), Fq::one());
}

template <mp_size_t Q, typename Fq2, typename G2>
G2 deserialize_g2_affine(const uint8_t*& buffer)
{
    const size_t ELEMENT_SIZE = Q * sizeof(mp_limb_t);

    auto x0 = to_libff_bigint<Q>(buffer);
    buffer += ELEMENT_SIZE;
    auto x1 = to_libff_bigint<Q>(buffer);
    buffer += ELEMENT_SIZE;
    auto y0 = to_libff_bigint<Q>(buffer);
    buffer += ELEMENT_SIZE;
    auto y1 = to_libff_bigint<Q>(buffer);
    buffer += ELEMENT_SIZE;

    if (x0.is_zero() && x1.is_zero() && y0.is_zero() && y1.is_zero()) {
        return G2::zero();
    }

    auto x = Fq2(x0, x1);
    auto y = Fq2(y0, y1);
    return G2(x, y, Fq2::one());
}

template <mp_size_t Q, typename G1>
std::string g1_affine_as_hex(const G1& point)
{
    uint8_t bytes[2 * Q * sizeof(mp_limb_t)];
    uint8_t* ptr = bytes;
    serialize_g1_affine<Q, G1>(point, ptr);
    return "(0x" + encode_to_hex_string<2>(bytes, Q * sizeof(mp_limb_t)) + ", 0x"
        + encode_to_hex_string<2>(bytes + Q * sizeof(mp_limb_t), Q * sizeof(mp_limb_t)) + ")";
}

inline buffer_t create_buffer(size_t length)
{
    buffer_t buffer;
    __alloc(&buffer, length);
    return buffer;
}

} // namespace zkplayground
