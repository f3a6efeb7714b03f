/**
 * @file rng.hpp
 * @date 2026
 *
 * Deterministic generator used to seed setups and demo witnesses.
 * Not suitable for producing real toxic waste.
 */

#pragma once

#include <array>
#include <stdint.h>

#include <gmp.h>
#include <libff/algebra/fields/bigint.hpp>

namespace zkplayground {

typedef std::array<uint8_t, 16> rng_seed_t;

// 59 62 be 5d 76 3d 31 8d 17 db 37 32 54 06 bc e5
extern const rng_seed_t DEFAULT_SEED;

class xorshift_rng {
public:
    explicit xorshift_rng(const rng_seed_t& seed);

    uint32_t next_u32();
    uint64_t next_u64();

private:
    uint32_t x_;
    uint32_t y_;
    uint32_t z_;
    uint32_t w_;
};

template <typename FieldT>
FieldT random_field_element(xorshift_rng& rng)
{
    const mp_size_t n = FieldT::num_limbs;
    const size_t top_bits = FieldT::num_bits % GMP_NUMB_BITS;

    libff::bigint<FieldT::num_limbs> r;
    do {
        for (mp_size_t i = 0; i < n; ++i) {
            r.data[i] = rng.next_u64();
        }
        if (top_bits != 0) {
            r.data[n - 1] &= (mp_limb_t(1) << top_bits) - 1;
        }
    } while (mpn_cmp(r.data, FieldT::mod.data, n) >= 0);

    return FieldT(r);
}

} // namespace zkplayground
