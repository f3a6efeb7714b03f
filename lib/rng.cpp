#include "rng.hpp"

namespace zkplayground {

const rng_seed_t DEFAULT_SEED = { { 0x59, 0x62, 0xbe, 0x5d, 0x76, 0x3d, 0x31, 0x8d,
    0x17, 0xdb, 0x37, 0x32, 0x54, 0x06, 0xbc, 0xe5 } };

static uint32_t read_u32_le(const rng_seed_t& seed, size_t offset)
{
    return uint32_t(seed[offset])
        | (uint32_t(seed[offset + 1]) << 8)
        | (uint32_t(seed[offset + 2]) << 16)
        | (uint32_t(seed[offset + 3]) << 24);
}

xorshift_rng::xorshift_rng(const rng_seed_t& seed)
    : x_(read_u32_le(seed, 0))
    , y_(read_u32_le(seed, 4))
    , z_(read_u32_le(seed, 8))
    , w_(read_u32_le(seed, 12))
{
    // an all-zero state is a fixed point of xorshift
    if (x_ == 0 && y_ == 0 && z_ == 0 && w_ == 0) {
        x_ = 0x0DDB1A5E;
        y_ = 0x5BAD5EED;
        z_ = 0x7BAD5EED;
        w_ = 0x5DEECE66;
    }
}

uint32_t xorshift_rng::next_u32()
{
    const uint32_t t = x_ ^ (x_ << 11);
    x_ = y_;
    y_ = z_;
    z_ = w_;
    w_ = w_ ^ (w_ >> 19) ^ (t ^ (t >> 8));
    return w_;
}

uint64_t xorshift_rng::next_u64()
{
    const uint64_t lo = next_u32();
    const uint64_t hi = next_u32();
    return (hi << 32) | lo;
}

} // namespace zkplayground
