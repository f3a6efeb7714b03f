/**
 * @file config.hpp
 * @date 2026
 */

#pragma once

#include "rng.hpp"

#include <stdint.h>
#include <string>

namespace zkplayground {

// Setup secret of the demo parameters.
const uint64_t GOD_PRIVATE_KEY = 42;

struct run_config {
    uint32_t k;
    rng_seed_t seed;
    bool verbose;

    explicit run_config(uint32_t default_k)
        : k(default_k)
        , seed(DEFAULT_SEED)
        , verbose(false)
    {
    }
};

/**
 * Reads `--k <n>`, `--seed <32 hex digits>` and `--verbose` over the given
 * defaults. Throws std::invalid_argument on anything else.
 */
run_config parse_run_config(int argc, const char* const* argv, const run_config& defaults);

rng_seed_t parse_seed(const std::string& hex);

std::string usage(const std::string& program);

} // namespace zkplayground
