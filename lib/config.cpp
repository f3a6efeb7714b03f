#include "config.hpp"

#include <cerrno>
#include <cstdlib>
#include <stdexcept>

namespace zkplayground {

static int hex_digit(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

rng_seed_t parse_seed(const std::string& hex)
{
    rng_seed_t seed;
    if (hex.size() != 2 * seed.size()) {
        throw std::invalid_argument("seed must be " + std::to_string(2 * seed.size()) + " hex digits");
    }
    for (size_t i = 0; i < seed.size(); i++) {
        const int hi = hex_digit(hex[2 * i]);
        const int lo = hex_digit(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("seed contains a non-hex digit: " + hex);
        }
        seed[i] = uint8_t((hi << 4) | lo);
    }
    return seed;
}

static uint32_t parse_k(const std::string& value)
{
    char* end = nullptr;
    errno = 0;
    const unsigned long k = std::strtoul(value.c_str(), &end, 10);
    if (value.empty() || *end != '\0' || errno == ERANGE || k == 0 || k > 28) {
        throw std::invalid_argument("k must be an integer in [1, 28], got '" + value + "'");
    }
    return uint32_t(k);
}

run_config parse_run_config(int argc, const char* const* argv, const run_config& defaults)
{
    run_config config = defaults;
    for (int i = 1; i < argc; i++) {
        const std::string arg = argv[i];
        if (arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "--k" || arg == "--seed") {
            if (i + 1 >= argc) {
                throw std::invalid_argument(arg + " expects a value");
            }
            const std::string value = argv[++i];
            if (arg == "--k") {
                config.k = parse_k(value);
            } else {
                config.seed = parse_seed(value);
            }
        } else {
            throw std::invalid_argument("unknown argument '" + arg + "'");
        }
    }
    return config;
}

std::string usage(const std::string& program)
{
    return "usage: " + program + " [--k <n>] [--seed <32 hex digits>] [--verbose]";
}

} // namespace zkplayground
