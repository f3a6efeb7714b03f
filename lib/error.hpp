/**
 * @file error.hpp
 * @date 2026
 */

#pragma once

#include <stdexcept>
#include <string>

namespace zkplayground {

enum class error_code : int {
    ok = 0,
    invalid_instances = 1,
    instance_too_large = 2,
    not_enough_rows = 3,
    invalid_polynomial_length = 4,
    invalid_parameters = 5,
    malformed_params = 6,
    internal_error = 255
};

const char* error_code_name(error_code code);

class plonk_error : public std::runtime_error {
public:
    plonk_error(error_code code, const std::string& what)
        : std::runtime_error(what)
        , code_(code)
    {
    }

    error_code code() const { return code_; }

private:
    error_code code_;
};

} // namespace zkplayground
