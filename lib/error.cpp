#include "error.hpp"

namespace zkplayground {

const char* error_code_name(error_code code)
{
    switch (code) {
    case error_code::ok:
        return "ok";
    case error_code::invalid_instances:
        return "invalid instances";
    case error_code::instance_too_large:
        return "instance too large";
    case error_code::not_enough_rows:
        return "not enough rows available";
    case error_code::invalid_polynomial_length:
        return "invalid polynomial length";
    case error_code::invalid_parameters:
        return "invalid parameters";
    case error_code::malformed_params:
        return "malformed parameters";
    case error_code::internal_error:
        return "internal error";
    }
    return "unknown error";
}

} // namespace zkplayground
