/**
 * @file ffi.hpp
 * @date 2026
 */

#pragma once

#include <cstdlib>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

struct buffer_t {
    uint8_t* data;
    int32_t length;
};

struct commit_result_t {
    int32_t status;
    buffer_t commitments;
    commit_result_t(int32_t code, buffer_t& commitments_buf)
        : status(code)
        , commitments(commitments_buf)
    {
    }
};

void __alloc(buffer_t* buffer, size_t length);
void __free(uint8_t* ptr);

#ifdef __cplusplus
} // extern "C"
#endif
