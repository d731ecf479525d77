/*
 * workloads.cpp
 */

#include "workloads.hpp"

uint64_t fibonacci_slow(uint64_t n) {
    return n < 2 ? 1 : fibonacci_slow(n - 1) + fibonacci_slow(n - 2);
}

uint64_t fibonacci_fast(uint64_t n) {
    uint64_t a = 0, b = 1;
    for (uint64_t i = 0; i < n; i++) {
        uint64_t c = a + b;
        a = b;
        b = c;
    }
    return b;
}

uint8_t xor_fold(const uint8_t* buf, size_t len) {
    uint8_t ret = 0;
    for (size_t i = 0; i < len; i++) {
        ret ^= buf[i];
    }
    return ret;
}
