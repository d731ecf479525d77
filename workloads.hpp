/*
 * workloads.hpp
 *
 * Sample code to benchmark with cpb-bench.
 */

#ifndef WORKLOADS_HPP_
#define WORKLOADS_HPP_

#include <cinttypes>
#include <cstddef>

/** nth fibonacci number by naive recursion */
uint64_t fibonacci_slow(uint64_t n);

/** nth fibonacci number, iteratively */
uint64_t fibonacci_fast(uint64_t n);

/** xor together all the bytes of buf */
uint8_t xor_fold(const uint8_t* buf, size_t len);

#endif /* WORKLOADS_HPP_ */
