/*
 * cycle-source.hpp
 *
 * Raw access to the free-running cycle counter of the current CPU.
 */

#ifndef CYCLE_SOURCE_HPP_
#define CYCLE_SOURCE_HPP_

#include <cinttypes>

#if defined(__x86_64__) || defined(__i386__)
#include <x86intrin.h>
#elif defined(__aarch64__)
// cntvct_el0 is read directly below
#else
#error "cycles-per-byte relies on x86, x86_64 or aarch64"
#endif

namespace cycles {

/**
 * Read the cycle counter.
 *
 * On x86 this is the TSC, read with a bare rdtsc: there is no fence, so the
 * read may be reordered with the surrounding instructions. On aarch64 this is
 * the virtual counter (cntvct_el0), which ticks at the generic timer frequency
 * rather than the core clock.
 *
 * The instruction is executed unconditionally, support is not checked first.
 */
static inline uint64_t now() {
#if defined(__aarch64__)
    uint64_t virtual_timer_value;
    asm volatile("mrs %0, cntvct_el0" : "=r"(virtual_timer_value));
    return virtual_timer_value;
#else
    return __rdtsc();
#endif
}

}

#endif /* CYCLE_SOURCE_HPP_ */
