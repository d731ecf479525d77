/*
 * cycles-per-byte.hpp
 *
 * A measurement that counts clock cycles rather than wall-clock time. Cycles per
 * byte (cpb) is the customary figure of merit for cryptographic and other
 * byte-crunching code.
 */

#ifndef CYCLES_PER_BYTE_HPP_
#define CYCLES_PER_BYTE_HPP_

#include "cycle-source.hpp"
#include "measurement.hpp"

#include <cinttypes>

/**
 * Formats cycle counts. Cycles have no natural magnitude prefixes, so values are
 * only ever divided by an explicit throughput, never rescaled otherwise.
 */
struct CyclesPerByteFormatter : value_formatter {
    virtual std::string format_value(double value) const override;
    virtual std::string format_throughput(const throughput& t, double value) const override;
    virtual const char* scale_values(double typical_value, std::vector<double>& values) const override;
    virtual const char* scale_throughputs(double typical_value, const throughput& t,
            std::vector<double>& values) const override;
    virtual const char* scale_for_machines(std::vector<double>& values) const override;
};

/**
 * Measures with the cycle counter from cycle-source.hpp. See measurement.hpp for
 * the contract.
 */
struct CyclesPerByte {
    using intermediate_t = uint64_t;
    using value_t        = uint64_t;

    intermediate_t start() const {
        return cycles::now();
    }

    /* a counter that went backwards (e.g., after migrating to another CPU) gives 0 */
    value_t end(intermediate_t i) const {
        return saturating_delta(i, cycles::now());
    }

    value_t add(const value_t& v1, const value_t& v2) const {
        return v1 + v2;
    }

    value_t zero() const {
        return 0;
    }

    /* exact up to 2^53 */
    double to_f64(const value_t& v) const {
        return (double)v;
    }

    const value_formatter& formatter() const;

    static value_t saturating_delta(uint64_t start, uint64_t end) {
        return end >= start ? end - start : 0;
    }
};

#endif /* CYCLES_PER_BYTE_HPP_ */
