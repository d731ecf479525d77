/*
 * measurement.hpp
 *
 * The contracts between a measurement strategy and the harness driving it.
 */

#ifndef MEASUREMENT_HPP_
#define MEASUREMENT_HPP_

#include "throughput.hpp"

#include <string>
#include <vector>

/**
 * Turns measured values (already converted to double by the measurement) into
 * strings and unit labels for reporting.
 *
 * The scale_* methods may rewrite the values in place so that they are expressed
 * in the unit named by the returned label.
 */
struct value_formatter {
    /** format a single value, including its unit */
    virtual std::string format_value(double value) const = 0;

    /** format a value as a throughput figure for the given per-iteration throughput */
    virtual std::string format_throughput(const throughput& t, double value) const = 0;

    /**
     * Scale values for human consumption. typical_value is a representative value
     * (e.g., the mean) that an implementation may use to choose a scale.
     */
    virtual const char* scale_values(double typical_value, std::vector<double>& values) const = 0;

    /** scale values to express throughput in the unit returned */
    virtual const char* scale_throughputs(double typical_value, const throughput& t,
            std::vector<double>& values) const = 0;

    /** scale values for machine-readable output */
    virtual const char* scale_for_machines(std::vector<double>& values) const = 0;

    virtual ~value_formatter() {}
};

/*
 * A measurement is any type M usable as the template argument of the harness
 * (see harness.hpp). It must provide:
 *
 *   typename M::intermediate_t   state carried from start() to end()
 *   typename M::value_t          a measured value
 *
 *   intermediate_t start() const;
 *   value_t end(intermediate_t i) const;
 *   value_t add(const value_t& v1, const value_t& v2) const;
 *   value_t zero() const;
 *   double to_f64(const value_t& v) const;
 *   const value_formatter& formatter() const;
 *
 * add must be associative and commutative with zero() as its identity, since the
 * harness accumulates samples in any order.
 */

#endif /* MEASUREMENT_HPP_ */
