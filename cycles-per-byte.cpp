/*
 * cycles-per-byte.cpp
 */

#include "cycles-per-byte.hpp"
#include "table.hpp"

#include <cmath>

using table::string_format;

/* four decimals; NaN is spelled out so a sign bit doesn't print as "-nan" */
static std::string fixed4(double value) {
    if (std::isnan(value)) {
        return "NaN";
    }
    return string_format("%.4f", value);
}

const value_formatter& CyclesPerByte::formatter() const {
    static const CyclesPerByteFormatter instance{};
    return instance;
}

std::string CyclesPerByteFormatter::format_value(double value) const {
    return fixed4(value) + " cycles";
}

/*
 * A zero count is not special-cased: the division gives inf (or NaN for 0/0)
 * and that is what gets printed.
 */
std::string CyclesPerByteFormatter::format_throughput(const throughput& t, double value) const {
    switch (t.kind) {
    case throughput::BYTES:
        return fixed4(value / (double)t.count) + " cpb";
    case throughput::ELEMENTS:
        return fixed4(value) + string_format(" cycles/%" PRIu64, t.count);
    case throughput::BYTES_DECIMAL:
        return fixed4(value / (double)t.count) + " cpb (decimal)";
    }
    return format_value(value);
}

const char* CyclesPerByteFormatter::scale_values(double, std::vector<double>&) const {
    return "cycles";
}

const char* CyclesPerByteFormatter::scale_throughputs(double, const throughput& t,
        std::vector<double>& values) const {
    double divisor = (double)t.count;
    for (auto& v : values) {
        v /= divisor;
    }
    switch (t.kind) {
    case throughput::BYTES:
        return "cpb";
    case throughput::ELEMENTS:
        return "c/e";
    case throughput::BYTES_DECIMAL:
        return "cpb (decimal)";
    }
    return "cycles";
}

const char* CyclesPerByteFormatter::scale_for_machines(std::vector<double>&) const {
    return "cycles";
}
