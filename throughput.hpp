/*
 * throughput.hpp
 *
 * The amount of work a benchmark performs per iteration.
 */

#ifndef THROUGHPUT_HPP_
#define THROUGHPUT_HPP_

#include <cinttypes>
#include <string>

struct throughput {
    enum Kind {
        BYTES,          // binary bytes
        BYTES_DECIMAL,  // bytes, reported with decimal prefixes
        ELEMENTS        // abstract elements (items, rows, operations, ...)
    } kind;
    uint64_t count;

    throughput(Kind kind, uint64_t count) : kind{kind}, count{count} {}

    static throughput bytes(uint64_t n)         { return {BYTES, n}; }
    static throughput bytes_decimal(uint64_t n) { return {BYTES_DECIMAL, n}; }
    static throughput elements(uint64_t n)      { return {ELEMENTS, n}; }

    std::string to_string() const {
        switch (kind) {
        case BYTES:
            return std::to_string(count) + " bytes";
        case BYTES_DECIMAL:
            return std::to_string(count) + " bytes (decimal)";
        case ELEMENTS:
            return std::to_string(count) + " elements";
        }
        return std::to_string(count);
    }
};

#endif /* THROUGHPUT_HPP_ */
