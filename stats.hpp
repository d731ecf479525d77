/*
 * stats.hpp
 *
 * Descriptive statistics over benchmark samples.
 */

#ifndef STATS_HPP_
#define STATS_HPP_

#include <algorithm>
#include <iterator>
#include <limits>
#include <numeric>
#include <string>
#include <vector>

#include "table.hpp"

namespace Stats {

class DescriptiveStats {
    double min_, max_, mean_, median_;
    size_t count_;

public:
    DescriptiveStats(double min, double max, double mean, double median, size_t count)
        : min_(min), max_(max), mean_(mean), median_(median), count_(count) {}

    double getMin()    const { return min_; }
    double getMax()    const { return max_; }
    double getMedian() const { return median_; }

    std::string to_string() const {
        return table::string_format("min=%.4f, median=%.4f, avg=%.4f, max=%.4f, n=%zu",
                min_, median_, mean_, max_, count_);
    }
};

/**
 * Calculate the stats of the values in [first, last). The median of an even
 * number of values is the mean of the two middle ones. All the values are
 * NaN for an empty range.
 */
template <typename Itr>
DescriptiveStats get_stats(Itr first, Itr last) {
    std::vector<double> sorted(first, last);
    if (sorted.empty()) {
        double nan = std::numeric_limits<double>::quiet_NaN();
        return DescriptiveStats{nan, nan, nan, nan, 0};
    }
    std::sort(sorted.begin(), sorted.end());

    size_t n = sorted.size();
    double sum = std::accumulate(sorted.begin(), sorted.end(), 0.0);
    double median = (n % 2) ? sorted[n / 2] : (sorted[n / 2 - 1] + sorted[n / 2]) / 2;

    return DescriptiveStats{sorted.front(), sorted.back(), sum / n, median, n};
}

}

#endif /* STATS_HPP_ */
