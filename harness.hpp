/*
 * harness.hpp
 *
 * A small benchmark driver that works with any measurement (see measurement.hpp):
 * it runs the timed loops, accumulates samples through the measurement and
 * reports them through the measurement's formatter.
 */

#ifndef HARNESS_HPP_
#define HARNESS_HPP_

#include "measurement.hpp"
#include "stats.hpp"
#include "table.hpp"
#include "throughput.hpp"
#include "util.hpp"

#include <cinttypes>
#include <stdexcept>
#include <string>
#include <vector>

struct bench_config {
    size_t warmup_iters;
    size_t samples;
    size_t iters_per_sample;

    bench_config(size_t warmup_iters = 10, size_t samples = 50, size_t iters_per_sample = 1000) :
        warmup_iters{warmup_iters}, samples{samples}, iters_per_sample{iters_per_sample} {}

    void validate() const {
        if (samples == 0) {
            throw std::invalid_argument("samples must be at least 1");
        }
        if (iters_per_sample == 0) {
            throw std::invalid_argument("iterations per sample must be at least 1");
        }
    }
};

/**
 * Handed to the benchmark routine for each sample. The routine calls iter() with
 * the code to time, possibly after doing untimed setup.
 */
template <typename M>
class bencher {
    using value_t = typename M::value_t;

    const M* m_;
    size_t iters_;
    value_t elapsed_;

public:
    bencher(const M& m, size_t iters) : m_(&m), iters_(iters), elapsed_(m.zero()) {}

    /* time iters() calls of f, adding the elapsed measurement to this sample */
    template <typename F>
    void iter(F f) {
        auto start = m_->start();
        for (size_t i = 0; i < iters_; i++) {
            do_not_optimize(f());
        }
        elapsed_ = m_->add(elapsed_, m_->end(start));
    }

    value_t elapsed() const { return elapsed_; }

    size_t iters() const { return iters_; }
};

struct bench_result {
    std::string name;
    bool has_throughput;
    throughput tput;
    /* the measurement of each sample, divided by the iteration count */
    std::vector<double> samples;
    /* the measurement accumulated over all samples, and the total iterations */
    double total;
    uint64_t total_iters;
    Stats::DescriptiveStats stats;

    bench_result(std::string name, std::vector<double> samples, double total, uint64_t total_iters) :
        name{name}, has_throughput{false}, tput{throughput::ELEMENTS, 1}, samples{samples},
        total{total}, total_iters{total_iters}, stats{Stats::get_stats(samples.begin(), samples.end())} {}
};

/**
 * Run routine once for warmup and then once per sample, passing it a bencher
 * to time its code with. If t is not null, the result carries it as the
 * per-iteration throughput.
 */
template <typename M, typename R>
bench_result run_benchmark(const M& m, const std::string& name, const bench_config& config,
        R routine, const throughput* t = nullptr) {
    config.validate();

    if (config.warmup_iters) {
        bencher<M> warm{m, config.warmup_iters};
        routine(warm);
    }

    typename M::value_t total = m.zero();
    std::vector<double> samples;
    samples.reserve(config.samples);
    for (size_t s = 0; s < config.samples; s++) {
        bencher<M> b{m, config.iters_per_sample};
        routine(b);
        total = m.add(total, b.elapsed());
        samples.push_back(m.to_f64(b.elapsed()) / b.iters());
    }

    bench_result result{name, samples, m.to_f64(total), (uint64_t)config.samples * config.iters_per_sample};
    if (t) {
        result.has_throughput = true;
        result.tput = *t;
    }
    return result;
}

/**
 * Render results as a table for humans. All values are per-iteration and
 * formatted by the measurement's formatter.
 */
template <typename M>
std::string report(const M& m, const std::vector<bench_result>& results) {
    using table::ColInfo;
    const value_formatter& fmt = m.formatter();

    table::Table table;
    table.setColumnSeparator(" | ");
    table.newHeader({
        {"Benchmark",  ColInfo::LEFT},
        {"Throughput", ColInfo::LEFT},
        {"Median",     ColInfo::RIGHT},
        {"Rate",       ColInfo::RIGHT},
        {"Range",      ColInfo::RIGHT},
    });

    for (const auto& r : results) {
        double median = r.stats.getMedian();
        std::vector<double> range = {r.stats.getMin(), r.stats.getMax()};
        const char* unit = r.has_throughput ?
                fmt.scale_throughputs(median, r.tput, range) :
                fmt.scale_values(median, range);

        table.newRow()
                .add(r.name)
                .add(r.has_throughput ? r.tput.to_string() : "-")
                .add(fmt.format_value(median))
                .add(r.has_throughput ? fmt.format_throughput(r.tput, median) : "-")
                .addf("[%.4f .. %.4f] %s", range[0], range[1], unit);
    }

    return table.str();
}

/**
 * Render results as CSV, one line per benchmark:
 *
 *   name,unit,median,min,max,samples
 */
template <typename M>
std::string machine_report(const M& m, const std::vector<bench_result>& results) {
    std::string out = "name,unit,median,min,max,samples\n";
    for (const auto& r : results) {
        std::vector<double> values = {r.stats.getMedian(), r.stats.getMin(), r.stats.getMax()};
        const char* unit = m.formatter().scale_for_machines(values);
        out += table::string_format("%s,%s,%.4f,%.4f,%.4f,%zu\n", r.name.c_str(), unit,
                values[0], values[1], values[2], r.samples.size());
    }
    return out;
}

#endif /* HARNESS_HPP_ */
