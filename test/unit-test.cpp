/*
 * unit-test.cpp
 */

#include <string>


#include "catch2/catch.hpp"

#include "../cycles-per-byte.hpp"
#include "../harness.hpp"
#include "../stats.hpp"
#include "../table.hpp"
#include "../util.hpp"
#include "../workloads.hpp"

#include <cmath>
#include <cinttypes>
#include <limits>
#include <stdexcept>
#include <vector>

#include <errno.h>
#include <sched.h>
#include <string.h>

using dvec = std::vector<double>;

static const value_formatter& fmt() {
    static CyclesPerByte cpb;
    return cpb.formatter();
}

/*
 * A measurement whose clock advances by a fixed step on every read, so the
 * harness sees a known value per sample.
 */
struct step_measurement {
    using intermediate_t = uint64_t;
    using value_t        = uint64_t;

    uint64_t step;
    mutable uint64_t ticks;
    mutable size_t reads;

    step_measurement(uint64_t step) : step{step}, ticks{0}, reads{0} {}

    intermediate_t start() const { reads++; return ticks += step; }
    value_t end(intermediate_t i) const { reads++; ticks += step; return ticks - i; }
    value_t add(const value_t& v1, const value_t& v2) const { return v1 + v2; }
    value_t zero() const { return 0; }
    double to_f64(const value_t& v) const { return (double)v; }
    const value_formatter& formatter() const { return fmt(); }
};

/*
 * Pin the calling thread to the CPU it is running on, so successive counter
 * reads come from one CPU's counter.
 */
static void pin_to_current_cpu() {
    int cpu = sched_getcpu();
    REQUIRE(cpu >= 0);
    cpu_set_t cpuset;
    CPU_ZERO(&cpuset);
    CPU_SET(cpu, &cpuset);
    int rc = sched_setaffinity(0, sizeof(cpuset), &cpuset);
    INFO("sched_setaffinity to CPU " << cpu << ": " << strerror(errno));
    REQUIRE(rc == 0);
}

/* restores the thread's original affinity when the test case ends */
struct affinity_guard {
    cpu_set_t original;
    bool saved;

    affinity_guard() : saved{sched_getaffinity(0, sizeof(original), &original) == 0} {}

    ~affinity_guard() {
        if (saved) {
            sched_setaffinity(0, sizeof(original), &original);
        }
    }
};

TEST_CASE( "saturating_delta" ) {
    REQUIRE(CyclesPerByte::saturating_delta(100, 350) == 250);
    REQUIRE(CyclesPerByte::saturating_delta(350, 350) == 0);
    REQUIRE(CyclesPerByte::saturating_delta(350, 100) == 0);
    REQUIRE(CyclesPerByte::saturating_delta(0, UINT64_MAX) == UINT64_MAX);
    REQUIRE(CyclesPerByte::saturating_delta(UINT64_MAX, 0) == 0);
}

TEST_CASE( "end" ) {
    CyclesPerByte m;

    // a start value from the future clamps to zero instead of wrapping
    REQUIRE(m.end(std::numeric_limits<uint64_t>::max()) == 0);

    // the counter has been running since boot
    REQUIRE(m.end(0) > 0);

    affinity_guard guard;
    REQUIRE(guard.saved);
    pin_to_current_cpu();

    uint64_t before = cycles::now();
    auto i = m.start();
    REQUIRE(i >= before);
    uint64_t v = m.end(i);
    uint64_t after = cycles::now();
    REQUIRE(v <= after - before);
}

TEST_CASE( "now_monotonic_pinned" ) {
    affinity_guard guard;
    REQUIRE(guard.saved);
    pin_to_current_cpu();

    uint64_t last = cycles::now();
    for (int i = 0; i < 1000; i++) {
        uint64_t cur = cycles::now();
        REQUIRE(cur >= last);
        last = cur;
    }
}

TEST_CASE( "add_zero_to_f64" ) {
    CyclesPerByte m;

    REQUIRE(m.zero() == 0);
    REQUIRE(m.add(3, 4) == 7);
    REQUIRE(m.add(3, 4) == m.add(4, 3));
    REQUIRE(m.add(1234567, m.zero()) == 1234567);
    REQUIRE(m.add(m.zero(), UINT64_MAX) == UINT64_MAX);
    REQUIRE(m.add(m.add(1, 2), 3) == m.add(1, m.add(2, 3)));

    REQUIRE(m.to_f64(0) == 0.0);
    REQUIRE(m.to_f64(3200) == 3200.0);
    uint64_t two53 = 1ull << 53;
    REQUIRE(m.to_f64(two53) == 9007199254740992.0);
    REQUIRE(m.to_f64(two53 - 1) == 9007199254740991.0);
}

TEST_CASE( "formatter_is_shared" ) {
    CyclesPerByte a, b;
    REQUIRE(&a.formatter() == &b.formatter());
}

TEST_CASE( "format_value" ) {
    REQUIRE(fmt().format_value(1234.5) == "1234.5000 cycles");
    REQUIRE(fmt().format_value(0) == "0.0000 cycles");
    REQUIRE(fmt().format_value(2.0 / 3.0) == "0.6667 cycles");
}

TEST_CASE( "format_throughput" ) {
    REQUIRE(fmt().format_throughput(throughput::bytes(2), 1000.0) == "500.0000 cpb");
    REQUIRE(fmt().format_throughput(throughput::elements(5), 1000.0) == "1000.0000 cycles/5");
    REQUIRE(fmt().format_throughput(throughput::bytes_decimal(2), 1000.0) == "500.0000 cpb (decimal)");
    REQUIRE(fmt().format_throughput(throughput::bytes(3), 1.0) == "0.3333 cpb");

    // no guard against a zero count
    REQUIRE(fmt().format_throughput(throughput::bytes(0), 1000.0) == "inf cpb");
    REQUIRE(fmt().format_throughput(throughput::elements(0), 1000.0) == "1000.0000 cycles/0");
    REQUIRE(fmt().format_throughput(throughput::bytes(0), 0.0) == "NaN cpb");
    REQUIRE(fmt().format_throughput(throughput::bytes_decimal(0), 0.0) == "NaN cpb (decimal)");
    REQUIRE(fmt().format_value(std::numeric_limits<double>::quiet_NaN()) == "NaN cycles");
    REQUIRE(fmt().format_value(-std::numeric_limits<double>::quiet_NaN()) == "NaN cycles");
}

TEST_CASE( "scale_values" ) {
    dvec values{1.0, 2.0};
    REQUIRE(std::string(fmt().scale_values(12345.0, values)) == "cycles");
    REQUIRE(values == dvec({1.0, 2.0}));

    dvec empty;
    REQUIRE(std::string(fmt().scale_values(0.0, empty)) == "cycles");
    REQUIRE(empty.empty());
}

TEST_CASE( "scale_throughputs" ) {
    dvec values{8.0, 16.0};
    REQUIRE(std::string(fmt().scale_throughputs(0.0, throughput::bytes(4), values)) == "cpb");
    REQUIRE(values == dvec({2.0, 4.0}));

    values = {8.0, 16.0};
    REQUIRE(std::string(fmt().scale_throughputs(0.0, throughput::elements(8), values)) == "c/e");
    REQUIRE(values == dvec({1.0, 2.0}));

    values = {8.0, 16.0};
    REQUIRE(std::string(fmt().scale_throughputs(0.0, throughput::bytes_decimal(2), values)) == "cpb (decimal)");
    REQUIRE(values == dvec({4.0, 8.0}));

    values = {8.0, 0.0};
    REQUIRE(std::string(fmt().scale_throughputs(0.0, throughput::bytes(0), values)) == "cpb");
    REQUIRE(std::isinf(values[0]));
    REQUIRE(std::isnan(values[1]));
}

TEST_CASE( "scale_for_machines" ) {
    dvec values{1.5, 2.5, 1e12};
    REQUIRE(std::string(fmt().scale_for_machines(values)) == "cycles");
    REQUIRE(values == dvec({1.5, 2.5, 1e12}));
}

TEST_CASE( "cpb_end_to_end" ) {
    // 16 bytes per iteration, 32 samples of 100 cycles each
    CyclesPerByte m;
    uint64_t total = m.zero();
    for (int i = 0; i < 32; i++) {
        total = m.add(total, CyclesPerByte::saturating_delta(1000, 1100));
    }
    REQUIRE(total == 3200);
    REQUIRE(m.formatter().format_throughput(throughput::bytes(16), m.to_f64(total)) == "200.0000 cpb");
}

TEST_CASE( "throughput_to_string" ) {
    REQUIRE(throughput::bytes(16).to_string() == "16 bytes");
    REQUIRE(throughput::bytes_decimal(16).to_string() == "16 bytes (decimal)");
    REQUIRE(throughput::elements(5).to_string() == "5 elements");
}

TEST_CASE( "stats" ) {
    dvec odd{5, 1, 3};
    auto s = Stats::get_stats(odd.begin(), odd.end());
    REQUIRE(s.getMin() == 1);
    REQUIRE(s.getMax() == 5);
    REQUIRE(s.getMedian() == 3);

    dvec even{4, 1, 3, 2};
    REQUIRE(Stats::get_stats(even.begin(), even.end()).getMedian() == Approx(2.5));

    dvec empty;
    auto e = Stats::get_stats(empty.begin(), empty.end());
    REQUIRE(std::isnan(e.getMedian()));
    REQUIRE(std::isnan(e.getMin()));
}

TEST_CASE( "table" ) {
    table::Table t;
    t.setColumnSeparator(" | ");
    t.newHeader({{"a", table::ColInfo::LEFT}, {"bb", table::ColInfo::RIGHT}});
    t.newRow().add("ccc").addf("%d", 7);
    REQUIRE(t.str() == "a   | bb\nccc |  7\n");
}

TEST_CASE( "split" ) {
    REQUIRE(split("a,b,c", ",") == std::vector<std::string>({"a", "b", "c"}));
    REQUIRE(split("abc", ",") == std::vector<std::string>({"abc"}));
}

TEST_CASE( "workloads" ) {
    REQUIRE(fibonacci_slow(0) == 1);
    REQUIRE(fibonacci_slow(10) == 89);
    REQUIRE(fibonacci_fast(10) == 89);
    for (uint64_t n = 0; n < 20; n++) {
        REQUIRE(fibonacci_slow(n) == fibonacci_fast(n));
    }

    uint8_t buf[] = {0x0F, 0xF0, 0x01};
    REQUIRE(xor_fold(buf, 3) == 0xFE);
    REQUIRE(xor_fold(buf, 0) == 0);
}

TEST_CASE( "bencher" ) {
    step_measurement m{100};
    bencher<step_measurement> b{m, 4};
    REQUIRE(b.elapsed() == 0);

    int calls = 0;
    b.iter([&calls]{ return ++calls; });
    b.iter([&calls]{ return ++calls; });
    REQUIRE(calls == 8);
    REQUIRE(b.elapsed() == 200);
    REQUIRE(m.reads == 4);
}

TEST_CASE( "run_benchmark" ) {
    step_measurement m{100};
    throughput t = throughput::bytes(5);
    int calls = 0;
    auto routine = [&calls](bencher<step_measurement>& b){ b.iter([&calls]{ return ++calls; }); };

    bench_result r = run_benchmark(m, "fake", bench_config{2, 3, 4}, routine, &t);
    REQUIRE(calls == 2 + 3 * 4);
    REQUIRE(r.name == "fake");
    REQUIRE(r.samples == dvec({25.0, 25.0, 25.0}));
    REQUIRE(r.total == 300.0);
    REQUIRE(r.total_iters == 12);
    REQUIRE(r.has_throughput);
    REQUIRE(r.tput.count == 5);
    REQUIRE(r.stats.getMedian() == 25.0);

    bench_result plain = run_benchmark(m, "plain", bench_config{0, 1, 1}, routine);
    REQUIRE_FALSE(plain.has_throughput);
    REQUIRE(plain.samples == dvec({100.0}));

    std::vector<bench_result> results{r, plain};
    std::string human = report(m, results);
    REQUIRE(human.find("25.0000 cycles") != std::string::npos);
    REQUIRE(human.find("5.0000 cpb") != std::string::npos);
    REQUIRE(human.find("[5.0000 .. 5.0000] cpb") != std::string::npos);
    REQUIRE(human.find("[100.0000 .. 100.0000] cycles") != std::string::npos);

    REQUIRE(machine_report(m, results) ==
            "name,unit,median,min,max,samples\n"
            "fake,cycles,25.0000,25.0000,25.0000,3\n"
            "plain,cycles,100.0000,100.0000,100.0000,1\n");
}

TEST_CASE( "run_benchmark_config" ) {
    step_measurement m{1};
    auto routine = [](bencher<step_measurement>& b){ b.iter([]{ return 0; }); };
    bench_config no_samples(0, 0, 1), no_iters(0, 1, 0);
    REQUIRE_THROWS_AS(run_benchmark(m, "x", no_samples, routine), std::invalid_argument);
    REQUIRE_THROWS_AS(run_benchmark(m, "x", no_iters, routine), std::invalid_argument);
}

TEST_CASE( "run_benchmark_cycles" ) {
    CyclesPerByte m;
    uint8_t buf[64] = {};
    throughput t = throughput::bytes(sizeof(buf));
    bench_result r = run_benchmark(m, "xor-fold", bench_config{1, 5, 10},
            [&buf](bencher<CyclesPerByte>& b){ b.iter([&buf]{ return xor_fold(buf, sizeof(buf)); }); }, &t);
    REQUIRE(r.samples.size() == 5);
    for (double s : r.samples) {
        REQUIRE(s >= 0.0);
    }
    REQUIRE(r.stats.getMin() <= r.stats.getMedian());
}
