/*
 * cpb-bench.cpp
 *
 * Benchmark a few sample workloads in cycles, and cycles per byte.
 */

#include "args.hxx"
#include "cycles-per-byte.hpp"
#include "harness.hpp"
#include "table.hpp"
#include "util.hpp"
#include "workloads.hpp"

#include <cinttypes>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <functional>
#include <string>
#include <vector>

#include <error.h>
#include <errno.h>
#include <sched.h>

using std::uint64_t;

/** args */
args::ArgumentParser parser{"cpb-bench: measure sample workloads in CPU cycles"};
args::HelpFlag help{parser, "help", "Display this help menu", {'h', "help"}};
args::Flag arg_list{parser, "list", "List the available tests and their descriptions", {"list"}};
args::ValueFlag<std::string> arg_focus{parser, "TEST-ID", "Run only the specified tests (comma-separated IDs)", {"test"}};
args::ValueFlag<size_t> arg_bytes{parser, "BYTES", "Buffer size for the byte throughput tests (default 4096)", {"bytes"}, 4096};
args::Flag arg_decimal{parser, "decimal", "Report byte throughput as decimal bytes", {"decimal"}};
args::ValueFlag<size_t> arg_samples{parser, "SAMPLES", "Number of samples per test (default 50)", {"samples"}, 50};
args::ValueFlag<size_t> arg_iters{parser, "ITERS", "Iterations per sample (default 1000)", {"iters"}, 1000};
args::ValueFlag<size_t> arg_warmup{parser, "ITERS", "Warmup iterations before sampling (default 10)", {"warmup"}, 10};
args::ValueFlag<int> arg_cpu{parser, "CPU", "Pin to the given CPU (default 0)", {"cpu"}, 0};
args::Flag arg_no_pin{parser, "no-pin", "Don't pin to a CPU: cycle deltas may then mix counters of different CPUs", {"no-pin"}};
args::Flag arg_machine{parser, "machine", "Output CSV instead of a table", {"machine"}};
args::Flag arg_verbose{parser, "verbose", "Output more info", {"verbose"}};

bool verbose;

using bench_f = std::function<bench_result(const CyclesPerByte&, const bench_config&)>;

struct test_func {
    std::string id;
    std::string description;
    bench_f func;
};

std::vector<uint8_t> make_buffer(size_t size) {
    std::vector<uint8_t> buf(size);
    for (size_t i = 0; i < size; i++) {
        buf[i] = (uint8_t)(i * 131 + 7);
    }
    return buf;
}

/* the fibonacci group: slow/N and fast/N for N in [0, 20) */
void add_fibonacci(std::vector<test_func>& tests) {
    for (uint64_t n = 0; n < 20; n++) {
        std::string suffix = "/" + std::to_string(n);
        tests.push_back({"fibonacci/slow" + suffix, "recursive fibonacci(" + std::to_string(n) + ")",
            [n](const CyclesPerByte& m, const bench_config& config) -> bench_result {
                return run_benchmark(m, "fibonacci/slow/" + std::to_string(n), config,
                        [n](bencher<CyclesPerByte>& b){ b.iter([n]{ return fibonacci_slow(n); }); });
            }});
        tests.push_back({"fibonacci/fast" + suffix, "iterative fibonacci(" + std::to_string(n) + ")",
            [n](const CyclesPerByte& m, const bench_config& config) -> bench_result {
                return run_benchmark(m, "fibonacci/fast/" + std::to_string(n), config,
                        [n](bencher<CyclesPerByte>& b){ b.iter([n]{ return fibonacci_fast(n); }); });
            }});
    }
}

void add_xor_fold(std::vector<test_func>& tests, size_t bytes, bool decimal) {
    tests.push_back({"xor-fold", "xor fold of a " + std::to_string(bytes) + " byte buffer",
        [bytes, decimal](const CyclesPerByte& m, const bench_config& config) -> bench_result {
            std::vector<uint8_t> buf = make_buffer(bytes);
            throughput t = decimal ? throughput::bytes_decimal(bytes) : throughput::bytes(bytes);
            const uint8_t* data = buf.data();
            return run_benchmark(m, "xor-fold", config,
                    [data, bytes](bencher<CyclesPerByte>& b){ b.iter([data, bytes]{ return xor_fold(data, bytes); }); },
                    &t);
        }});
    tests.push_back({"fibonacci-elements", "iterative fibonacci(90), 90 elements",
        [](const CyclesPerByte& m, const bench_config& config) -> bench_result {
            throughput t = throughput::elements(90);
            return run_benchmark(m, "fibonacci-elements", config,
                    [](bencher<CyclesPerByte>& b){ b.iter([]{ return fibonacci_fast(90); }); },
                    &t);
        }});
}

std::vector<test_func> all_tests() {
    std::vector<test_func> tests;
    add_fibonacci(tests);
    add_xor_fold(tests, arg_bytes.Get(), arg_decimal);
    return tests;
}

/* find the test that exactly matches the given ID or return nullptr if not found */
const test_func* find_one_test(const std::vector<test_func>& tests, const std::string& id) {
    for (const auto& t : tests) {
        if (id == t.id) {
            return &t;
        }
    }
    return nullptr;
}

std::vector<test_func> filter_tests(const std::vector<test_func>& tests) {
    if (!arg_focus) {
        return tests;
    }
    std::vector<test_func> ret;
    for (auto& focus : split(arg_focus.Get(), ",")) {
        auto t = find_one_test(tests, focus);
        if (!t) {
            printf("WARNING: Can't find specified test: %s\n", focus.c_str());
        } else {
            ret.push_back(*t);
        }
    }
    return ret;
}

void list_tests(const std::vector<test_func>& tests) {
    table::Table table;
    table.newRow().add("ID").add("Description");
    for (auto& t : tests) {
        table.newRow().add(t.id).add(t.description);
    }
    printf("Available tests:\n\n%s\n", table.str().c_str());
}

void pin_to_cpu(int cpu) {
    cpu_set_t cpuset;
    CPU_ZERO(&cpuset);
    CPU_SET(cpu, &cpuset);
    if (sched_setaffinity(0, sizeof(cpuset), &cpuset) == -1) {
        error(EXIT_FAILURE, errno, "could not pin to CPU %d", cpu);
    }
}

int main(int argc, char** argv) {

    try {
        parser.ParseCLI(argc, argv);
    } catch (args::Help& help) {
        printf("%s\n", parser.Help().c_str());
        exit(EXIT_SUCCESS);
    } catch (const args::ParseError& e) {
        printf("ERROR while parsing arguments: %s\n", e.what());
        printf("\nUsage:\n%s\n", parser.Help().c_str());
        exit(EXIT_FAILURE);
    }

    verbose = arg_verbose;
    std::vector<test_func> tests = all_tests();

    if (arg_list) {
        list_tests(tests);
        exit(EXIT_SUCCESS);
    }

    tests = filter_tests(tests);
    if (tests.empty()) {
        printf("ERROR: no tests to run\n");
        exit(EXIT_FAILURE);
    }

    if (!arg_no_pin) {
        pin_to_cpu(arg_cpu.Get());
    }

    bench_config config{arg_warmup.Get(), arg_samples.Get(), arg_iters.Get()};
    if (!arg_machine) {
        printf("CPU pinning enabled   : [%s]\n", !arg_no_pin ? "YES" : "NO ");
        printf("Samples x iterations  : [%zu x %zu]\n", config.samples, config.iters_per_sample);
        printf("Warmup iterations     : [%zu]\n", config.warmup_iters);
    }

    CyclesPerByte cpb;
    std::vector<bench_result> results;
    try {
        for (auto& t : tests) {
            if (verbose) printf("Running test: %s\n", t.id.c_str());
            results.push_back(t.func(cpb, config));
            if (verbose) printf("[%s] %s\n", t.id.c_str(), results.back().stats.to_string().c_str());
        }
    } catch (const std::exception& e) {
        printf("ERROR: %s\n", e.what());
        exit(EXIT_FAILURE);
    }

    if (arg_machine) {
        printf("%s", machine_report(cpb, results).c_str());
    } else {
        printf("\n%s\n", report(cpb, results).c_str());
    }

    return EXIT_SUCCESS;
}
