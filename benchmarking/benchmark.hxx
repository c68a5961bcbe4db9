#pragma once

/**
 * @file benchmark.hxx
 * @brief Self-registering micro-benchmark harness with per-iteration statistics
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <functional>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#ifndef _WIN32
#include <unistd.h>
#endif

namespace rprof::benchmark {

namespace color {

inline auto enabled() -> bool {
#ifdef _WIN32
    return false;
#else
    static bool val = (isatty(fileno(stdout)) != 0);
    return val;
#endif
}

inline auto paint(std::string_view code, std::string_view str) -> std::string {
    return enabled() ? std::string(code) + std::string(str) + "\033[0m" : std::string(str);
}

inline auto green(std::string_view str) -> std::string { return paint("\033[32m", str); }
inline auto yellow(std::string_view str) -> std::string { return paint("\033[33m", str); }
inline auto cyan(std::string_view str) -> std::string { return paint("\033[36m", str); }
inline auto bold(std::string_view str) -> std::string { return paint("\033[1m", str); }
inline auto dim(std::string_view str) -> std::string { return paint("\033[2m", str); }

}  // namespace color

struct benchmark_result {
    std::string suite;
    std::string name;
    std::size_t iterations{};
    double mean_ns{};
    double median_ns{};
    double stddev_ns{};
    double min_ns{};
    double max_ns{};
};

// ─────────────────────────────────────────────────────────────────────────────
// DoNotOptimize — keeps the compiler from discarding the measured expression
// ─────────────────────────────────────────────────────────────────────────────

#if defined(__GNUC__) || defined(__clang__)
template <typename T>
inline void DoNotOptimize(T const& val) {
    asm volatile("" : : "r,m"(val) : "memory");
}
template <typename T>
inline void DoNotOptimize(T& val) {
    asm volatile("" : "+r,m"(val) : : "memory");
}
#else
template <typename T>
inline void DoNotOptimize(T const& val) {
    const volatile T* ptr = &val;
    (void)ptr;
}
#endif

// ─────────────────────────────────────────────────────────────────────────────
// bench_state — the range-for loop handed to every benchmark body; each
// iteration is timed separately.
//
//   BENCH_CASE("my bench") {
//       for (auto _ : state) {
//           DoNotOptimize(my_function());
//       }
//   }
// ─────────────────────────────────────────────────────────────────────────────

class bench_state {
   public:
    explicit bench_state(std::size_t iters) : iters_(iters) { samples_ns_.reserve(iters); }

    struct iterator {
        bench_state* state;
        std::size_t index;

        auto operator!=(const iterator& other) const -> bool { return index != other.index; }
        auto operator++() -> iterator& {
            state->lap();
            ++index;
            return *this;
        }
        auto operator*() const -> int { return 0; }
    };

    auto begin() -> iterator {
        start_ = clock::now();
        return {this, 0};
    }

    auto end() -> iterator { return {this, iters_}; }

    [[nodiscard]] auto samples() const -> const std::vector<double>& { return samples_ns_; }

   private:
    using clock = std::chrono::steady_clock;

    std::size_t iters_;
    clock::time_point start_;
    std::vector<double> samples_ns_;

    void lap() {
        const auto now = clock::now();
        samples_ns_.push_back(std::chrono::duration<double, std::nano>(now - start_).count());
        start_ = clock::now();
    }
};

namespace detail {

inline auto compute_result(std::string suite, std::string name, std::vector<double> samples) -> benchmark_result {
    if (samples.empty()) {
        return {.suite = std::move(suite), .name = std::move(name)};
    }
    std::sort(samples.begin(), samples.end());

    const std::size_t n = samples.size();
    double sum = 0;
    for (double s : samples) {
        sum += s;
    }
    const double mean = sum / static_cast<double>(n);
    double acc = 0;
    for (double s : samples) {
        acc += (s - mean) * (s - mean);
    }

    return benchmark_result{
        .suite = std::move(suite),
        .name = std::move(name),
        .iterations = n,
        .mean_ns = mean,
        .median_ns = (n % 2 == 0) ? (samples[(n / 2) - 1] + samples[n / 2]) / 2.0 : samples[n / 2],
        .stddev_ns = std::sqrt(acc / static_cast<double>(n)),
        .min_ns = samples.front(),
        .max_ns = samples.back(),
    };
}

// ns / µs / ms / s, whichever reads best
inline auto fmt_time(double ns) -> std::string {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    if (ns < 1'000.0) {
        oss << ns << " ns";
    } else if (ns < 1'000'000.0) {
        oss << ns / 1e3 << " µs";
    } else if (ns < 1'000'000'000.0) {
        oss << ns / 1e6 << " ms";
    } else {
        oss << ns / 1e9 << "  s";
    }
    return oss.str();
}

}  // namespace detail

struct bench_case {
    std::string suite;
    std::string name;
    std::function<void(bench_state&)> fn;
    std::size_t iterations;
    std::size_t warmup;
};

class bench_registry {
   public:
    static auto instance() -> bench_registry& {
        static bench_registry reg;
        return reg;
    }

    void register_bench(bench_case bcase) { benches_.push_back(std::move(bcase)); }

    /// Runs every benchmark: `warmup` untimed single-iteration calls, then the measured run.
    auto run_all() -> int {
        std::cout << color::bold("\n+-------------------------------------+\n");
        std::cout << color::bold("|  range_profiler benchmark runner    |\n");
        std::cout << color::bold("+-------------------------------------+\n");

        std::size_t completed = 0;
        std::string current_suite;
        for (auto& bcase : benches_) {
            if (bcase.suite != current_suite) {
                current_suite = bcase.suite;
                std::cout << "\n  " << color::bold(color::yellow("SUITE: " + current_suite)) << "\n";
            }

            for (std::size_t w = 0; w < bcase.warmup; ++w) {
                bench_state warm(1);
                bcase.fn(warm);
            }

            bench_state state(bcase.iterations);
            bcase.fn(state);
            print_result(detail::compute_result(bcase.suite, bcase.name, state.samples()));
            ++completed;
        }

        constexpr int SEPARATOR_WIDTH = 42;
        std::cout << "\n" << std::string(SEPARATOR_WIDTH, '-') << "\n";
        std::cout << "  " << color::green(std::to_string(completed) + " benchmarks completed") << "\n";
        std::cout << std::string(SEPARATOR_WIDTH, '-') << "\n\n";
        return 0;
    }

   private:
    std::vector<bench_case> benches_;

    static void print_result(const benchmark_result& r) {
        constexpr int NAME_WIDTH = 64;
        std::cout << "    " << color::green("v") << "  " << std::left << std::setw(NAME_WIDTH) << r.name << color::cyan(detail::fmt_time(r.mean_ns))
                  << color::dim("  med " + detail::fmt_time(r.median_ns)) << color::dim("  σ " + detail::fmt_time(r.stddev_ns))
                  << color::dim("  [" + detail::fmt_time(r.min_ns) + " … " + detail::fmt_time(r.max_ns) + "]")
                  << color::dim("  ×" + std::to_string(r.iterations)) << "\n";
    }
};

struct auto_bench_registrar {
    auto_bench_registrar(const char* suite, const char* name, void (*func)(bench_state&), std::size_t iters, std::size_t warmup) {
        bench_registry::instance().register_bench({
            .suite = suite,
            .name = name,
            .fn = func,
            .iterations = iters,
            .warmup = warmup,
        });
    }
};

}  // namespace rprof::benchmark

// ─────────────────────────────────────────────────────────────────────────────
// BENCH_SUITE("name")                 — suite for the BENCH_CASEs that follow
// BENCH_CASE("name") { ... }          — 1000 iterations, 10 warmup
// BENCH_CASE_N("name", n) { ... }     — n iterations, 10 warmup
// BENCH_CASE_NW("name", n, w) { ... } — n iterations, w warmup
// ─────────────────────────────────────────────────────────────────────────────

#define RPROF_BM_CAT2(a, b) a##b
#define RPROF_BM_CAT(a, b) RPROF_BM_CAT2(a, b)

namespace {
inline const char* rprof_bm_current_suite = "<unset>";
}

#define BENCH_SUITE(name)                                                  \
    static const char* RPROF_BM_CAT(rprof_bm_suite_str_, __LINE__) = name; \
    static int RPROF_BM_CAT(rprof_bm_suite_set_, __LINE__) = (rprof_bm_current_suite = RPROF_BM_CAT(rprof_bm_suite_str_, __LINE__), 0);

#define RPROF_BM_DEFINE(test_name, iters, warmup)                                                                                  \
    static void RPROF_BM_CAT(rprof_bm_fn_, __LINE__)(::rprof::benchmark::bench_state & state);                                    \
    static ::rprof::benchmark::auto_bench_registrar RPROF_BM_CAT(rprof_bm_reg_, __LINE__)(rprof_bm_current_suite, test_name,      \
                                                                                          RPROF_BM_CAT(rprof_bm_fn_, __LINE__),  \
                                                                                          (iters), (warmup));                     \
    static void RPROF_BM_CAT(rprof_bm_fn_, __LINE__)(::rprof::benchmark::bench_state & state)

#define BENCH_CASE(test_name) RPROF_BM_DEFINE(test_name, 1000, 10)
#define BENCH_CASE_N(test_name, iters) RPROF_BM_DEFINE(test_name, iters, 10)
#define BENCH_CASE_NW(test_name, iters, w) RPROF_BM_DEFINE(test_name, iters, w)
