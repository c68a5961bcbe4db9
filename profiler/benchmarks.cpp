/**
 * @file benchmarks.cpp
 * @brief Hot-path cost of the range profiler.
 *
 * Structure
 * ─────────
 *  0  Raw baselines    — clock read, uncontended mutex, vector append
 *  1  Enabled          — start/end pair, ScopedRange, make_scoped_range
 *  2  Disabled         — the same calls with profiling switched off
 *  3  Multi-threaded   — 4 long-lived threads recording into one profiler
 *  4  Export           — save() into an in-memory sink
 *
 * Enabled benchmarks use a per-thread budget so that memory stays bounded no
 * matter how many iterations run; once the budget is full the cost measured is
 * the full path minus the append.
 */

#include <atomic>
#include <barrier>
#include <mutex>
#include <string_view>
#include <thread>
#include <vector>

#include "../benchmarking/bench_main.hpp"
#include "profiler.hxx"

using rprof::benchmark::DoNotOptimize;

namespace {

constexpr std::size_t BENCH_BUDGET = 1U << 20U;

auto enabled_profiler() -> rprof::Profiler& {
    static rprof::Profiler instance(rprof::ProfilerConfig{.max_ranges_per_thread = BENCH_BUDGET});
    return instance;
}

auto disabled_profiler() -> rprof::Profiler& {
    static rprof::Profiler instance(rprof::ProfilerConfig{.start_enabled = false});
    return instance;
}

// Workers are started once; each timed iteration is one round in which all of
// them record ROUND_ITERS ranges, so thread start-up stays out of the samples.
void run_contended_rounds(rprof::benchmark::bench_state& state, rprof::Profiler& prof, std::string_view name) {
    constexpr int N = 4;
    constexpr int ROUND_ITERS = 500;
    std::barrier round_start(N + 1);
    std::barrier round_end(N + 1);
    std::atomic<bool> stop{false};

    std::vector<std::thread> workers;
    workers.reserve(N);
    for (int t = 0; t < N; ++t) {
        workers.emplace_back([&] {
            for (;;) {
                round_start.arrive_and_wait();
                if (stop.load(std::memory_order_acquire)) {
                    return;
                }
                for (int i = 0; i < ROUND_ITERS; ++i) {
                    prof.end_scope(prof.start_scope(name));
                }
                round_end.arrive_and_wait();
            }
        });
    }

    for (auto _ : state) {
        round_start.arrive_and_wait();
        round_end.arrive_and_wait();
    }

    stop.store(true, std::memory_order_release);
    round_start.arrive_and_wait();
    for (auto& w : workers) {
        w.join();
    }
    DoNotOptimize(prof.range_count());
}

}  // namespace

// ═════════════════════════════════════════════════════════════════════════════
// SUITE 0 — Raw baselines
// ═════════════════════════════════════════════════════════════════════════════

BENCH_SUITE("0 · Baselines — raw primitives")

BENCH_CASE_N("rprof::now() — single call", 200'000) {
    for (auto _ : state) {
        auto tick = rprof::now();
        DoNotOptimize(tick);
    }
}

BENCH_CASE_N("uncontended std::mutex lock + unlock", 200'000) {
    static std::mutex mtx;
    for (auto _ : state) {
        std::lock_guard lock(mtx);
        DoNotOptimize(&lock);
    }
}

BENCH_CASE_N("mutex + vector push_back (manual bucket baseline)", 200'000) {
    static std::mutex mtx;
    static std::vector<rprof::ProfileScope> bucket;
    bucket.clear();
    for (auto _ : state) {
        std::lock_guard lock(mtx);
        bucket.push_back({.name = "baseline", .start_time = 1, .end_time = 2});
        DoNotOptimize(bucket.size());
    }
}

// ═════════════════════════════════════════════════════════════════════════════
// SUITE 1 — Enabled
// ═════════════════════════════════════════════════════════════════════════════

BENCH_SUITE("1 · Enabled")

BENCH_CASE_N("start_scope + end_scope", 200'000) {
    auto& prof = enabled_profiler();
    for (auto _ : state) {
        prof.end_scope(prof.start_scope("bench.enabled"));
    }
}

BENCH_CASE_N("start_scope only", 200'000) {
    auto& prof = enabled_profiler();
    for (auto _ : state) {
        auto scope = prof.start_scope("bench.start");
        DoNotOptimize(&scope);
    }
}

BENCH_CASE_N("ScopedRange — construct + destruct", 200'000) {
    auto& prof = enabled_profiler();
    for (auto _ : state) {
        rprof::ScopedRange range(prof, "bench.scoped");
        DoNotOptimize(&range);
    }
}

BENCH_CASE_N("make_scoped_range<n> — construct + destruct", 200'000) {
    auto& prof = enabled_profiler();
    for (auto _ : state) {
        auto range = rprof::make_scoped_range<"bench.ct_scoped">(prof);
        DoNotOptimize(&range);
    }
}

// ═════════════════════════════════════════════════════════════════════════════
// SUITE 2 — Disabled
// ═════════════════════════════════════════════════════════════════════════════

BENCH_SUITE("2 · Disabled")

BENCH_CASE_N("start_scope + end_scope while disabled", 200'000) {
    auto& prof = disabled_profiler();
    for (auto _ : state) {
        prof.end_scope(prof.start_scope("bench.disabled"));
    }
}

BENCH_CASE_N("ScopedRange while disabled", 200'000) {
    auto& prof = disabled_profiler();
    for (auto _ : state) {
        rprof::ScopedRange range(prof, "bench.disabled.scoped");
        DoNotOptimize(&range);
    }
}

// ═════════════════════════════════════════════════════════════════════════════
// SUITE 3 — Multi-threaded contention
// ═════════════════════════════════════════════════════════════════════════════

BENCH_SUITE("3 · Multi-threaded contention")

BENCH_CASE_NW("start/end — 4 threads, 500 iters each per round", 500, 3) {
    rprof::Profiler prof(rprof::ProfilerConfig{.max_ranges_per_thread = BENCH_BUDGET});
    run_contended_rounds(state, prof, "bench.mt");
}

BENCH_CASE_NW("start/end while disabled — 4 threads, 500 iters each per round", 500, 3) {
    rprof::Profiler prof(rprof::ProfilerConfig{.start_enabled = false});
    run_contended_rounds(state, prof, "bench.mt.disabled");
}

// ═════════════════════════════════════════════════════════════════════════════
// SUITE 4 — Export
// ═════════════════════════════════════════════════════════════════════════════

BENCH_SUITE("4 · Export")

BENCH_CASE_N("save() — 1000 ranges into a StringSink", 2'000) {
    static rprof::Profiler prof;
    static const bool filled = [] {
        for (int i = 0; i < 1000; ++i) {
            prof.end_scope(prof.start_scope("bench.export"));
        }
        return true;
    }();
    DoNotOptimize(filled);
    for (auto _ : state) {
        rprof::StringSink sink;
        prof.save(sink);
        DoNotOptimize(sink.size());
    }
}
