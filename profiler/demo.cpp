/**
 * @file demo.cpp
 * @brief Records a multi-threaded workload and writes the trace as TSV.
 *
 * Each worker runs a fixed number of "frames"; a frame is an outer range
 * with two nested ranges (update and render). With --toggle the main thread
 * switches profiling off for a few milliseconds while the workers run, which
 * shows up as a gap in the trace.
 *
 * Run:
 *   ./range_profiler_demo                          # 4 threads, trace.tsv
 *   ./range_profiler_demo -t 8 -n 5000 -o out.tsv
 *   ./range_profiler_demo --config profile.toml    # CLI flags still win
 */

#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "../argparser/argparser.hxx"
#include "../logger/logger.hxx"
#include "../sink/sink.hxx"
#include "profiler.hxx"

namespace {

// Enough arithmetic to give each range a measurable width.
auto busy_work(int rounds) -> double {
    double acc = 0.0;
    for (int i = 1; i <= rounds; ++i) {
        acc += std::sqrt(static_cast<double>(i));
    }
    return acc;
}

std::atomic<long long> checksum{0};

void worker(rprof::Profiler& prof, int worker_id, int frames) {
    RPROF_LOG_DEBUG << "worker-" << worker_id << " starting, " << frames << " frames";
    double local = 0.0;
    for (int frame = 0; frame < frames; ++frame) {
        auto outer = rprof::make_scoped_range<"frame">(prof);
        {
            auto update = rprof::make_scoped_range<"update">(prof);
            local += busy_work(200);
        }
        {
            rprof::ScopedRange render(prof, "render");
            local += busy_work(400);
        }
    }
    checksum.fetch_add(static_cast<long long>(local), std::memory_order_relaxed);
    RPROF_LOG_DEBUG << "worker-" << worker_id << " done";
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
    rprof::cli::ArgParser parser("range_profiler_demo", "Records a multi-threaded workload and saves it as a TSV trace");
    parser.add<int>("threads").shorthand('t').description("Worker threads").default_val(4).min(1).max(256);
    parser.add<int>("iterations").shorthand('n').description("Frames per worker").default_val(1000).min(1).max(10'000'000);
    parser.add<std::filesystem::path>("output").shorthand('o').description("Trace file").default_val(std::filesystem::path("trace.tsv"));
    parser.add<bool>("disabled").description("Start with profiling switched off").default_val(false);
    parser.add<bool>("toggle").description("Disable profiling briefly while workers run").default_val(false);
    parser.add<int>("max-ranges").description("Per-thread range budget, 0 = unlimited").default_val(0).min(0);
    parser.add<int>("max-threads").description("Thread bucket budget, 0 = unlimited").default_val(0).min(0);
    parser.add<std::string>("log-file").description("Write log lines to this file instead of the console").default_val(std::string{});
    parser.add<bool>("verbose").shorthand('v').description("Log per-worker progress").default_val(false);

    if (!rprof::cli::parse_or_report(parser, argc, argv)) {
        return EXIT_FAILURE;
    }

    const auto log_file = parser.get<std::string>("log-file");
    const auto min_level = parser.get<bool>("verbose") ? rprof::Logger::level::DEBUG : rprof::Logger::level::INFO;
    try {
        rprof::Logger::get_instance().initialize(log_file, log_file.empty(), true, min_level);
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_FAILURE;
    }

    const int threads = parser.get<int>("threads");
    const int frames = parser.get<int>("iterations");
    const auto output = parser.get<std::filesystem::path>("output");

    rprof::Profiler prof(rprof::ProfilerConfig{
        .start_enabled = !parser.get<bool>("disabled"),
        .max_threads = static_cast<std::size_t>(parser.get<int>("max-threads")),
        .max_ranges_per_thread = static_cast<std::size_t>(parser.get<int>("max-ranges")),
    });

    RPROF_LOG_INFO << "threads=" << threads << " frames=" << frames << " output=" << output.string()
                   << " enabled=" << (prof.is_enabled() ? "yes" : "no");

    const auto started = std::chrono::steady_clock::now();
    {
        std::vector<std::jthread> workers;
        workers.reserve(static_cast<std::size_t>(threads));
        for (int t = 0; t < threads; ++t) {
            workers.emplace_back(worker, std::ref(prof), t, frames);
        }

        if (parser.get<bool>("toggle")) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            prof.disable();
            RPROF_LOG_WARN << "profiling paused";
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            prof.enable();
            RPROF_LOG_WARN << "profiling resumed";
        }
    }
    const auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();

    RPROF_LOG_INFO << "workload finished in " << elapsed << " ms (checksum " << checksum.load() << ")";
    RPROF_LOG_INFO << "recorded " << prof.range_count() << " ranges across " << prof.thread_count() << " threads";

    const auto expected = static_cast<std::size_t>(threads) * static_cast<std::size_t>(frames) * 3;
    if (prof.is_enabled() && prof.range_count() < expected) {
        RPROF_LOG_WARN << (expected - prof.range_count()) << " ranges were dropped (disabled window or budget)";
    }

    try {
        rprof::FileSink sink(output);
        prof.save(sink);
    } catch (const rprof::SinkOpenError& e) {
        RPROF_LOG_ERROR << "cannot open trace file: " << e.what();
        return EXIT_FAILURE;
    } catch (const rprof::SinkError& e) {
        RPROF_LOG_ERROR << "failed writing trace: " << e.what();
        return EXIT_FAILURE;
    }

    RPROF_LOG_SUCCESS << "trace written to " << output.string();
    return EXIT_SUCCESS;
}
