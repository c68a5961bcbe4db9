#pragma once

/**
 * @file profiler.hxx
 * @brief Thread-aware range profiler (Profiler registry and ScopedRange)
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <atomic>
#include <cstddef>
#include <mutex>
#include <new>
#include <optional>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <vector>

#include "../ct_string/ct_string.hxx"
#include "../exporter/tsv_exporter.hxx"
#include "../scope/scope.hxx"
#include "../sink/sink.hxx"

namespace rprof {

// ─────────────────────────────────────────────────────────────────────────────
// ThreadRanges
// ─────────────────────────────────────────────────────────────────────────────

/** Completed ranges of one thread, in completion order. */
struct ThreadRanges {
    std::vector<ProfileScope> ranges;
};

// ─────────────────────────────────────────────────────────────────────────────
// ProfilerConfig
// ─────────────────────────────────────────────────────────────────────────────

/**
 * Construction-time settings. A limit of 0 means unlimited.
 *
 * The limits cap profiler memory: once reached, further ranges are dropped
 * exactly as if allocation had failed.
 */
struct ProfilerConfig {
    bool start_enabled = true;
    std::size_t max_threads = 0;
    std::size_t max_ranges_per_thread = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// Profiler
// ─────────────────────────────────────────────────────────────────────────────

/**
 * Collects named time ranges from any number of threads.
 *
 * Performance design
 * ──────────────────
 * start_scope() is one acquire load plus one clock read, and only
 * the atomic load when profiling is disabled. end_scope() takes the mutex for
 * one map lookup (or insert, the first time a thread finishes a range) and one
 * append. The enabled flag is never guarded by the mutex.
 *
 * Recording never reports errors: if memory runs out or the configured budget
 * is exhausted, the range is dropped and nothing else changes. Only save()
 * can fail visibly.
 *
 * Usage
 * ─────
 *   rprof::Profiler prof;
 *   auto scope = prof.start_scope("db_query");
 *   ... work ...
 *   prof.end_scope(scope);
 *
 *   rprof::FileSink out("trace.tsv");
 *   prof.save(out);
 *
 * The destructor releases every bucket. It must not race with any other call.
 */
class Profiler {
   public:
    using thread_id = std::thread::id;

    Profiler() : Profiler(ProfilerConfig{}) {}
    explicit Profiler(ProfilerConfig config) : enabled_(config.start_enabled), config_(config) {}
    ~Profiler() = default;
    Profiler(const Profiler&) = delete;
    Profiler(Profiler&&) = delete;
    auto operator=(const Profiler&) -> Profiler& = delete;
    auto operator=(Profiler&&) -> Profiler& = delete;

    // ── Enable flag — lock-free ───────────────────────────────────────────

    void enable() noexcept { enabled_.store(true, std::memory_order_release); }
    void disable() noexcept { enabled_.store(false, std::memory_order_release); }
    [[nodiscard]] auto is_enabled() const noexcept -> bool { return enabled_.load(std::memory_order_acquire); }

    [[nodiscard]] auto config() const noexcept -> const ProfilerConfig& { return config_; }

    // ── Hot path ──────────────────────────────────────────────────────────

    /**
     * Opens a range. While disabled the clock is not read and the returned
     * scope has start_time == 0.
     */
    [[nodiscard]] auto start_scope(std::string_view name) const noexcept -> ProfileScope {
        if (!enabled_.load(std::memory_order_acquire)) {
            return {.name = name};
        }
        return ProfileScope::begin(name);
    }

    /**
     * Closes `scope` and stores it in the calling thread's bucket.
     *
     * While disabled the scope is dropped, even if it was opened while enabled.
     * A scope opened while disabled and closed after enable() is stored with
     * zero duration (start_time = end_time).
     */
    void end_scope(ProfileScope scope) {
        if (!enabled_.load(std::memory_order_acquire)) {
            return;
        }

        scope.end();
        if (scope.start_time == 0) [[unlikely]] {
            scope.start_time = scope.end_time;
        }

        const thread_id tid = std::this_thread::get_id();

        std::lock_guard lock(mutex_);
        auto bucket = data_.find(tid);
        bool created = false;
        try {
            if (bucket == data_.end()) [[unlikely]] {
                if (config_.max_threads != 0 && data_.size() >= config_.max_threads) {
                    return;
                }
                bucket = data_.try_emplace(tid).first;
                created = true;
            }
            auto& ranges = bucket->second.ranges;
            if (config_.max_ranges_per_thread != 0 && ranges.size() >= config_.max_ranges_per_thread) {
                return;
            }
            ranges.push_back(scope);
        } catch (const std::bad_alloc&) {
            // Out of memory: drop the range, and the bucket if this call made it.
            if (created) {
                data_.erase(bucket);
            }
        }
    }

    // ── Slow path — acquires mutex ────────────────────────────────────────

    /**
     * Writes the header and every recorded range to `sink` in TSV form, then
     * flushes it. Bucket order follows the internal map and is stable between
     * calls that are not separated by recording.
     *
     * @throws SinkError from the sink; output written so far stays in the sink.
     */
    void save(Sink& sink) const {
        TsvExporter exporter(sink);
        {
            std::lock_guard lock(mutex_);
            exporter.write_header();
            for (const auto& [tid, bucket] : data_) {
                exporter.write_thread(tid, bucket.ranges);
            }
        }
        exporter.flush();
    }

    /** Copy of one thread's ranges, or nullopt if that thread never recorded one. */
    [[nodiscard]] auto ranges_for(thread_id tid) const -> std::optional<std::vector<ProfileScope>> {
        std::lock_guard lock(mutex_);
        auto bucket = data_.find(tid);
        if (bucket == data_.end()) {
            return std::nullopt;
        }
        return bucket->second.ranges;
    }

    [[nodiscard]] auto thread_count() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return data_.size();
    }

    [[nodiscard]] auto range_count() const -> std::size_t {
        std::lock_guard lock(mutex_);
        std::size_t total = 0;
        for (const auto& [tid, bucket] : data_) {
            total += bucket.ranges.size();
        }
        return total;
    }

    /** Discards everything recorded so far. The enabled flag is untouched. */
    void clear() {
        std::lock_guard lock(mutex_);
        data_.clear();
    }

   private:
    mutable std::mutex mutex_;
    std::unordered_map<thread_id, ThreadRanges> data_;  // guarded by mutex_
    std::atomic<bool> enabled_;
    ProfilerConfig config_;
};

// ─────────────────────────────────────────────────────────────────────────────
// ScopedRange — RAII start/end pair
//
//   {
//       rprof::ScopedRange r(prof, "parse");
//       ...
//   }  // <-- end_scope() here
// ─────────────────────────────────────────────────────────────────────────────

class ScopedRange {
   public:
    ScopedRange(Profiler& profiler, std::string_view name) : profiler_(&profiler), scope_(profiler.start_scope(name)) {}

    ~ScopedRange() { profiler_->end_scope(scope_); }

    ScopedRange(const ScopedRange&) = delete;
    ScopedRange(ScopedRange&&) = delete;
    auto operator=(const ScopedRange&) -> ScopedRange& = delete;
    auto operator=(ScopedRange&&) -> ScopedRange& = delete;

   private:
    Profiler* profiler_;
    ProfileScope scope_;
};

/**
 * ScopedRange whose name is a compile-time literal, so the borrowed name can
 * never dangle:
 *
 *   auto r = rprof::make_scoped_range<"db_query">(prof);
 */
template <ct_string Name>
[[nodiscard]] auto make_scoped_range(Profiler& profiler) -> ScopedRange {
    return ScopedRange{profiler, Name.view()};
}

}  // namespace rprof
