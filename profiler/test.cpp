/**
 * test.cpp
 * ─────────────────────────────────────────────────────────────────────────────
 * Test suite for ProfileScope, Profiler, ScopedRange and the TSV export.
 */

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <latch>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "../testing/test_main.hpp"
#include "profiler.hxx"

using rprof::Profiler;
using rprof::ProfileScope;
using rprof::StringSink;
using rprof::TsvExporter;

// ─────────────────────────────────────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────────────────────────────────────

namespace {

struct Row {
    std::string tid;
    std::string name;
    std::uint64_t start = 0;
    std::uint64_t end = 0;
};

// Splits an export into data rows; throws if the header is missing or a row is malformed.
auto parse_rows(const std::string& text) -> std::vector<Row> {
    if (!text.starts_with(TsvExporter::HEADER)) {
        throw std::runtime_error("missing header");
    }
    std::vector<Row> rows;
    std::istringstream in(text.substr(TsvExporter::HEADER.size()));
    std::string line;
    while (std::getline(in, line)) {
        std::istringstream fields(line);
        Row row;
        std::string start;
        std::string end;
        if (!std::getline(fields, row.tid, '\t') || !std::getline(fields, row.name, '\t') || !std::getline(fields, start, '\t') ||
            !std::getline(fields, end)) {
            throw std::runtime_error("malformed row: " + line);
        }
        row.start = std::stoull(start);
        row.end = std::stoull(end);
        rows.push_back(row);
    }
    return rows;
}

auto current_ranges(const Profiler& prof) -> std::vector<ProfileScope> {
    auto ranges = prof.ranges_for(std::this_thread::get_id());
    return ranges ? *ranges : std::vector<ProfileScope>{};
}

// Throws after `budget` writes.
class FailingSink final : public rprof::Sink {
   public:
    explicit FailingSink(std::size_t budget) : budget_(budget) {}

    void write(std::string_view /*bytes*/) override {
        if (writes_ == budget_) {
            throw rprof::SinkError("disk full");
        }
        ++writes_;
    }
    void flush() override { ++flushes_; }

    [[nodiscard]] auto flushes() const -> int { return flushes_; }

   private:
    std::size_t budget_;
    std::size_t writes_ = 0;
    int flushes_ = 0;
};

}  // namespace

// ═════════════════════════════════════════════════════════════════════════════
// SCOPE
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("ProfileScope")

TEST_CASE("begin stamps a start time and leaves end at zero") {
    auto scope = ProfileScope::begin("parse");
    expect(scope.name == "parse").to_be_true();
    expect(scope.start_time).not_to_equal(0U);
    expect(scope.end_time).to_equal(0U);
    expect(scope.is_finished()).to_be_false();
}

TEST_CASE("end stamps an end time not before the start") {
    auto scope = ProfileScope::begin("parse");
    scope.end();
    expect(scope.is_finished()).to_be_true();
    expect(scope.end_time).to_be_greater_or_equal(scope.start_time);
}

TEST_CASE("calling end twice overwrites with a later reading") {
    auto scope = ProfileScope::begin("parse");
    scope.end();
    const auto first = scope.end_time;
    std::this_thread::sleep_for(std::chrono::microseconds(50));
    scope.end();
    expect(scope.end_time).to_be_greater_than(first);
}

TEST_CASE("duration is end minus start, and zero while unfinished") {
    ProfileScope scope{.name = "fixed", .start_time = 100, .end_time = 0};
    expect(scope.duration_ns()).to_equal(0U);
    scope.end_time = 175;
    expect(scope.duration_ns()).to_equal(75U);

    auto live = ProfileScope::begin("live");
    std::this_thread::sleep_for(std::chrono::microseconds(50));
    live.end();
    expect(live.duration_ns()).to_be_greater_or_equal(50'000U);
}

TEST_CASE("clock never goes backwards") {
    auto prev = rprof::now();
    for (int i = 0; i < 1000; ++i) {
        auto next = rprof::now();
        expect(next).to_be_greater_or_equal(prev);
        prev = next;
    }
}

// ═════════════════════════════════════════════════════════════════════════════
// RECORDING
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("Profiler – recording")

TEST_CASE("a profiler starts enabled and empty by default") {
    Profiler prof;
    expect(prof.is_enabled()).to_be_true();
    expect(prof.thread_count()).to_equal(0U);
    expect(prof.range_count()).to_equal(0U);
    expect(prof.ranges_for(std::this_thread::get_id()).has_value()).to_be_false();
}

TEST_CASE("the construction config is kept as given") {
    Profiler prof(rprof::ProfilerConfig{.start_enabled = false, .max_threads = 2, .max_ranges_per_thread = 7});
    expect(prof.config().start_enabled).to_be_false();
    expect(prof.config().max_threads).to_equal(2U);
    expect(prof.config().max_ranges_per_thread).to_equal(7U);
    prof.enable();
    expect(prof.config().start_enabled).to_be_false();
}

TEST_CASE("a recorded range has end >= start and keeps its name") {
    Profiler prof;
    auto scope = prof.start_scope("test_range");
    prof.end_scope(scope);

    auto ranges = current_ranges(prof);
    expect(ranges.size()).to_equal(1U);
    expect(ranges[0].name == "test_range").to_be_true();
    expect(ranges[0].start_time).not_to_equal(0U);
    expect(ranges[0].end_time).to_be_greater_or_equal(ranges[0].start_time);
}

TEST_CASE("ranges of one thread keep completion order") {
    Profiler prof;
    auto outer = prof.start_scope("outer");
    auto inner = prof.start_scope("inner");
    prof.end_scope(inner);
    prof.end_scope(outer);
    auto last = prof.start_scope("last");
    prof.end_scope(last);

    auto ranges = current_ranges(prof);
    expect(ranges.size()).to_equal(3U);
    expect(ranges[0].name == "inner").to_be_true();
    expect(ranges[1].name == "outer").to_be_true();
    expect(ranges[2].name == "last").to_be_true();
    expect(ranges[1].start_time).to_be_less_or_equal(ranges[0].start_time);
    expect(ranges[1].end_time).to_be_greater_or_equal(ranges[0].end_time);
}

TEST_CASE("the name is borrowed, not copied") {
    Profiler prof;
    static const std::string name = "borrowed";
    prof.end_scope(prof.start_scope(name));
    auto ranges = current_ranges(prof);
    expect(ranges.size()).to_equal(1U);
    expect(ranges[0].name.data() == name.data()).to_be_true();
}

TEST_CASE("every enabled cycle records end >= start") {
    Profiler prof;
    for (int i = 0; i < 500; ++i) {
        prof.end_scope(prof.start_scope("cycle"));
    }
    for (const auto& range : current_ranges(prof)) {
        expect(range.end_time).to_be_greater_or_equal(range.start_time);
    }
    expect(prof.range_count()).to_equal(500U);
}

TEST_CASE("clear drops every bucket but keeps the profiler usable") {
    Profiler prof;
    prof.end_scope(prof.start_scope("a"));
    prof.clear();
    expect(prof.thread_count()).to_equal(0U);
    prof.end_scope(prof.start_scope("b"));
    expect(prof.range_count()).to_equal(1U);
}

// ═════════════════════════════════════════════════════════════════════════════
// ENABLE / DISABLE
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("Profiler – enable / disable")

TEST_CASE("start_scope while disabled does not read the clock") {
    Profiler prof;
    prof.disable();
    auto scope = prof.start_scope("idle");
    expect(scope.start_time).to_equal(0U);
    expect(scope.end_time).to_equal(0U);
    expect(scope.name == "idle").to_be_true();
}

TEST_CASE("disable between start and end drops the range") {
    Profiler prof;
    auto scope = prof.start_scope("test_range");
    prof.disable();
    prof.end_scope(scope);
    expect(prof.ranges_for(std::this_thread::get_id()).has_value()).to_be_false();
}

TEST_CASE("disable between start and end adds nothing to an existing bucket") {
    Profiler prof;
    prof.end_scope(prof.start_scope("kept"));
    auto scope = prof.start_scope("dropped");
    prof.disable();
    prof.end_scope(scope);
    expect(current_ranges(prof).size()).to_equal(1U);
}

TEST_CASE("enable between start and end records a zero-length range") {
    Profiler prof;
    prof.disable();
    auto scope = prof.start_scope("test_range");
    prof.enable();
    prof.end_scope(scope);

    auto ranges = current_ranges(prof);
    expect(ranges.size()).to_equal(1U);
    expect(ranges[0].name == "test_range").to_be_true();
    expect(ranges[0].start_time).to_equal(ranges[0].end_time);
    expect(ranges[0].end_time).not_to_equal(0U);
}

TEST_CASE("a profiler constructed disabled records nothing") {
    Profiler prof(rprof::ProfilerConfig{.start_enabled = false});
    expect(prof.is_enabled()).to_be_false();
    prof.end_scope(prof.start_scope("never"));
    expect(prof.thread_count()).to_equal(0U);

    StringSink sink;
    prof.save(sink);
    expect(sink.str() == TsvExporter::HEADER).to_be_true();
}

TEST_CASE("toggling back and forth only records enabled cycles") {
    Profiler prof;
    for (int i = 0; i < 10; ++i) {
        if (i % 2 == 0) {
            prof.enable();
        } else {
            prof.disable();
        }
        prof.end_scope(prof.start_scope("toggle"));
    }
    expect(prof.range_count()).to_equal(5U);
}

// ═════════════════════════════════════════════════════════════════════════════
// MEMORY BUDGET
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("Profiler – memory budget")

TEST_CASE("per-thread limit keeps the first ranges and drops the rest") {
    Profiler prof(rprof::ProfilerConfig{.max_ranges_per_thread = 3});
    const std::string_view names[] = {"r0", "r1", "r2", "r3", "r4"};
    for (auto name : names) {
        prof.end_scope(prof.start_scope(name));
    }
    auto ranges = current_ranges(prof);
    expect(ranges.size()).to_equal(3U);
    expect(ranges[2].name == "r2").to_be_true();
}

TEST_CASE("thread limit leaves extra threads without a bucket") {
    Profiler prof(rprof::ProfilerConfig{.max_threads = 1});
    prof.end_scope(prof.start_scope("main"));

    std::thread other([&] { prof.end_scope(prof.start_scope("other")); });
    const auto other_id = other.get_id();
    other.join();

    expect(prof.thread_count()).to_equal(1U);
    expect(prof.ranges_for(other_id).has_value()).to_be_false();
    expect(current_ranges(prof).size()).to_equal(1U);
}

// ═════════════════════════════════════════════════════════════════════════════
// CONCURRENCY
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("Profiler – concurrency")

TEST_CASE("N threads x M cycles give N buckets of exactly M ranges") {
    constexpr int THREADS = 8;
    constexpr int CYCLES = 2000;
    Profiler prof;
    // Every worker stays alive until all are done so no thread id is reused.
    std::latch done(THREADS);

    std::vector<std::thread> workers;
    workers.reserve(THREADS);
    for (int t = 0; t < THREADS; ++t) {
        workers.emplace_back([&] {
            for (int i = 0; i < CYCLES; ++i) {
                prof.end_scope(prof.start_scope("work"));
            }
            done.arrive_and_wait();
        });
    }
    std::vector<std::thread::id> ids;
    for (auto& w : workers) {
        ids.push_back(w.get_id());
        w.join();
    }

    expect(prof.thread_count()).to_equal(static_cast<std::size_t>(THREADS));
    for (auto tid : ids) {
        auto ranges = prof.ranges_for(tid);
        expect(ranges.has_value()).to_be_true();
        expect(ranges->size()).to_equal(static_cast<std::size_t>(CYCLES));
        for (const auto& range : *ranges) {
            expect(range.name == "work").to_be_true();
            expect(range.end_time).to_be_greater_or_equal(range.start_time);
        }
    }
}

TEST_CASE("per-thread order survives concurrent recording") {
    constexpr int THREADS = 4;
    constexpr int CYCLES = 500;
    Profiler prof;
    std::latch done(THREADS);
    std::atomic<int> out_of_order{0};

    std::vector<std::thread> workers;
    for (int t = 0; t < THREADS; ++t) {
        workers.emplace_back([&] {
            for (int i = 0; i < CYCLES; ++i) {
                prof.end_scope(prof.start_scope("ordered"));
            }
            auto mine = prof.ranges_for(std::this_thread::get_id());
            if (!mine || mine->size() != static_cast<std::size_t>(CYCLES)) {
                ++out_of_order;
            } else {
                for (std::size_t i = 1; i < mine->size(); ++i) {
                    if ((*mine)[i].end_time < (*mine)[i - 1].end_time) {
                        ++out_of_order;
                    }
                }
            }
            done.arrive_and_wait();
        });
    }
    for (auto& w : workers) {
        w.join();
    }
    expect(out_of_order.load()).to_equal(0);
    expect(prof.range_count()).to_equal(static_cast<std::size_t>(THREADS * CYCLES));
}

TEST_CASE("toggling from another thread never corrupts buckets") {
    Profiler prof;
    std::atomic<bool> stop{false};
    std::thread toggler([&] {
        while (!stop.load()) {
            prof.disable();
            prof.enable();
        }
    });
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&] {
            for (int i = 0; i < 1000; ++i) {
                prof.end_scope(prof.start_scope("flicker"));
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }
    stop.store(true);
    toggler.join();

    StringSink sink;
    prof.save(sink);
    const auto rows = parse_rows(sink.str());
    expect(rows.size()).to_equal(prof.range_count());
    for (const auto& row : rows) {
        expect(row.end).to_be_greater_or_equal(row.start);
    }
}

TEST_CASE("saving while other threads record yields a well-formed export") {
    Profiler prof;
    std::atomic<bool> stop{false};
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&] {
            while (!stop.load()) {
                prof.end_scope(prof.start_scope("busy"));
            }
        });
    }
    for (int i = 0; i < 20; ++i) {
        StringSink sink;
        prof.save(sink);
        for (const auto& row : parse_rows(sink.str())) {
            expect(row.name == "busy").to_be_true();
        }
    }
    stop.store(true);
    for (auto& w : workers) {
        w.join();
    }
}

// ═════════════════════════════════════════════════════════════════════════════
// EXPORT
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("Profiler – export")

TEST_CASE("an unused profiler exports exactly the header") {
    Profiler prof;
    StringSink sink;
    prof.save(sink);
    expect(sink.str() == "thread_id\trange_name\trange_start_nano\trange_end_nano\n").to_be_true();
}

TEST_CASE("one recorded range exports header plus one matching row") {
    Profiler prof;
    prof.end_scope(prof.start_scope("test_range"));

    StringSink sink;
    prof.save(sink);
    expect(sink.str()).to_start_with(TsvExporter::HEADER);
    expect(sink.size()).to_be_greater_than(20U);

    const auto rows = parse_rows(sink.str());
    expect(rows.size()).to_equal(1U);
    expect(rows[0].name).to_equal("test_range");
    expect(rows[0].tid).to_equal(TsvExporter::format_thread_id(std::this_thread::get_id()));
    expect(rows[0].end).to_be_greater_or_equal(rows[0].start);
}

TEST_CASE("rows of every thread are exported") {
    Profiler prof;
    prof.end_scope(prof.start_scope("main"));
    std::thread other([&] {
        prof.end_scope(prof.start_scope("other"));
        prof.end_scope(prof.start_scope("other"));
    });
    other.join();

    StringSink sink;
    prof.save(sink);
    const auto rows = parse_rows(sink.str());
    expect(rows.size()).to_equal(3U);
    std::set<std::string> tids;
    for (const auto& row : rows) {
        tids.insert(row.tid);
    }
    expect(tids.size()).to_equal(2U);
}

TEST_CASE("saving twice without recording gives identical bytes") {
    Profiler prof;
    for (int i = 0; i < 10; ++i) {
        prof.end_scope(prof.start_scope("repeat"));
    }
    std::thread other([&] { prof.end_scope(prof.start_scope("elsewhere")); });
    other.join();

    StringSink first;
    StringSink second;
    prof.save(first);
    prof.save(second);
    expect(first.str()).to_equal(second.str());
}

TEST_CASE("save flushes the sink") {
    Profiler prof;
    FailingSink sink(100);
    prof.save(sink);
    expect(sink.flushes()).to_equal(1);
}

TEST_CASE("a failing sink aborts save with SinkError") {
    Profiler prof;
    for (int i = 0; i < 5; ++i) {
        prof.end_scope(prof.start_scope("row"));
    }
    FailingSink sink(3);
    expect_throws(rprof::SinkError, prof.save(sink));
    expect(sink.flushes()).to_equal(0);
}

TEST_CASE("a failing header write aborts save and leaves data intact") {
    Profiler prof;
    prof.end_scope(prof.start_scope("row"));
    FailingSink sink(0);
    expect_throws(rprof::SinkError, prof.save(sink));

    StringSink ok;
    prof.save(ok);
    expect(parse_rows(ok.str()).size()).to_equal(1U);
}

// ═════════════════════════════════════════════════════════════════════════════
// RAII
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("ScopedRange")

TEST_CASE("ScopedRange records one range on scope exit") {
    Profiler prof;
    {
        rprof::ScopedRange range(prof, "scoped");
        expect(prof.range_count()).to_equal(0U);
    }
    auto ranges = current_ranges(prof);
    expect(ranges.size()).to_equal(1U);
    expect(ranges[0].name == "scoped").to_be_true();
}

TEST_CASE("make_scoped_range uses the compile-time name") {
    Profiler prof;
    {
        auto range = rprof::make_scoped_range<"compile_time">(prof);
    }
    auto ranges = current_ranges(prof);
    expect(ranges.size()).to_equal(1U);
    expect(ranges[0].name == "compile_time").to_be_true();
}

TEST_CASE("ScopedRange records nothing while disabled") {
    Profiler prof;
    prof.disable();
    {
        rprof::ScopedRange range(prof, "quiet");
    }
    expect(prof.thread_count()).to_equal(0U);
}
