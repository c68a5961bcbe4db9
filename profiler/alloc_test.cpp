/**
 * alloc_test.cpp
 * ─────────────────────────────────────────────────────────────────────────────
 * Out-of-memory behaviour of Profiler::end_scope.
 *
 * Global operator new is replaced for this executable. A thread-local
 * allowance decides how many more allocations the calling thread may make
 * before the next one throws std::bad_alloc; a negative allowance means
 * unlimited. Only the code between arming and disarming is affected.
 */

#include <cstddef>
#include <cstdlib>
#include <new>
#include <sstream>
#include <string>
#include <thread>

#include "../testing/test_main.hpp"
#include "profiler.hxx"

namespace {

thread_local long allocations_left = -1;
thread_local int failed_allocations = 0;

// Arms the failing allocator for the lifetime of the object.
class FailAfter {
   public:
    explicit FailAfter(long allowed) {
        failed_allocations = 0;
        allocations_left = allowed;
    }
    ~FailAfter() { allocations_left = -1; }

    FailAfter(const FailAfter&) = delete;
    FailAfter(FailAfter&&) = delete;
    auto operator=(const FailAfter&) -> FailAfter& = delete;
    auto operator=(FailAfter&&) -> FailAfter& = delete;
};

auto count_data_rows(const std::string& text) -> std::size_t {
    std::istringstream in(text.substr(rprof::TsvExporter::HEADER.size()));
    std::size_t rows = 0;
    std::string line;
    while (std::getline(in, line)) {
        std::size_t tabs = 0;
        for (char chr : line) {
            tabs += chr == '\t' ? 1 : 0;
        }
        if (tabs != 3) {
            return 0;
        }
        ++rows;
    }
    return rows;
}

}  // namespace

auto operator new(std::size_t size) -> void* {
    if (allocations_left == 0) {
        ++failed_allocations;
        throw std::bad_alloc();
    }
    if (allocations_left > 0) {
        --allocations_left;
    }
    if (void* ptr = std::malloc(size == 0 ? 1 : size)) {
        return ptr;
    }
    throw std::bad_alloc();
}

void operator delete(void* ptr) noexcept { std::free(ptr); }
void operator delete(void* ptr, std::size_t /*size*/) noexcept { std::free(ptr); }

// ═════════════════════════════════════════════════════════════════════════════
// ALLOCATION FAILURE
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("Profiler – allocation failure")

TEST_CASE("failing to create the first bucket leaves the profiler empty") {
    rprof::Profiler prof;
    auto scope = prof.start_scope("first");
    int failures = 0;
    {
        FailAfter guard(0);
        prof.end_scope(scope);
        failures = failed_allocations;
    }
    expect(failures).to_be_greater_than(0);
    expect(prof.thread_count()).to_equal(0U);
    expect(prof.range_count()).to_equal(0U);

    // Recording works again once memory is available.
    prof.end_scope(prof.start_scope("second"));
    expect(prof.range_count()).to_equal(1U);
}

TEST_CASE("no failure point leaves an empty bucket behind") {
    // Walk the failure through every allocation a first end_scope makes:
    // bucket node, map buckets and the first range slot.
    for (long allowed = 0; allowed < 8; ++allowed) {
        rprof::Profiler prof;
        auto scope = prof.start_scope("walk");
        {
            FailAfter guard(allowed);
            prof.end_scope(scope);
        }
        const auto threads = prof.thread_count();
        const auto ranges = prof.range_count();
        expect(threads).to_equal(ranges);
        expect(threads).to_be_less_or_equal(1U);
    }
}

TEST_CASE("failing to grow a full bucket drops only that range") {
    rprof::Profiler prof;
    prof.end_scope(prof.start_scope("seed"));

    // With a bucket in place the only allocation left in end_scope is vector
    // growth, so ranges keep landing until size() reaches capacity().
    std::size_t before = 0;
    std::size_t after = 0;
    int failures = 0;
    {
        FailAfter guard(0);
        for (int i = 0; i < 1024; ++i) {
            before = prof.range_count();
            prof.end_scope(prof.start_scope("grow"));
            after = prof.range_count();
            if (after == before) {
                break;
            }
        }
        failures = failed_allocations;
    }
    expect(failures).to_equal(1);
    expect(after).to_equal(before);
    expect(prof.thread_count()).to_equal(1U);

    rprof::StringSink sink;
    prof.save(sink);
    expect(sink.str()).to_start_with(rprof::TsvExporter::HEADER);
    expect(count_data_rows(sink.str())).to_equal(after);

    auto ranges = prof.ranges_for(std::this_thread::get_id());
    expect(ranges.has_value()).to_be_true();
    expect(ranges->size()).to_equal(after);
    expect(ranges->front().name == "seed").to_be_true();
}
