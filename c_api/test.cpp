/**
 * test.cpp
 * ─────────────────────────────────────────────────────────────────────────────
 * Test suite for the C handle API.
 */

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <new>
#include <stdexcept>
#include <string>
#include <system_error>

#include "../testing/test_main.hpp"
#include "range_profiler.h"
#include "status.hxx"

namespace fs = std::filesystem;

namespace {

constexpr const char* HEADER = "thread_id\trange_name\trange_start_nano\trange_end_nano\n";

auto read_file(const fs::path& path) -> std::string {
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

auto count_lines(const std::string& text) -> std::size_t {
    std::size_t lines = 0;
    for (char chr : text) {
        lines += chr == '\n' ? 1 : 0;
    }
    return lines;
}

}  // namespace

TEST_SUITE("C API")

TEST_CASE("create, record, save and destroy") {
    const auto path = fs::temp_directory_path() / "rprof_c_api_test.tsv";
    rprof_profiler* prof = rprof_create();
    expect(prof != nullptr).to_be_true();

    rprof_scope* scope = rprof_scope_begin(prof, "test_scope");
    expect(scope != nullptr).to_be_true();
    rprof_scope_end(prof, scope);

    expect(rprof_save(prof, path.c_str())).to_equal(RPROF_OK);
    rprof_destroy(prof);

    const std::string text = read_file(path);
    expect(text).to_start_with(HEADER);
    expect(text).to_contain("\ttest_scope\t");
    expect(count_lines(text)).to_equal(2U);
    fs::remove(path);
}

TEST_CASE("an unused profiler saves only the header") {
    const auto path = fs::temp_directory_path() / "rprof_c_api_empty.tsv";
    rprof_profiler* prof = rprof_create();
    expect(rprof_save(prof, path.c_str())).to_equal(RPROF_OK);
    rprof_destroy(prof);
    expect(read_file(path)).to_equal(HEADER);
    fs::remove(path);
}

TEST_CASE("disable and enable are forwarded") {
    const auto path = fs::temp_directory_path() / "rprof_c_api_toggle.tsv";
    rprof_profiler* prof = rprof_create();

    rprof_disable(prof);
    rprof_scope_end(prof, rprof_scope_begin(prof, "dropped"));
    rprof_enable(prof);
    rprof_scope_end(prof, rprof_scope_begin(prof, "kept"));

    expect(rprof_save(prof, path.c_str())).to_equal(RPROF_OK);
    rprof_destroy(prof);

    const std::string text = read_file(path);
    expect(text).to_contain("\tkept\t");
    expect(text.find("dropped") == std::string::npos).to_be_true();
    fs::remove(path);
}

TEST_CASE("ending a NULL scope is ignored") {
    rprof_profiler* prof = rprof_create();
    rprof_scope_end(prof, nullptr);
    rprof_destroy(prof);
}

TEST_CASE("save into a missing directory returns the open error") {
    const auto path = fs::temp_directory_path() / "rprof_missing_dir" / "nested" / "out.tsv";
    rprof_profiler* prof = rprof_create();
    expect(rprof_save(prof, path.c_str())).to_equal(RPROF_ERR_OPEN);
    rprof_destroy(prof);
}

#ifdef __linux__
TEST_CASE("save to a full device returns the write error") {
    rprof_profiler* prof = rprof_create();
    rprof_scope_end(prof, rprof_scope_begin(prof, "overflow"));
    expect(rprof_save(prof, "/dev/full")).to_equal(RPROF_ERR_WRITE);
    rprof_destroy(prof);
}
#endif

TEST_SUITE("C API – status mapping")

TEST_CASE("a body that returns normally maps to OK") {
    int calls = 0;
    expect(rprof::c_api::status_of([&] { ++calls; })).to_equal(RPROF_OK);
    expect(calls).to_equal(1);
}

TEST_CASE("sink errors map to the open and write codes") {
    expect(rprof::c_api::status_of([] { throw rprof::SinkOpenError("no dir"); })).to_equal(RPROF_ERR_OPEN);
    expect(rprof::c_api::status_of([] { throw rprof::SinkError("disk full"); })).to_equal(RPROF_ERR_WRITE);
}

TEST_CASE("errors from outside the sink still become the write code") {
    expect(rprof::c_api::status_of([] { throw std::bad_alloc(); })).to_equal(RPROF_ERR_WRITE);
    expect(rprof::c_api::status_of([] {
        throw std::system_error(std::make_error_code(std::errc::resource_deadlock_would_occur));
    })).to_equal(RPROF_ERR_WRITE);
    expect(rprof::c_api::status_of([] { throw std::logic_error("unexpected"); })).to_equal(RPROF_ERR_WRITE);
}
