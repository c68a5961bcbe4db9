/**
 * test.cpp
 * ─────────────────────────────────────────────────────────────────────────────
 * Test suite for the export sinks and the TSV row writer.
 */

#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "../exporter/tsv_exporter.hxx"
#include "../testing/test_main.hpp"
#include "sink.hxx"

namespace fs = std::filesystem;

namespace {

auto read_file(const fs::path& path) -> std::string {
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

auto scratch_path(const std::string& name) -> fs::path { return fs::temp_directory_path() / ("rprof_sink_test_" + name); }

}  // namespace

// ═════════════════════════════════════════════════════════════════════════════
// SINKS
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("Sinks")

TEST_CASE("StringSink keeps writes in order") {
    rprof::StringSink sink;
    sink.write("ab");
    sink.write("");
    sink.write("cd");
    sink.flush();
    expect(sink.str()).to_equal("abcd");
    sink.clear();
    expect(sink.size()).to_equal(0U);
}

TEST_CASE("OStreamSink forwards bytes to the stream") {
    std::ostringstream out;
    rprof::OStreamSink sink(out);
    sink.write("row\n");
    sink.flush();
    expect(out.str()).to_equal("row\n");
}

TEST_CASE("OStreamSink turns a failed stream into SinkError") {
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    rprof::OStreamSink sink(out);
    expect_throws(rprof::SinkError, sink.write("row\n"));
}

TEST_CASE("FileSink truncates and writes the file") {
    const auto path = scratch_path("truncate.tsv");
    {
        std::ofstream old(path);
        old << "stale contents that must disappear";
    }
    {
        rprof::FileSink sink(path);
        sink.write("fresh\n");
        sink.flush();
    }
    expect(read_file(path)).to_equal("fresh\n");
    fs::remove(path);
}

TEST_CASE("FileSink in a missing directory raises SinkOpenError") {
    const auto path = scratch_path("no_such_dir") / "deeper" / "out.tsv";
    expect_throws(rprof::SinkOpenError, rprof::FileSink sink(path));
}

#ifdef __linux__
TEST_CASE("FileSink on a full device fails on flush") {
    rprof::FileSink sink("/dev/full");
    sink.write("thread_id\trange_name\trange_start_nano\trange_end_nano\n");
    expect_throws(rprof::SinkError, sink.flush());
}
#endif

// ═════════════════════════════════════════════════════════════════════════════
// TSV ROWS
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("TsvExporter")

TEST_CASE("header has four tab-separated columns and a newline") {
    expect(std::string(rprof::TsvExporter::HEADER)).to_equal("thread_id\trange_name\trange_start_nano\trange_end_nano\n");
}

TEST_CASE("rows carry thread id, name, start and end") {
    rprof::StringSink sink;
    rprof::TsvExporter exporter(sink);
    const auto tid = std::this_thread::get_id();
    const std::vector<rprof::ProfileScope> ranges = {
        {.name = "load", .start_time = 10, .end_time = 25},
        {.name = "draw", .start_time = 30, .end_time = 30},
    };
    exporter.write_thread(tid, ranges);

    const auto tid_text = rprof::TsvExporter::format_thread_id(tid);
    expect(sink.str()).to_equal(tid_text + "\tload\t10\t25\n" + tid_text + "\tdraw\t30\t30\n");
}

TEST_CASE("an empty bucket writes nothing") {
    rprof::StringSink sink;
    rprof::TsvExporter exporter(sink);
    exporter.write_thread(std::this_thread::get_id(), {});
    expect(sink.size()).to_equal(0U);
}

TEST_CASE("thread ids render as operator<< does") {
    std::ostringstream expected;
    expected << std::this_thread::get_id();
    expect(rprof::TsvExporter::format_thread_id(std::this_thread::get_id())).to_equal(expected.str());
}
