/**
 * test.cpp
 * ─────────────────────────────────────────────────────────────────────────────
 * Test suite for the demo's argument parser and its TOML config files.
 */

#include <filesystem>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

#include "../testing/test_main.hpp"
#include "argparser.hxx"

namespace fs = std::filesystem;
using rprof::cli::ArgParser;
using rprof::cli::ParseError;

namespace {

// Owns argv storage for ArgParser::parse.
struct Argv {
    explicit Argv(std::vector<std::string> args) : storage(std::move(args)) {
        storage.insert(storage.begin(), "range_profiler_demo");
        for (auto& arg : storage) {
            pointers.push_back(arg.data());
        }
    }

    [[nodiscard]] auto argc() const -> int { return static_cast<int>(pointers.size()); }
    auto argv() -> char** { return pointers.data(); }

    std::vector<std::string> storage;
    std::vector<char*> pointers;
};

auto demo_parser() -> ArgParser {
    ArgParser parser("range_profiler_demo");
    parser.add<int>("threads").shorthand('t').default_val(4).min(1).max(256);
    parser.add<fs::path>("output").shorthand('o').default_val(fs::path("trace.tsv"));
    parser.add<bool>("disabled").default_val(false);
    parser.add<std::string>("log-file").default_val(std::string{});
    return parser;
}

auto write_config(const std::string& name, const std::string& body) -> fs::path {
    const auto path = fs::temp_directory_path() / ("rprof_argparser_" + name + ".toml");
    std::ofstream out(path);
    out << body;
    return path;
}

}  // namespace

TEST_SUITE("ArgParser")

TEST_CASE("defaults apply when nothing is given") {
    auto parser = demo_parser();
    Argv args({});
    parser.parse(args.argc(), args.argv());
    expect(parser.get<int>("threads")).to_equal(4);
    expect(parser.get<fs::path>("output").string()).to_equal("trace.tsv");
    expect(parser.get<bool>("disabled")).to_be_false();
}

TEST_CASE("long, short and bare bool flags are read") {
    auto parser = demo_parser();
    Argv args({"-t", "8", "--output", "out.tsv", "--disabled"});
    parser.parse(args.argc(), args.argv());
    expect(parser.get<int>("threads")).to_equal(8);
    expect(parser.get<fs::path>("output").string()).to_equal("out.tsv");
    expect(parser.get<bool>("disabled")).to_be_true();
}

TEST_CASE("config file overrides defaults and the command line overrides the file") {
    const auto path = write_config("precedence", "[profile]\nthreads = 16  # from file\noutput = \"file.tsv\"\ndisabled = true\n");
    auto parser = demo_parser();
    Argv args({"--config", path.string(), "--threads", "2"});
    parser.parse(args.argc(), args.argv());
    expect(parser.get<int>("threads")).to_equal(2);
    expect(parser.get<fs::path>("output").string()).to_equal("file.tsv");
    expect(parser.get<bool>("disabled")).to_be_true();
    fs::remove(path);
}

TEST_CASE("values outside the declared range are rejected") {
    auto parser = demo_parser();
    Argv args({"--threads", "0"});
    expect_throws(ParseError, parser.parse(args.argc(), args.argv()));
}

TEST_CASE("unknown, duplicate and malformed arguments are rejected") {
    {
        auto parser = demo_parser();
        Argv args({"--frames", "3"});
        expect_throws(ParseError, parser.parse(args.argc(), args.argv()));
    }
    {
        auto parser = demo_parser();
        Argv args({"-t", "2", "--threads", "3"});
        expect_throws(ParseError, parser.parse(args.argc(), args.argv()));
    }
    {
        auto parser = demo_parser();
        Argv args({"--threads", "two"});
        expect_throws(ParseError, parser.parse(args.argc(), args.argv()));
    }
}

TEST_CASE("a config file with an unknown key is rejected") {
    const auto path = write_config("unknown", "frames = 10\n");
    auto parser = demo_parser();
    Argv args({"-C", path.string()});
    expect_throws(ParseError, parser.parse(args.argc(), args.argv()));
    fs::remove(path);
}

TEST_CASE("a missing config file is rejected") {
    auto parser = demo_parser();
    Argv args({"--config", (fs::temp_directory_path() / "rprof_argparser_absent.toml").string()});
    expect_throws(ParseError, parser.parse(args.argc(), args.argv()));
}

TEST_CASE("registering the same name twice is an error") {
    ArgParser parser("dup");
    parser.add<int>("threads");
    expect_throws(ParseError, parser.add<int>("threads"));
}
