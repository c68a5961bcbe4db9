#pragma once

/**
 * @file test_framework.hpp
 * @brief Minimal self-registering test framework with fluent expectations and colored output
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <cstdio>
#include <functional>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <vector>

#ifndef _WIN32
#include <unistd.h>
#endif

// ─────────────────────────────────────────────────────────────────────────────
// ANSI colors
// ─────────────────────────────────────────────────────────────────────────────
namespace rprof::testing::color {

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
inline auto red(std::string_view str) -> std::string { return paint("\033[31m", str); }
inline auto yellow(std::string_view str) -> std::string { return paint("\033[33m", str); }
inline auto bold(std::string_view str) -> std::string { return paint("\033[1m", str); }
inline auto dim(std::string_view str) -> std::string { return paint("\033[2m", str); }

}  // namespace rprof::testing::color

namespace rprof::testing {

// ─────────────────────────────────────────────────────────────────────────────
// assertion_error
// ─────────────────────────────────────────────────────────────────────────────

struct assertion_error : std::exception {
    std::string message;
    std::string file;
    int line{};

    assertion_error(std::string msg, std::string file_path, int line_num) : message(std::move(msg)), file(std::move(file_path)), line(line_num) {}

    [[nodiscard]] auto what() const noexcept -> const char* override { return message.c_str(); }
};

// ─────────────────────────────────────────────────────────────────────────────
// expectation<T>
// ─────────────────────────────────────────────────────────────────────────────

template <typename T>
class expectation {
   public:
    expectation(const T& value, const char* file, int line) : value_(value), file_(file), line_(line) {}

    auto to_equal(const T& expected) -> expectation& {
        if (!(value_ == expected)) {
            fail("expected: " + to_str(expected) + "\n           got:      " + to_str(value_));
        }
        return *this;
    }

    auto not_to_equal(const T& expected) -> expectation& {
        if (value_ == expected) {
            fail("expected value to differ from: " + to_str(expected));
        }
        return *this;
    }

    auto to_be_true() -> expectation& {
        if (!static_cast<bool>(value_)) {
            fail("expected: true\n           got:      false");
        }
        return *this;
    }

    auto to_be_false() -> expectation& {
        if (static_cast<bool>(value_)) {
            fail("expected: false\n           got:      true");
        }
        return *this;
    }

    auto to_be_greater_than(const T& threshold) -> expectation& {
        if (!(value_ > threshold)) {
            fail(to_str(value_) + " is not greater than " + to_str(threshold));
        }
        return *this;
    }

    auto to_be_greater_or_equal(const T& threshold) -> expectation& {
        if (!(value_ >= threshold)) {
            fail(to_str(value_) + " is not >= " + to_str(threshold));
        }
        return *this;
    }

    auto to_be_less_or_equal(const T& threshold) -> expectation& {
        if (!(value_ <= threshold)) {
            fail(to_str(value_) + " is not <= " + to_str(threshold));
        }
        return *this;
    }

    auto to_contain(std::string_view substr) -> expectation&
        requires std::is_convertible_v<T, std::string_view>
    {
        std::string_view str(value_);
        if (str.find(substr) == std::string_view::npos) {
            fail("\"" + to_str(value_) + "\" does not contain \"" + std::string(substr) + "\"");
        }
        return *this;
    }

    auto to_start_with(std::string_view prefix) -> expectation&
        requires std::is_convertible_v<T, std::string_view>
    {
        std::string_view str(value_);
        if (!str.starts_with(prefix)) {
            fail("\"" + to_str(value_) + "\" does not start with \"" + std::string(prefix) + "\"");
        }
        return *this;
    }

   private:
    const T& value_;
    const char* file_;
    int line_;

    [[noreturn]] void fail(const std::string& msg) const { throw assertion_error(msg, file_, line_); }

    template <typename U>
    static auto to_str(const U& val) -> std::string {
        std::ostringstream oss;
        oss << val;
        return oss.str();
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Exception helpers
// ─────────────────────────────────────────────────────────────────────────────

template <typename ExceptionType, typename Callable>
void check_throws(Callable&& func, const char* file, int line) {
    try {
        std::forward<Callable>(func)();
    } catch (const ExceptionType&) {
        return;
    } catch (...) {
        throw assertion_error(std::string("expected exception '") + typeid(ExceptionType).name() + "' but a different exception was thrown", file,
                              line);
    }
    throw assertion_error(std::string("expected exception '") + typeid(ExceptionType).name() + "' but no exception was thrown", file, line);
}

template <typename Callable>
void check_no_throw(Callable&& func, const char* file, int line) {
    try {
        std::forward<Callable>(func)();
    } catch (const std::exception& e) {
        throw assertion_error(std::string("expected no exception but got: ") + e.what(), file, line);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// test_registry
// ─────────────────────────────────────────────────────────────────────────────

struct test_case {
    std::string suite;
    std::string name;
    std::function<void()> fn;
};

class test_registry {
   public:
    static auto instance() -> test_registry& {
        static test_registry reg;
        return reg;
    }

    void register_test(test_case tcase) { tests_.push_back(std::move(tcase)); }

    /// Runs every registered test in registration order. Returns the process exit code.
    auto run_all() -> int {
        std::cout << color::bold("\n+-------------------------------------+\n");
        std::cout << color::bold("|  range_profiler test runner         |\n");
        std::cout << color::bold("+-------------------------------------+\n");

        int passed = 0;
        int failed = 0;
        std::string current_suite;

        for (const auto& tcase : tests_) {
            if (tcase.suite != current_suite) {
                current_suite = tcase.suite;
                std::cout << "\n  " << color::bold(color::yellow("SUITE: " + current_suite)) << "\n";
            }
            try {
                tcase.fn();
                std::cout << "    " << color::green("v") << "  " << tcase.name << "\n";
                ++passed;
            } catch (const assertion_error& e) {
                report_failure(tcase.name, e.message + "\n         at: " + short_path(e.file) + ":" + std::to_string(e.line));
                ++failed;
            } catch (const std::exception& e) {
                report_failure(tcase.name, std::string("unexpected exception: ") + e.what());
                ++failed;
            }
        }

        constexpr int SEPARATOR_WIDTH = 42;
        std::cout << "\n" << std::string(SEPARATOR_WIDTH, '-') << "\n";
        std::cout << "  Results:  " << color::green(std::to_string(passed) + " passed") << "  |  "
                  << (failed > 0 ? color::red(std::to_string(failed) + " failed") : color::dim("0 failed")) << "  |  "
                  << std::to_string(passed + failed) << " total\n";
        std::cout << std::string(SEPARATOR_WIDTH, '-') << "\n\n";
        return (failed > 0) ? 1 : 0;
    }

   private:
    std::vector<test_case> tests_;

    static void report_failure(const std::string& name, const std::string& detail) {
        std::cout << "    " << color::red("x") << "  " << name << "\n";
        std::cout << color::dim("         " + detail) << "\n";
    }

    static auto short_path(const std::string& path) -> std::string {
        auto pos = path.find_last_of("/\\");
        return (pos == std::string::npos) ? path : path.substr(pos + 1);
    }
};

/// Registers a test at static-init time.
struct auto_registrar {
    auto_registrar(const char* suite, const char* name, void (*func)()) {
        test_registry::instance().register_test({.suite = suite, .name = name, .fn = func});
    }
};

}  // namespace rprof::testing

// ─────────────────────────────────────────────────────────────────────────────
// Macros
//
// TEST_SUITE("name") sets the suite for every TEST_CASE that follows it in the
// same translation unit. TEST_CASE("name") { ... } defines and registers one
// test; each must start on its own line since __LINE__ makes the symbols unique.
// ─────────────────────────────────────────────────────────────────────────────

#define RPROF_TS_CAT2(a, b) a##b
#define RPROF_TS_CAT(a, b) RPROF_TS_CAT2(a, b)

namespace {
inline const char* rprof_ts_current_suite = "<unset>";
}

#define TEST_SUITE(name)                                                 \
    static const char* RPROF_TS_CAT(rprof_ts_suite_str_, __LINE__) = name; \
    static int RPROF_TS_CAT(rprof_ts_suite_set_, __LINE__) = (rprof_ts_current_suite = RPROF_TS_CAT(rprof_ts_suite_str_, __LINE__), 0);

#define TEST_CASE(test_name)                                                                                                          \
    static void RPROF_TS_CAT(rprof_ts_fn_, __LINE__)();                                                                               \
    static ::rprof::testing::auto_registrar RPROF_TS_CAT(rprof_ts_reg_, __LINE__)(rprof_ts_current_suite, test_name,                  \
                                                                                  RPROF_TS_CAT(rprof_ts_fn_, __LINE__));              \
    static void RPROF_TS_CAT(rprof_ts_fn_, __LINE__)()

#define expect(val) ::rprof::testing::expectation((val), __FILE__, __LINE__)

#define expect_throws(ExType, ...) ::rprof::testing::check_throws<ExType>([&] { __VA_ARGS__; }, __FILE__, __LINE__)

#define expect_no_throw(...) ::rprof::testing::check_no_throw([&] { __VA_ARGS__; }, __FILE__, __LINE__)
