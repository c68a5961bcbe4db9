#pragma once

// Include this header in exactly ONE .cpp file per test executable.
// It defines main() and hands control to the test registry.
//
//   // profiler/test.cpp
//   #include "../testing/test_main.hpp"
//   #include "profiler.hxx"
//   TEST_SUITE("...")
//   TEST_CASE("...") { ... }

#include "test_framework.hpp"

auto main() -> int { return ::rprof::testing::test_registry::instance().run_all(); }
