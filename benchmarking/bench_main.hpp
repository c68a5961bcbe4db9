#pragma once

// Include this header in exactly ONE .cpp file per benchmark executable.
// It defines main() and hands control to the benchmark registry.

#include "benchmark.hxx"

auto main() -> int { return ::rprof::benchmark::bench_registry::instance().run_all(); }
