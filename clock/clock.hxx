#pragma once

/**
 * @file clock.hxx
 * @brief Monotonic nanosecond tick source used to stamp profile ranges
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <chrono>
#include <cstdint>

namespace rprof {

/// 64-bit nanosecond timestamp. Zero is reserved for "not stamped".
using Tick = std::uint64_t;

namespace clock_detail {
using clock = std::chrono::steady_clock;
}  // namespace clock_detail

/**
 * Current steady_clock reading in nanoseconds, narrowed to 64 bits.
 * Wraps after ~584 years of uptime.
 */
[[nodiscard]] inline auto now() noexcept -> Tick {
    const auto since_epoch = clock_detail::clock::now().time_since_epoch();
    return static_cast<Tick>(std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch).count());
}

}  // namespace rprof
