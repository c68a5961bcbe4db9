#pragma once

/**
 * @file scope.hxx
 * @brief ProfileScope value type: one named, timestamped range
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <string_view>

#include "../clock/clock.hxx"

namespace rprof {

/**
 * A profiled length of time.
 *
 * The name is borrowed, not copied: the referenced characters must stay valid
 * until the owning Profiler has been saved for the last time.
 *
 * start_time == 0 marks a scope that was opened while profiling was disabled.
 * end_time stays 0 until end() is called.
 */
struct ProfileScope {
    std::string_view name;
    Tick start_time = 0;
    Tick end_time = 0;

    /** Opens a range named `name` starting now. */
    [[nodiscard]] static auto begin(std::string_view name) noexcept -> ProfileScope { return {.name = name, .start_time = now(), .end_time = 0}; }

    /** Closes the range. Calling it again overwrites end_time with a later reading. */
    void end() noexcept { end_time = now(); }

    [[nodiscard]] auto is_finished() const noexcept -> bool { return end_time != 0; }
    [[nodiscard]] auto duration_ns() const noexcept -> Tick { return end_time >= start_time ? end_time - start_time : 0; }
};

}  // namespace rprof
