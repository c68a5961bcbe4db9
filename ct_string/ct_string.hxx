#pragma once

/**
 * @file ct_string.hxx
 * @brief Compile-time string literal usable as a template parameter, giving range names static storage
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <algorithm>
#include <cstddef>
#include <string_view>

namespace rprof {

// ─────────────────────────────────────────────────────────────────────────────
// ct_string — a string literal usable as a non-type template parameter (C++20)
//
// The template parameter object lives for the whole program, so a view into
// it can be stored in a profile range without copying the characters.
// ─────────────────────────────────────────────────────────────────────────────

template <std::size_t N>
struct ct_string {
    char data[N]{};

    consteval ct_string(const char (&str)[N]) noexcept { std::copy_n(str, N, data); }

    [[nodiscard]] consteval auto view() const noexcept -> std::string_view {
        return {data, N - 1};  // drop the terminator
    }

    [[nodiscard]] consteval auto size() const noexcept -> std::size_t { return N - 1; }
};

}  // namespace rprof
