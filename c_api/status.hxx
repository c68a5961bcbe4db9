#pragma once

/**
 * @file status.hxx
 * @brief Exception to status-code mapping used at the C boundary
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <exception>
#include <utility>

#include "../sink/sink.hxx"
#include "range_profiler.h"

namespace rprof::c_api {

/**
 * Runs `body` and converts its outcome to an rprof_save() status:
 *
 *   returns normally  -> RPROF_OK
 *   SinkOpenError     -> RPROF_ERR_OPEN
 *   any other error   -> RPROF_ERR_WRITE  (SinkError, bad_alloc, system_error, ...)
 *
 * Nothing derived from std::exception escapes into C callers.
 */
template <typename Fn>
[[nodiscard]] auto status_of(Fn&& body) noexcept -> int {
    try {
        std::forward<Fn>(body)();
    } catch (const SinkOpenError&) {
        return RPROF_ERR_OPEN;
    } catch (const std::exception&) {
        return RPROF_ERR_WRITE;
    }
    return RPROF_OK;
}

}  // namespace rprof::c_api
