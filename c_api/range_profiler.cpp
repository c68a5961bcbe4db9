/**
 * @file range_profiler.cpp
 * @brief C interface to the range profiler: handle marshaling only
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include "range_profiler.h"

#include <new>

#include "../profiler/profiler.hxx"
#include "../sink/sink.hxx"
#include "status.hxx"

struct rprof_profiler {
    rprof::Profiler profiler;
};

struct rprof_scope {
    rprof::ProfileScope scope;
};

extern "C" {

rprof_profiler* rprof_create(void) { return new (std::nothrow) rprof_profiler{}; }

void rprof_destroy(rprof_profiler* profiler) { delete profiler; }

void rprof_enable(rprof_profiler* profiler) { profiler->profiler.enable(); }

void rprof_disable(rprof_profiler* profiler) { profiler->profiler.disable(); }

rprof_scope* rprof_scope_begin(rprof_profiler* profiler, const char* name) {
    return new (std::nothrow) rprof_scope{profiler->profiler.start_scope(name)};
}

void rprof_scope_end(rprof_profiler* profiler, rprof_scope* scope) {
    if (scope == nullptr) {
        return;
    }
    profiler->profiler.end_scope(scope->scope);
    delete scope;
}

int rprof_save(rprof_profiler* profiler, const char* path) {
    return rprof::c_api::status_of([&] {
        rprof::FileSink sink(path);
        profiler->profiler.save(sink);
    });
}

}  // extern "C"
