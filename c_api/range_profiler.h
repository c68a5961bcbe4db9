/**
 * @file range_profiler.h
 * @brief C interface to the range profiler (opaque handles)
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 *
 * Handles must come from rprof_create() / rprof_scope_begin() and must not be
 * used after rprof_destroy() / rprof_scope_end(). Anything else is undefined
 * behaviour: beyond the NULL checks documented below, nothing is validated.
 *
 * Names passed to rprof_scope_begin() are borrowed. They must stay valid until
 * the last rprof_save() on that profiler.
 */

#ifndef RPROF_RANGE_PROFILER_H
#define RPROF_RANGE_PROFILER_H

#ifdef __cplusplus
extern "C" {
#endif

typedef struct rprof_profiler rprof_profiler;
typedef struct rprof_scope rprof_scope;

/* rprof_save() status codes */
#define RPROF_OK 0
#define RPROF_ERR_OPEN 1
#define RPROF_ERR_WRITE 2

/* New enabled profiler, or NULL if out of memory. */
rprof_profiler* rprof_create(void);

/* Releases the profiler and everything it recorded. */
void rprof_destroy(rprof_profiler* profiler);

void rprof_enable(rprof_profiler* profiler);
void rprof_disable(rprof_profiler* profiler);

/* Opens a range. Returns NULL if out of memory; NULL may be passed to rprof_scope_end(). */
rprof_scope* rprof_scope_begin(rprof_profiler* profiler, const char* name);

/* Closes and records the range, then frees the scope handle. */
void rprof_scope_end(rprof_profiler* profiler, rprof_scope* scope);

/*
 * Writes the TSV profile to `path` (created or truncated).
 * Returns RPROF_OK, RPROF_ERR_OPEN if the file could not be created,
 * or RPROF_ERR_WRITE if writing failed part way.
 */
int rprof_save(rprof_profiler* profiler, const char* path);

#ifdef __cplusplus
}
#endif

#endif /* RPROF_RANGE_PROFILER_H */
