// SPDX-License-Identifier: MIT
#pragma once

/**
 * @file parallel.hpp
 * @brief Parallelization macros for OpenMP or sequential execution
 *
 * Usage:
 *   OPTRISK_PRAGMA_PARALLEL_FOR
 *   for (size_t i = 0; i < n; ++i) { ... }
 *
 *   OPTRISK_PRAGMA_PARALLEL_FOR_DYNAMIC   // uneven per-index cost
 *   for (size_t i = 0; i < n; ++i) { ... }
 *
 * Loop bodies must be independent per index; the macros expand to nothing
 * when the library is built without OpenMP.
 */

#if defined(_OPENMP)
    #define OPTRISK_PRAGMA_PARALLEL_FOR         _Pragma("omp parallel for")
    #define OPTRISK_PRAGMA_PARALLEL_FOR_DYNAMIC _Pragma("omp parallel for schedule(dynamic, 1)")
#else
    #define OPTRISK_PRAGMA_PARALLEL_FOR
    #define OPTRISK_PRAGMA_PARALLEL_FOR_DYNAMIC
#endif
