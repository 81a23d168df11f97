// SPDX-License-Identifier: MIT
/**
 * @file optrisk_trace.h
 * @brief USDT (User Statically-Defined Tracing) probes for the optrisk library
 *
 * Tracing points that can be enabled at runtime with bpftrace, systemtap
 * or perf. When tracing is disabled (default), probes compile to nothing.
 * When enabled, probes capture structured data without modifying the
 * library binary.
 *
 * Example usage with bpftrace:
 *   # Every implied-vol solve that fell through to bisection
 *   sudo bpftrace -e 'usdt:./liboptrisk.so:optrisk:iv_complete /arg2 == 2/ { @[arg1] = count(); }'
 *
 *   # Rejected inputs, by module and error code
 *   sudo bpftrace -e 'usdt:./liboptrisk.so:optrisk:validation_error { @[arg0, arg1] = count(); }'
 */

#ifndef OPTRISK_TRACE_H
#define OPTRISK_TRACE_H

#include <stddef.h>

/**
 * USDT Configuration
 *
 * On Linux with systemtap-sdt-dev installed, use sys/sdt.h
 * Otherwise, define no-op macros for compatibility
 */
#ifdef HAVE_SYSTEMTAP_SDT
#include <sys/sdt.h>
#else
#define DTRACE_PROBE(provider, probe) do {} while(0)
#define DTRACE_PROBE1(provider, probe, arg1) do {} while(0)
#define DTRACE_PROBE2(provider, probe, arg1, arg2) do {} while(0)
#define DTRACE_PROBE3(provider, probe, arg1, arg2, arg3) do {} while(0)
#define DTRACE_PROBE4(provider, probe, arg1, arg2, arg3, arg4) do {} while(0)
#define DTRACE_PROBE5(provider, probe, arg1, arg2, arg3, arg4, arg5) do {} while(0)
#endif

/**
 * Provider name for all optrisk probes
 */
#define OPTRISK_PROVIDER optrisk

/**
 * Module identifiers, passed as the first parameter to the generic probes
 */
#define OPTRISK_MODULE_VALUATION    1
#define OPTRISK_MODULE_IMPLIED_VOL  2
#define OPTRISK_MODULE_PORTFOLIO    3
#define OPTRISK_MODULE_SCENARIO     4
#define OPTRISK_MODULE_SURFACE      5
#define OPTRISK_MODULE_PAYOFF       6
#define OPTRISK_MODULE_MONTE_CARLO  7
#define OPTRISK_MODULE_ROOT_FINDING 8

/**
 * Implied-vol solve methods reported by OPTRISK_TRACE_IV_COMPLETE
 */
#define OPTRISK_IV_METHOD_NONE      0
#define OPTRISK_IV_METHOD_NEWTON    1
#define OPTRISK_IV_METHOD_BISECTION 2

/**
 * ============================================================================
 * Algorithm Lifecycle Probes
 * ============================================================================
 */

/**
 * Fired when an algorithm begins execution
 * @param module_id: Module identifier (OPTRISK_MODULE_* constant)
 * @param param1: Module-specific parameter (e.g., grid size, n_sims)
 * @param param2: Module-specific parameter (e.g., tolerance, horizon)
 * @param param3: Module-specific parameter
 */
#define OPTRISK_TRACE_ALGO_START(module_id, param1, param2, param3) \
    DTRACE_PROBE4(OPTRISK_PROVIDER, algo_start, module_id, param1, param2, param3)

/**
 * Fired when an algorithm completes successfully
 * @param module_id: Module identifier
 * @param iterations: Points evaluated or iterations completed
 * @param final_metric: Final metric value
 */
#define OPTRISK_TRACE_ALGO_COMPLETE(module_id, iterations, final_metric) \
    DTRACE_PROBE3(OPTRISK_PROVIDER, algo_complete, module_id, iterations, final_metric)

/**
 * ============================================================================
 * Convergence Tracking Probes
 * ============================================================================
 */

/**
 * Fired on each iteration of a convergence loop
 * @param module_id: Module identifier
 * @param step: Solver phase (OPTRISK_IV_METHOD_* for the IV solver)
 * @param iter: Current iteration number
 * @param error: Current error metric
 * @param tolerance: Convergence threshold
 */
#define OPTRISK_TRACE_CONVERGENCE_ITER(module_id, step, iter, error, tolerance) \
    DTRACE_PROBE5(OPTRISK_PROVIDER, convergence_iter, module_id, step, iter, error, tolerance)

/**
 * Fired when convergence is achieved
 */
#define OPTRISK_TRACE_CONVERGENCE_SUCCESS(module_id, step, final_iter, final_error) \
    DTRACE_PROBE4(OPTRISK_PROVIDER, convergence_success, module_id, step, final_iter, final_error)

/**
 * Fired when convergence fails
 */
#define OPTRISK_TRACE_CONVERGENCE_FAILED(module_id, step, max_iter, final_error) \
    DTRACE_PROBE4(OPTRISK_PROVIDER, convergence_failed, module_id, step, max_iter, final_error)

/**
 * ============================================================================
 * Validation Probes
 * ============================================================================
 */

/**
 * Fired when input validation fails
 * @param module_id: Module identifier
 * @param error_code: ValidationErrorCode or IVErrorCode cast to int
 * @param param1: Offending value
 * @param param2: Offending index (0 if not applicable)
 */
#define OPTRISK_TRACE_VALIDATION_ERROR(module_id, error_code, param1, param2) \
    DTRACE_PROBE4(OPTRISK_PROVIDER, validation_error, module_id, error_code, param1, param2)

/**
 * ============================================================================
 * Module-Specific Probes: Implied Volatility
 * ============================================================================
 */

/**
 * Fired when IV calculation begins
 */
#define OPTRISK_TRACE_IV_START(spot, strike, time_to_maturity, market_price) \
    DTRACE_PROBE4(OPTRISK_PROVIDER, iv_start, spot, strike, time_to_maturity, market_price)

/**
 * Fired when IV calculation completes
 * @param implied_vol: Calculated implied volatility (0 on failure)
 * @param iterations: Total iterations across both phases
 * @param method: OPTRISK_IV_METHOD_* that produced the result
 */
#define OPTRISK_TRACE_IV_COMPLETE(implied_vol, iterations, method) \
    DTRACE_PROBE3(OPTRISK_PROVIDER, iv_complete, implied_vol, iterations, method)

/**
 * ============================================================================
 * Module-Specific Probes: Monte Carlo
 * ============================================================================
 */

/**
 * Fired before path generation
 * @param n_sims: Number of paths
 * @param horizon_days: Simulation horizon in calendar days
 * @param sigma: Resolved volatility
 * @param mu: Resolved drift
 */
#define OPTRISK_TRACE_MC_START(n_sims, horizon_days, sigma, mu) \
    DTRACE_PROBE4(OPTRISK_PROVIDER, mc_start, n_sims, horizon_days, sigma, mu)

/**
 * Fired after the distribution statistics are computed
 */
#define OPTRISK_TRACE_MC_COMPLETE(n_sims, mean, stddev) \
    DTRACE_PROBE3(OPTRISK_PROVIDER, mc_complete, n_sims, mean, stddev)

#endif  // OPTRISK_TRACE_H
