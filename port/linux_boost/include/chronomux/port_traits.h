/**
 * @file port_traits.h
 * @brief Port-specific compile-time constants
 *
 * Each port must provide this header defining:
 * - CHRONOMUX_PORT_CONTEXT_SIZE: Size of chronomux_port_context_t in bytes
 * - CHRONOMUX_PORT_CONTEXT_ALIGN: Alignment requirement for chronomux_port_context_t
 * - CHRONOMUX_STACK_ALIGN: Stack alignment requirement
 *
 * The port implementation must static_assert that the actual sizes fit.
 */

#ifndef CHRONOMUX_PORT_TRAITS_H
#define CHRONOMUX_PORT_TRAITS_H

/* ============================================================================
 * Boost.Context Port (Linux Simulation)
 * ========================================================================= */

#define CHRONOMUX_PORT_CONTEXT_SIZE  64

#define CHRONOMUX_PORT_CONTEXT_ALIGN 8

/**
 * @brief Stack alignment requirement in bytes (power of two)
 */
#define CHRONOMUX_STACK_ALIGN 16

/**
 * @brief Counter frequency of the simulated timer (1 tick = 1 us)
 */
#define CHRONOMUX_PORT_TIMER_FREQ_HZ 1000000ull

#define CHRONOMUX_PORT_SIMULATION 1

#endif // CHRONOMUX_PORT_TRAITS_H
