/**
 * @file port.h
 * @brief chronomux Port Layer API (C ABI)
 *
 * This is the hardware abstraction layer between the timer service and
 * platform-specific code. All functions use C linkage so a board port can be
 * written in C or assembly.
 *
 * Port implementations must provide all functions declared here. The Linux
 * backend additionally implements the simulation hooks at the end of the file.
 */

#ifndef CHRONOMUX_PORT_H
#define CHRONOMUX_PORT_H

#include "chronomux/port_traits.h"

#include <stddef.h>
#include <stdint.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

/* ============================================================================
 * Port Configuration
 * ========================================================================= */
#ifndef CHRONOMUX_PORT_SIMULATION
# define CHRONOMUX_PORT_SIMULATION 0
#endif

/**
 * @brief Opaque context structure (platform-specific size/alignment)
 *
 * Each port defines the actual structure. Callers treat this as opaque and
 * allocate CHRONOMUX_PORT_CONTEXT_SIZE bytes for it.
 */
typedef struct chronomux_port_context chronomux_port_context_t;

/**
 * @brief Execution context entry point signature
 */
typedef void (*chronomux_port_entry_t)(void* arg);

/**
 * @brief ISR signature
 */
typedef void (*chronomux_port_isr_handler_t)(void* arg);

/* ============================================================================
 * Execution Contexts
 *
 * On the target every client is a separate protection domain. In simulation a
 * client is a cooperative context on the caller's stack set, resumed by the
 * runtime and suspended whenever it waits for a deferred IPC reply.
 * ========================================================================= */

/**
 * @brief Initialize an execution context
 * @param context Pointer to context storage (CHRONOMUX_PORT_CONTEXT_SIZE bytes)
 * @param stack_base Pointer to the base (lowest address) of the stack
 * @param stack_size Size of the stack in bytes
 * @param entry Entry point function
 * @param arg Argument to pass to entry function
 *
 * The context starts executing entry(arg) on the first chronomux_port_resume().
 */
void chronomux_port_context_init(chronomux_port_context_t* context,
                                 void* stack_base,
                                 size_t stack_size,
                                 chronomux_port_entry_t entry,
                                 void* arg);

/**
 * @brief Destroy a context
 *
 * A context that has not finished is unwound first.
 */
void chronomux_port_context_destroy(chronomux_port_context_t* context);

/**
 * @brief Run a context until it yields or its entry function returns
 */
void chronomux_port_resume(chronomux_port_context_t* context);

/**
 * @brief Suspend the current context and return to whoever resumed it
 *
 * No-op when called outside of a context.
 */
void chronomux_port_yield(void);

/**
 * @brief Check whether a context's entry function has returned
 */
bool chronomux_port_context_finished(chronomux_port_context_t const* context);

/**
 * @brief Check whether the caller is running inside a context
 */
bool chronomux_port_in_context(void);

/* ============================================================================
 * CPU Hints
 * ========================================================================= */

void chronomux_port_cpu_relax(void);

/* ============================================================================
 * Platform Initialization
 * ========================================================================= */

/**
 * @brief Initialize the port layer
 *
 * Called once at service start before the hardware timer is set up.
 */
void chronomux_port_init(void);

/* ============================================================================
 * Timer Port
 *
 * One free-running 64-bit counter and one comparator. When the counter
 * reaches the comparator while the timer interrupt is enabled, the port
 * raises the timer IRQ and calls the registered handler. The IRQ line stays
 * masked at platform level until chronomux_port_irq_ack() is called.
 * ========================================================================= */

/**
 * @brief Configure the timer peripheral: counter running, interrupt disabled.
 */
void chronomux_port_time_setup(void);

/**
 * @brief Monotonic time source in port ticks
 */
uint64_t chronomux_port_time_now(void);

/**
 * @brief Free-running counter frequency in Hz (ticks per second).
 */
uint64_t chronomux_port_time_freq_hz(void);

/**
 * @brief Program the comparator for an absolute deadline.
 *
 * Replaces any previously programmed deadline. Does not enable the interrupt.
 */
void chronomux_port_time_arm(uint64_t deadline);

/**
 * @brief Clear the comparator.
 */
void chronomux_port_time_disarm(void);

/**
 * @brief Timer interrupt enable/disable at the peripheral
 */
void chronomux_port_time_irq_enable(void);
void chronomux_port_time_irq_disable(void);
bool chronomux_port_time_irq_enabled(void);

void chronomux_port_time_register_isr_handler(chronomux_port_isr_handler_t handler, void* arg);

/**
 * @brief Acknowledge the timer IRQ at platform level (unmask the line).
 */
void chronomux_port_irq_ack(void);

/* ============================================================================
 * Simulation Hooks (Linux backend only)
 * ========================================================================= */

/**
 * @brief Reset counter, comparator, interrupt state and ISR registration.
 */
void chronomux_port_time_reset(uint64_t time);

/**
 * @brief Advance the counter and deliver the timer IRQ if it became due.
 *
 * advance(0) delivers an IRQ that is already due, e.g. a deadline that was
 * programmed in the past.
 */
void chronomux_port_time_advance(uint64_t delta);

/**
 * @brief Comparator value if the timer interrupt is enabled, UINT64_MAX otherwise.
 */
uint64_t chronomux_port_time_armed_deadline(void);

/**
 * @brief Number of timer IRQs delivered since the last reset.
 */
uint64_t chronomux_port_time_irq_count(void);

#ifdef __cplusplus
}
#endif

#endif /* CHRONOMUX_PORT_H */
