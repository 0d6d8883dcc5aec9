/**
 * @file port_linux_boost.cpp
 * @brief Linux simulation port using Boost.Context
 *
 * Client processes run as Boost.Context fibers on preallocated stacks so a
 * client blocked on a deferred IPC reply simply stays suspended until the
 * runtime resumes it.
 *
 * The timer peripheral is a counter that only moves when the runtime (or a
 * test) advances it. Advancing past the programmed comparator with the
 * interrupt enabled delivers the registered ISR, the same way the hardware
 * would raise the timer IRQ.
 */

#include "chronomux/port.h"
#include "chronomux/port_traits.h"

#include <boost/context/fiber.hpp>
#include <boost/context/preallocated.hpp>
#include <boost/context/stack_context.hpp>

#include <atomic>
#include <cassert>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <memory>
#include <new>

/* ============================================================================
 * Port Context Structure
 * ========================================================================= */

struct chronomux_port_context
{
   boost::context::fiber  fiber;     // Context fiber (owned by resumer while suspended)
   boost::context::fiber  resumer;   // Whoever resumed us (owned by the context while running)
   void*                  stack_top;
   size_t                 stack_size;
   chronomux_port_entry_t entry;
   void*                  arg;
   bool                   finished;
};

static_assert(sizeof(chronomux_port_context) <= CHRONOMUX_PORT_CONTEXT_SIZE,
              "CHRONOMUX_PORT_CONTEXT_SIZE too small - adjust in port_traits.h");
static_assert(alignof(chronomux_port_context) <= CHRONOMUX_PORT_CONTEXT_ALIGN,
              "CHRONOMUX_PORT_CONTEXT_ALIGN too small - adjust in port_traits.h");
static_assert((CHRONOMUX_STACK_ALIGN & (CHRONOMUX_STACK_ALIGN - 1)) == 0,
              "CHRONOMUX_STACK_ALIGN must be a power of two");

/* ============================================================================
 * Thread-Local State
 * ========================================================================= */

// Context currently running on this pthread (used by chronomux_port_yield)
static thread_local chronomux_port_context* tls_current_context = nullptr;

/* ============================================================================
 * Execution Contexts
 * ========================================================================= */

// No-op stack allocator for preallocated memory
struct preallocated_stack_noop
{
   using traits_type = boost::context::stack_traits;
   boost::context::stack_context allocate(size_t) { std::abort(); }
   void deallocate(boost::context::stack_context&) noexcept {}
};

extern "C" void chronomux_port_context_init(chronomux_port_context_t* context,
                                            void* stack_base,
                                            size_t stack_size,
                                            chronomux_port_entry_t entry,
                                            void* arg)
{
   assert(stack_base != nullptr && stack_size > 0);
   assert(reinterpret_cast<std::uintptr_t>(stack_base) % CHRONOMUX_STACK_ALIGN == 0);

   ::new (context) chronomux_port_context
   {
      .fiber      = {},
      .resumer    = {},
      .stack_top  = static_cast<uint8_t*>(stack_base) + stack_size,
      .stack_size = stack_size,
      .entry      = entry,
      .arg        = arg,
      .finished   = false,
   };

   boost::context::stack_context boost_stack_context{};
   boost_stack_context.size = context->stack_size;
   boost_stack_context.sp   = context->stack_top;

   boost::context::preallocated boost_prealloc(
      boost_stack_context.sp,
      boost_stack_context.size,
      boost_stack_context
   );

   context->fiber = boost::context::fiber(
      std::allocator_arg,
      boost_prealloc,
      preallocated_stack_noop{},
      [context](boost::context::fiber&& resumer) mutable -> boost::context::fiber
      {
         context->resumer = std::move(resumer);

         try {
            tls_current_context = context;
            context->entry(context->arg);
            tls_current_context = nullptr;
         } catch (boost::context::detail::forced_unwind const&) {
            // Context destroyed while suspended, let Boost finish the unwind
            tls_current_context = nullptr;
            context->finished = true;
            throw;
         }

         context->finished = true;
         return std::move(context->resumer);
      }
   );
}

extern "C" void chronomux_port_context_destroy(chronomux_port_context_t* context)
{
   // Dropping a suspended fiber unwinds its stack
   context->fiber   = boost::context::fiber{};
   context->resumer = boost::context::fiber{};
   context->~chronomux_port_context();
}

extern "C" void chronomux_port_resume(chronomux_port_context_t* context)
{
   assert(!context->finished && "Resuming a finished context");
   assert(context->fiber && "No context to switch to");

   auto* previous = tls_current_context;
   tls_current_context = context;
   context->fiber = std::move(context->fiber).resume();
   tls_current_context = previous;
}

extern "C" void chronomux_port_yield(void)
{
   // No current context - nothing to yield from
   if (!tls_current_context) return;

   auto* current = tls_current_context;
   tls_current_context = nullptr;

   assert(current->resumer && "No resumer to switch to");
   current->resumer = std::move(current->resumer).resume();
   tls_current_context = current;
}

extern "C" bool chronomux_port_context_finished(chronomux_port_context_t const* context)
{
   return context->finished;
}

extern "C" bool chronomux_port_in_context(void)
{
   return tls_current_context != nullptr;
}

/* ============================================================================
 * CPU Hints
 * ========================================================================= */

extern "C" void chronomux_port_cpu_relax(void)
{
#if defined(__x86_64__) || defined(__i386__)
   __builtin_ia32_pause();
#elif defined(__aarch64__) || defined(__arm__)
   __asm__ __volatile__("yield");
#endif
}

/* ============================================================================
 * Platform Initialization
 * ========================================================================= */

extern "C" void chronomux_port_init(void)
{
}

/* ============================================================================
 * Timer Port (Linux Boost)
 *
 * - Counter only moves through chronomux_port_time_advance()
 * - Comparator compare is level style: due while now >= deadline
 * - Delivery masks the IRQ line until chronomux_port_irq_ack()
 * ========================================================================= */

static constexpr uint64_t DISARMED = std::numeric_limits<uint64_t>::max();

static std::atomic<uint64_t> g_port_now{0};

static std::atomic<bool>     g_time_irq_enabled{false};
static std::atomic<bool>     g_irq_line_masked{false};
static std::atomic<uint64_t> g_armed_deadline{DISARMED};
static std::atomic<uint64_t> g_irq_count{0};
static std::atomic<chronomux_port_isr_handler_t> g_isr{nullptr};
static std::atomic<void*>    g_isr_arg{nullptr};

static void deliver_time_irq_if_due()
{
   if (!g_time_irq_enabled.load(std::memory_order_acquire)) return;

   uint64_t const deadline = g_armed_deadline.load(std::memory_order_acquire);
   if (deadline == DISARMED || g_port_now.load(std::memory_order_acquire) < deadline) return;

   auto handler = g_isr.load(std::memory_order_acquire);
   if (!handler) return;

   // Line stays masked until the handler path acknowledges it
   bool expected = false;
   if (!g_irq_line_masked.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) return;

   g_irq_count.fetch_add(1, std::memory_order_relaxed);
   handler(g_isr_arg.load(std::memory_order_acquire));
}

extern "C" void chronomux_port_time_setup(void)
{
   g_time_irq_enabled.store(false, std::memory_order_release);
   g_armed_deadline.store(DISARMED, std::memory_order_release);
}

extern "C" uint64_t chronomux_port_time_now(void)
{
   return g_port_now.load(std::memory_order_relaxed);
}

extern "C" uint64_t chronomux_port_time_freq_hz(void)
{
   return CHRONOMUX_PORT_TIMER_FREQ_HZ;
}

extern "C" void chronomux_port_time_arm(uint64_t deadline)
{
   g_armed_deadline.store(deadline, std::memory_order_release);
}

extern "C" void chronomux_port_time_disarm(void)
{
   g_armed_deadline.store(DISARMED, std::memory_order_release);
}

extern "C" void chronomux_port_time_irq_enable(void)  { g_time_irq_enabled.store(true,  std::memory_order_release); }
extern "C" void chronomux_port_time_irq_disable(void) { g_time_irq_enabled.store(false, std::memory_order_release); }
extern "C" bool chronomux_port_time_irq_enabled(void) { return g_time_irq_enabled.load(std::memory_order_acquire); }

extern "C" void chronomux_port_time_register_isr_handler(chronomux_port_isr_handler_t h, void* arg)
{
   g_isr_arg.store(arg, std::memory_order_relaxed);
   g_isr.store(h, std::memory_order_release);
}

extern "C" void chronomux_port_irq_ack(void)
{
   g_irq_line_masked.store(false, std::memory_order_release);
}

/* ============================================================================
 * Simulation Hooks
 * ========================================================================= */

extern "C" void chronomux_port_time_reset(uint64_t t)
{
   g_port_now.store(t, std::memory_order_release);
   g_armed_deadline.store(DISARMED, std::memory_order_release);
   g_time_irq_enabled.store(false, std::memory_order_release);
   g_irq_line_masked.store(false, std::memory_order_release);
   g_irq_count.store(0, std::memory_order_release);
   g_isr.store(nullptr, std::memory_order_release);
   g_isr_arg.store(nullptr, std::memory_order_release);
}

extern "C" void chronomux_port_time_advance(uint64_t delta)
{
   g_port_now.fetch_add(delta, std::memory_order_release);
   deliver_time_irq_if_due();
}

extern "C" uint64_t chronomux_port_time_armed_deadline(void)
{
   if (!g_time_irq_enabled.load(std::memory_order_acquire)) return DISARMED;
   return g_armed_deadline.load(std::memory_order_acquire);
}

extern "C" uint64_t chronomux_port_time_irq_count(void)
{
   return g_irq_count.load(std::memory_order_relaxed);
}
