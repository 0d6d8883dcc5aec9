/**
 * @file timer_service.hpp
 * @brief The TimerService RPC surface
 *
 * Entry points fall into two groups that share one Spinlock:
 *   - Client requests, called from the IPC dispatcher with the caller's badge
 *   - The timer interrupt entry, called from the platform ISR
 *
 * A badge is connected to a free client slot the first time it arms a timer
 * or waits. The invalid badge gets NoSuchClient, and a new badge arriving
 * when every slot is taken gets TooManyClients. Cancel, completed_timers and
 * capscan never take a slot: for a badge that is not connected they answer
 * as for a client with no timers.
 *
 * Every critical section is short and non-blocking; a wait() with nothing
 * pending parks a continuation instead of blocking.
 */

#ifndef CHRONOMUX_TIMER_SERVICE_HPP
#define CHRONOMUX_TIMER_SERVICE_HPP

#include "chronomux/client_registry.hpp"
#include "chronomux/function.hpp"
#include "chronomux/hardware_timer.hpp"
#include "chronomux/spinlock.hpp"
#include "chronomux/timer_manager.hpp"
#include "chronomux/timer_types.hpp"

#include <cstdint>
#include <optional>
#include <utility>

namespace chronomux
{

class TimerService
{
public:
   /**
    * @brief Platform interrupt acknowledge, run after the service lock is dropped
    */
   using IrqAck = Function<void(), 16>;

   explicit TimerService(IHardwareTimer& hw, IrqAck irq_ack = {});

   TimerService(TimerService const&)            = delete;
   TimerService& operator=(TimerService const&) = delete;

   /* ============================================================================
    * Client Requests
    * ========================================================================= */

   [[nodiscard]] TimerServiceError timer_oneshot(Badge badge, TimerId id, uint32_t duration_ms);
   [[nodiscard]] TimerServiceError timer_periodic(Badge badge, TimerId id, uint32_t duration_ms);
   [[nodiscard]] TimerServiceError timer_cancel(Badge badge, TimerId id);
   [[nodiscard]] CompletedTimers   timer_completed_timers(Badge badge);

   /**
    * @brief Deferred-reply wait
    *
    * `waiter` is invoked exactly once: immediately if completions are pending
    * or the request fails, otherwise from the interrupt entry when one of the
    * client's timers fires.
    */
   TimerServiceError timer_wait(Badge badge, Waiter&& waiter);

   /**
    * @brief Dump the caller's timers and the service state to the log
    */
   [[nodiscard]] TimerServiceError timer_capscan(Badge badge);

   /**
    * @brief Client teardown: cancel its timers and free its slot
    */
   void timer_disconnect(Badge badge);

   /* ============================================================================
    * Interrupt Entry
    * ========================================================================= */

   void timer_interrupt_handle();

   /**
    * @brief C-compatible ISR entry, `self` is the TimerService
    */
   static void isr_trampoline(void* self);

   /* ============================================================================
    * Inspection (tests and debug)
    * ========================================================================= */

   /**
    * @brief Run `fn(TimerManager const&, ClientRegistry const&)` under the service lock
    */
   template<typename Fn>
   decltype(auto) inspect(Fn&& fn) const
   {
      SpinlockGuard guard(lock);
      return std::forward<Fn>(fn)(std::as_const(manager), std::as_const(registry));
   }

   [[nodiscard]] uint64_t interrupts_handled() const noexcept { return interrupt_count; }

private:
   mutable Spinlock lock;
   TimerManager     manager;
   ClientRegistry   registry;
   IrqAck           irq_ack;
   uint64_t         interrupt_count{0};

   [[nodiscard]] std::optional<ClientId> client_for(Badge badge) noexcept;

   // Why a badge got no client slot
   [[nodiscard]] static TimerServiceError refusal(Badge badge) noexcept;
};

} // namespace chronomux

#endif // CHRONOMUX_TIMER_SERVICE_HPP
