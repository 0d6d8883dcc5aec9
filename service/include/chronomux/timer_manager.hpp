/**
 * @file timer_manager.hpp
 * @brief Virtual timer multiplexer over one hardware comparator
 *
 * The TimerManager owns the HardwareTimer and every client's virtual timers.
 * All outstanding timers of all clients sit in one deadline index; the
 * comparator is always programmed for the index's earliest deadline and is
 * disarmed when the index is empty.
 *
 * Tickless rearm policy:
 *   - The comparator is reprogrammed only when the earliest deadline differs
 *     from the one the hardware is already armed for.
 *   - After an interrupt is acknowledged the comparator counts as unarmed.
 *
 * The TimerManager does no locking of its own. The TimerService serialises
 * every call (client requests and the interrupt entry) with one Spinlock.
 * Nothing in here blocks.
 */

#ifndef CHRONOMUX_TIMER_MANAGER_HPP
#define CHRONOMUX_TIMER_MANAGER_HPP

#include "chronomux/client_timer_table.hpp"
#include "chronomux/config.hpp"
#include "chronomux/deadline_index.hpp"
#include "chronomux/hardware_timer.hpp"
#include "chronomux/timer_types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace chronomux
{

/**
 * @brief Snapshot of one outstanding timer (debug and tests)
 */
struct TimerInfo
{
   TimePoint deadline{};
   Duration  period{};
   bool      periodic{false};
   uint64_t  expirations{0};
};

class TimerManager
{
public:
   /**
    * @brief Take ownership of the hardware timer and initialise it
    */
   explicit TimerManager(IHardwareTimer& hw);

   TimerManager(TimerManager const&)            = delete;
   TimerManager& operator=(TimerManager const&) = delete;

   /* ============================================================================
    * Client Operations
    * ========================================================================= */

   /**
    * @brief Arm a one-shot timer `duration` ticks from now
    *
    * A zero duration is legal and fires on the next interrupt.
    * @return TimerAlreadyExists if (client, id) is outstanding; nothing is overwritten
    */
   [[nodiscard]] TimerServiceError add_oneshot(ClientId client, TimerId id, Duration duration);

   /**
    * @brief Arm a periodic timer firing at now + N * period for N = 1, 2, ...
    *
    * Fires are scheduled from the previous deadline, never from the time the
    * interrupt was serviced, so interrupt latency does not accumulate.
    * @return InvalidDuration for a zero period
    */
   [[nodiscard]] TimerServiceError add_periodic(ClientId client, TimerId id, Duration period);

   /**
    * @brief Stop an outstanding timer
    *
    * A completion already recorded for the timer stays visible.
    * @return NoSuchTimer if the timer is not outstanding (including a one-shot
    *         that already fired)
    */
   [[nodiscard]] TimerServiceError cancel(ClientId client, TimerId id);

   /**
    * @brief Read and clear the client's completion mask
    */
   [[nodiscard]] CompletedTimers completed_timers(ClientId client);

   /**
    * @brief Wait for the client's next completion
    *
    * With completions already pending the mask is collected and `waiter` is
    * invoked before returning. Otherwise the waiter is parked and invoked by
    * service_interrupt() when one of the client's timers fires.
    *
    * On an error return `waiter` is left untouched and the caller owns it.
    * @return WaitAlreadyPending if the client already has a parked waiter
    */
   [[nodiscard]] TimerServiceError wait(ClientId client, Waiter&& waiter);

   /**
    * @brief Forget everything about a client: timers, completions and waiter
    *
    * A parked waiter is destroyed without being invoked.
    */
   void release_client(ClientId client);

   /* ============================================================================
    * Interrupt Path
    * ========================================================================= */

   /**
    * @brief Handle the comparator interrupt
    *
    * Acknowledges the hardware, fires every timer whose deadline has passed,
    * wakes clients parked in wait() and arms the comparator for the next
    * deadline. A periodic timer that missed several periods fires once, with
    * the missed grid points counted in its expirations.
    *
    * An interrupt with nothing due is tolerated, including one delivered after
    * the last timer was cancelled: nothing fires and the comparator is left
    * disarmed or re-armed for the earliest deadline.
    * @return Number of timers fired (0 for a spurious interrupt)
    */
   uint32_t service_interrupt();

   /* ============================================================================
    * Introspection
    * ========================================================================= */

   [[nodiscard]] std::optional<TimerInfo> timer_info(ClientId client, TimerId id) const;

   /**
    * @brief Mask of the client's outstanding timers
    */
   [[nodiscard]] TimerMask outstanding(ClientId client) const;

   /**
    * @brief Completion mask without clearing it
    */
   [[nodiscard]] TimerMask pending_mask(ClientId client) const;

   [[nodiscard]] bool waiting(ClientId client) const;

   /**
    * @brief Deadline the comparator is programmed for, nullopt when unarmed
    */
   [[nodiscard]] std::optional<TimePoint> armed_deadline() const noexcept { return armed_for; }

   /**
    * @brief Total outstanding timers over all clients
    */
   [[nodiscard]] std::size_t size() const noexcept { return index.size(); }

   [[nodiscard]] IHardwareTimer& hardware() noexcept { return hw; }
   [[nodiscard]] IHardwareTimer const& hardware() const noexcept { return hw; }

   /**
    * @brief Visit every outstanding timer, client by client in TimerId order
    */
   template<typename Fn>
   void for_each_timer(Fn&& fn) const
   {
      for (auto const& table : clients) {
         for (TimerId id = 0; id < Config::TIMERS_PER_CLIENT; ++id) {
            if (table.outstanding(id)) fn(table.slots[id]);
         }
      }
   }

private:
   struct DeadlineTraits
   {
      using Node = VirtualTimer;
      static constexpr uint16_t CAPACITY = Config::MAX_TIMERS;

      static uint16_t& index(Node* n) noexcept { return n->heap_index; }

      static bool earlier(Node const* a, Node const* b) noexcept
      {
         if (a->deadline != b->deadline) return a->deadline < b->deadline;
         return a->sequence < b->sequence; // FIFO among equal deadlines
      }
   };

   static_assert(VirtualTimer::NOT_IN_INDEX == IntrusiveMinHeap<DeadlineTraits>::NOT_IN_HEAP,
                 "VirtualTimer and the deadline index disagree on the unlinked marker");

   IHardwareTimer& hw;
   std::array<ClientTimerTable, Config::MAX_CLIENTS> clients{};
   IntrusiveMinHeap<DeadlineTraits> index{};
   std::optional<TimePoint> armed_for{};
   uint64_t next_sequence{0};

   [[nodiscard]] TimerServiceError check_ids(ClientId client, TimerId id) const noexcept;
   [[nodiscard]] TimerServiceError add_timer(ClientId client, TimerId id, Duration duration, bool periodic);

   void link(VirtualTimer& timer);
   void advance_periodic(VirtualTimer& timer, TimePoint now) noexcept;
   void wake_waiters();
   void rearm_earliest();
};

} // namespace chronomux

#endif // CHRONOMUX_TIMER_MANAGER_HPP
