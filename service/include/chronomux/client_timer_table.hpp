/**
 * @file client_timer_table.hpp
 * @brief Per-client virtual timer storage
 *
 * Every client owns a fixed slot array indexed by TimerId. A slot is in use
 * while its timer is outstanding (armed and not cancelled, or periodic).
 * Completions are recorded in a separate bitmask so a one-shot that fired and
 * was removed still reports its bit until the client collects it.
 */

#ifndef CHRONOMUX_CLIENT_TIMER_TABLE_HPP
#define CHRONOMUX_CLIENT_TIMER_TABLE_HPP

#include "chronomux/config.hpp"
#include "chronomux/hardware_timer.hpp"
#include "chronomux/timer_types.hpp"

#include <array>
#include <cstdint>
#include <limits>

namespace chronomux
{

/**
 * @brief One outstanding virtual timer
 *
 * Intrusively linked into the TimerManager's deadline index through heap_index.
 */
struct VirtualTimer
{
   static constexpr uint16_t NOT_IN_INDEX = std::numeric_limits<uint16_t>::max();

   ClientId  client{0};
   TimerId   id{0};
   TimePoint deadline{};
   Duration  period{};            // Zero for one-shots
   bool      periodic{false};
   uint64_t  expirations{0};      // Grid points passed since registration (periodic)
   uint64_t  sequence{0};         // Registration order, breaks deadline ties FIFO
   uint16_t  heap_index{NOT_IN_INDEX};
};

inline constexpr TimerMask timer_bit(TimerId id) noexcept
{
   return TimerMask{1} << id;
}

struct ClientTimerTable
{
   std::array<VirtualTimer, Config::TIMERS_PER_CLIENT> slots{};

   TimerMask in_use{0};      // Outstanding timers
   TimerMask completed{0};   // Fired and not yet collected
   Waiter    waiter{};       // At most one parked wait per client

   [[nodiscard]] bool outstanding(TimerId id) const noexcept { return (in_use & timer_bit(id)) != 0; }
   [[nodiscard]] bool waiting() const noexcept { return static_cast<bool>(waiter); }

   /**
    * @brief Read-and-clear the completion mask
    */
   TimerMask take_completed() noexcept
   {
      TimerMask mask = completed;
      completed = 0;
      return mask;
   }
};

} // namespace chronomux

#endif // CHRONOMUX_CLIENT_TIMER_TABLE_HPP
