/**
* @file hardware_timer.hpp
* @brief chronomux HardwareTimer capability
*
* The HardwareTimer is the only way the service touches the physical timer:
* - Current time queries
* - Duration to tick conversion
* - One comparator that raises the timer interrupt at a deadline
*
* The TimerManager has NO knowledge of registers or frequencies. It asks the
* HardwareTimer for now(), arms the one comparator for the earliest virtual
* deadline and acknowledges the interrupt when it is serviced.
*
* Architecture:
*
*   TimerManager: wants an interrupt at deadline T
*    -> IHardwareTimer::set_alarm(T): programs comparator, enables interrupt
*       -> Hardware: counter reaches T, timer IRQ raised
*          -> TimerService::timer_interrupt_handle()
*             -> TimerManager::service_interrupt() -> ack_interrupt()
*
* Register access is assumed to always succeed, so no operation reports an
* error. Using the timer before setup() is a programming error.
*/

#ifndef CHRONOMUX_HARDWARE_TIMER_HPP
#define CHRONOMUX_HARDWARE_TIMER_HPP

#include <cstdint>
#include <limits>

namespace chronomux
{

/* ============================================================================
* Time Types
* ========================================================================= */

/**
* @brief Monotonic time point (in hardware ticks)
*
* The unit depends on the HardwareTimer implementation. Wraparound is the
* HardwareTimer's concern: a 64-bit counter at any realistic frequency does
* not wrap within the lifetime of the service.
*/
struct TimePoint
{
   uint64_t value{0};

   constexpr TimePoint() = default;
   constexpr explicit TimePoint(uint64_t v) : value(v) {}

   constexpr bool operator==(TimePoint rhs) const { return value == rhs.value; }
   constexpr bool operator!=(TimePoint rhs) const { return value != rhs.value; }
   constexpr bool operator< (TimePoint rhs) const { return value <  rhs.value; }
   constexpr bool operator<=(TimePoint rhs) const { return value <= rhs.value; }
   constexpr bool operator> (TimePoint rhs) const { return value >  rhs.value; }
   constexpr bool operator>=(TimePoint rhs) const { return value >= rhs.value; }

   static constexpr TimePoint max()
   {
      return TimePoint{std::numeric_limits<uint64_t>::max()};
   }
};

/**
* @brief Duration in the same ticks as TimePoint
*/
struct Duration
{
   uint64_t value{0};

   constexpr Duration() = default;
   constexpr explicit Duration(uint64_t v) : value(v) {}

   constexpr Duration operator+(Duration rhs) const { return Duration{value + rhs.value}; }
   constexpr Duration operator*(uint64_t n)   const { return Duration{value * n}; }

   constexpr bool operator==(Duration rhs) const { return value == rhs.value; }
   constexpr bool operator!=(Duration rhs) const { return value != rhs.value; }
   constexpr bool operator< (Duration rhs) const { return value <  rhs.value; }

   [[nodiscard]] constexpr bool is_zero() const { return value == 0; }
};

constexpr TimePoint operator+(TimePoint tp, Duration d)
{
   return TimePoint{tp.value + d.value};
}

constexpr Duration operator-(TimePoint a, TimePoint b)
{
   return Duration{a.value - b.value};
}

/* ============================================================================
* HardwareTimer Interface
* ========================================================================= */

/**
* @brief Capability over one monotonic counter and one comparator
*
* Implementations:
* - PortTimer:      the port layer's timer (Linux simulation, board ports)
* - OpenTitanTimer: RISC-V rv_timer register block
*/
class IHardwareTimer
{
public:
   IHardwareTimer() = default;
   virtual ~IHardwareTimer() = default;
   IHardwareTimer(IHardwareTimer const&)            = delete;
   IHardwareTimer& operator=(IHardwareTimer const&) = delete;
   IHardwareTimer(IHardwareTimer&&)                 = delete;
   IHardwareTimer& operator=(IHardwareTimer&&)      = delete;

   /**
   * @brief Initialise the peripheral
   *
   * Programs the prescaler, clears and disables the interrupt and starts the
   * counter. Idempotent.
   */
   virtual void setup() = 0;

   /**
   * @brief Get the current counter value
   */
   [[nodiscard]] virtual TimePoint now() const = 0;

   /**
   * @brief Absolute deadline `d` from now
   */
   [[nodiscard]] virtual TimePoint deadline(Duration d) const { return now() + d; }

   /**
   * @brief Convert to native ticks, rounded up so a timer never fires early
   *
   * Example: at 10kHz, from_milliseconds(10) returns Duration{100}.
   */
   [[nodiscard]] virtual Duration from_milliseconds(uint32_t ms) const = 0;
   [[nodiscard]] virtual Duration from_microseconds(uint32_t us) const = 0;

   /**
   * @brief Program the comparator and enable the interrupt
   * @param deadline Absolute time to interrupt at
   *
   * Replaces any previous deadline. A deadline in the past interrupts as soon
   * as the interrupt is enabled.
   */
   virtual void set_alarm(TimePoint deadline) = 0;

   /**
   * @brief Stop the comparator from interrupting (nothing left to wait for)
   */
   virtual void disarm() = 0;

   /**
   * @brief Clear the pending interrupt and disable it
   *
   * The caller re-arms explicitly with set_alarm().
   */
   virtual void ack_interrupt() = 0;
};

} // namespace chronomux

#endif // CHRONOMUX_HARDWARE_TIMER_HPP
