/**
 * @file port_timer.hpp
 * @brief HardwareTimer over the port layer's one-shot timer
 *
 * This is the tickless model: no periodic interrupt, the comparator is
 * programmed only for the next deadline the TimerManager asks for.
 *
 * EMBEDDED-SAFE:
 * - No heap allocation
 * - No locking (the TimerService lock covers every caller)
 *
 * Tick unit and frequency are whatever chronomux_port_time_freq_hz() reports.
 */

#ifndef CHRONOMUX_PORT_TIMER_HPP
#define CHRONOMUX_PORT_TIMER_HPP

#include "chronomux/hardware_timer.hpp"

#include <cstdint>

namespace chronomux
{

class PortTimer final : public IHardwareTimer
{
public:
   PortTimer() noexcept = default;

   void setup() noexcept override;

   [[nodiscard]] TimePoint now() const noexcept override;

   [[nodiscard]] Duration from_milliseconds(uint32_t ms) const noexcept override;
   [[nodiscard]] Duration from_microseconds(uint32_t us) const noexcept override;

   void set_alarm(TimePoint deadline) noexcept override;
   void disarm() noexcept override;
   void ack_interrupt() noexcept override;

   [[nodiscard]] bool is_setup() const noexcept { return initialised; }

private:
   bool initialised{false};
};

} // namespace chronomux

#endif // CHRONOMUX_PORT_TIMER_HPP
