/**
 * @file port_timer.cpp
 * @brief HardwareTimer over the port layer
 */

#include "chronomux/port_timer.hpp"
#include "chronomux/port.h"
#include "DEBUG_PRINT.hpp"

#include <cassert>

namespace chronomux
{

static inline uint64_t ceil_div_u64(uint64_t a, uint64_t b) noexcept { return (a + b - 1) / b; }

void PortTimer::setup() noexcept
{
   chronomux_port_time_irq_disable();
   chronomux_port_time_disarm();
   if (initialised) return;

   chronomux_port_time_setup();
   initialised = true;
   LOG_HW("PortTimer::setup() @FREQ(%llu Hz)", static_cast<unsigned long long>(chronomux_port_time_freq_hz()));
}

TimePoint PortTimer::now() const noexcept
{
   assert(initialised && "PortTimer used before setup()");
   return TimePoint{chronomux_port_time_now()};
}

Duration PortTimer::from_milliseconds(uint32_t ms) const noexcept
{
   const uint64_t f = chronomux_port_time_freq_hz();
   return Duration{ceil_div_u64(uint64_t(ms) * f, 1000ULL)};
}

Duration PortTimer::from_microseconds(uint32_t us) const noexcept
{
   const uint64_t f = chronomux_port_time_freq_hz();
   return Duration{ceil_div_u64(uint64_t(us) * f, 1'000'000ULL)};
}

void PortTimer::set_alarm(TimePoint deadline) noexcept
{
   assert(initialised && "PortTimer used before setup()");
   chronomux_port_time_arm(deadline.value);
   chronomux_port_time_irq_enable();
   LOG_HW("PortTimer::set_alarm() @ALARM(%llu)", static_cast<unsigned long long>(deadline.value));
}

void PortTimer::disarm() noexcept
{
   assert(initialised && "PortTimer used before setup()");
   chronomux_port_time_irq_disable();
   chronomux_port_time_disarm();
   LOG_HW("PortTimer::disarm()");
}

void PortTimer::ack_interrupt() noexcept
{
   assert(initialised && "PortTimer used before setup()");
   // Comparator match is level style on the port: disabling clears the pending request
   chronomux_port_time_irq_disable();
}

} // namespace chronomux
