/**
 * @file opentitan_timer.cpp
 * @brief OpenTitan rv_timer HardwareTimer implementation
 */

#include "chronomux/opentitan_timer.hpp"
#include "DEBUG_PRINT.hpp"

#include <cassert>
#include <limits>

namespace chronomux
{

using namespace rv_timer;

static constexpr uint32_t ALL_ONES = std::numeric_limits<uint32_t>::max();
static constexpr uint32_t INTR_TIMER0 = 1u << INTR_TIMER0_BIT;

static inline uint64_t ceil_div_u64(uint64_t a, uint64_t b) noexcept { return (a + b - 1) / b; }

OpenTitanTimer::OpenTitanTimer(volatile uint32_t* csr, uint64_t base_freq_hz) noexcept
   : csr(csr), prescaler(static_cast<uint32_t>(base_freq_hz / TIMER_FREQ_HZ - 1))
{
   assert(csr != nullptr);
   assert(base_freq_hz >= TIMER_FREQ_HZ && "Timer clock slower than the tick rate");
   assert(base_freq_hz / TIMER_FREQ_HZ - 1 <= CFG0_PRESCALE_MASK && "Prescaler does not fit CFG0");
}

uint32_t OpenTitanTimer::read(std::size_t offset) const noexcept
{
   return csr[offset / sizeof(uint32_t)];
}

void OpenTitanTimer::write(std::size_t offset, uint32_t value) noexcept
{
   csr[offset / sizeof(uint32_t)] = value;
}

void OpenTitanTimer::setup() noexcept
{
   write(CFG0_REG_OFFSET, cfg0(prescaler, /*step=*/1));
   write(COMPARE_LOWER0_0_REG_OFFSET, ALL_ONES);
   write(COMPARE_UPPER0_0_REG_OFFSET, ALL_ONES);
   write(INTR_STATE0_REG_OFFSET, INTR_TIMER0);   // w1c
   write(INTR_ENABLE0_REG_OFFSET, 0);
   write(CTRL_REG_OFFSET, 1u << CTRL_ACTIVE_0_BIT);
   initialised = true;

   LOG_HW("OpenTitanTimer::setup() @PRESCALE(%u)", prescaler);
}

TimePoint OpenTitanTimer::now() const noexcept
{
   assert(initialised && "OpenTitanTimer used before setup()");

   uint32_t high = read(TIMER_V_UPPER0_REG_OFFSET);
   while (true) {
      uint32_t const low = read(TIMER_V_LOWER0_REG_OFFSET);
      uint32_t const high_again = read(TIMER_V_UPPER0_REG_OFFSET);
      if (high_again == high) {
         return TimePoint{(static_cast<uint64_t>(high) << 32) | low};
      }
      high = high_again;
   }
}

Duration OpenTitanTimer::from_milliseconds(uint32_t ms) const noexcept
{
   return Duration{ceil_div_u64(uint64_t(ms) * TIMER_FREQ_HZ, 1000ULL)};
}

Duration OpenTitanTimer::from_microseconds(uint32_t us) const noexcept
{
   return Duration{ceil_div_u64(uint64_t(us) * TIMER_FREQ_HZ, 1'000'000ULL)};
}

void OpenTitanTimer::set_alarm(TimePoint deadline) noexcept
{
   assert(initialised && "OpenTitanTimer used before setup()");

   auto const high = static_cast<uint32_t>(deadline.value >> 32);
   auto const low  = static_cast<uint32_t>(deadline.value & ALL_ONES);

   write(COMPARE_LOWER0_0_REG_OFFSET, ALL_ONES);
   write(COMPARE_UPPER0_0_REG_OFFSET, high);
   write(COMPARE_LOWER0_0_REG_OFFSET, low);

   write(INTR_ENABLE0_REG_OFFSET, INTR_TIMER0);
}

void OpenTitanTimer::disarm() noexcept
{
   assert(initialised && "OpenTitanTimer used before setup()");

   write(INTR_ENABLE0_REG_OFFSET, 0);
   write(COMPARE_LOWER0_0_REG_OFFSET, ALL_ONES);
   write(COMPARE_UPPER0_0_REG_OFFSET, ALL_ONES);
}

void OpenTitanTimer::ack_interrupt() noexcept
{
   assert(initialised && "OpenTitanTimer used before setup()");

   write(INTR_STATE0_REG_OFFSET, INTR_TIMER0);   // w1c
   write(INTR_ENABLE0_REG_OFFSET, 0);
}

} // namespace chronomux
