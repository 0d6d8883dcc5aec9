/**
 * @file opentitan_timer.hpp
 * @brief HardwareTimer over an OpenTitan rv_timer block
 *
 * Register-level driver for hart 0 / comparator 0 of the RISC-V timer
 * (https://docs.opentitan.org/hw/ip/rv_timer/doc/). The service maps the
 * register window into its address space and hands the base pointer in.
 *
 * The counter is prescaled down to TIMER_FREQ_HZ, so one tick is 100us.
 */

#ifndef CHRONOMUX_OPENTITAN_TIMER_HPP
#define CHRONOMUX_OPENTITAN_TIMER_HPP

#include "chronomux/hardware_timer.hpp"

#include <cstddef>
#include <cstdint>

namespace chronomux
{

namespace rv_timer
{
   // Register offsets (bytes)
   static constexpr std::size_t CTRL_REG_OFFSET             = 0x004;
   static constexpr std::size_t INTR_ENABLE0_REG_OFFSET     = 0x100;
   static constexpr std::size_t INTR_STATE0_REG_OFFSET      = 0x104;
   static constexpr std::size_t INTR_TEST0_REG_OFFSET       = 0x108;
   static constexpr std::size_t CFG0_REG_OFFSET             = 0x10c;
   static constexpr std::size_t TIMER_V_LOWER0_REG_OFFSET   = 0x110;
   static constexpr std::size_t TIMER_V_UPPER0_REG_OFFSET   = 0x114;
   static constexpr std::size_t COMPARE_LOWER0_0_REG_OFFSET = 0x118;
   static constexpr std::size_t COMPARE_UPPER0_0_REG_OFFSET = 0x11c;
   static constexpr std::size_t REGISTER_WINDOW_SIZE        = 0x120;

   // Field layout
   static constexpr uint32_t CTRL_ACTIVE_0_BIT      = 0;
   static constexpr uint32_t INTR_TIMER0_BIT        = 0;
   static constexpr uint32_t CFG0_PRESCALE_MASK     = 0xfff;
   static constexpr uint32_t CFG0_PRESCALE_OFFSET   = 0;
   static constexpr uint32_t CFG0_STEP_MASK         = 0xff;
   static constexpr uint32_t CFG0_STEP_OFFSET       = 16;

   [[nodiscard]] constexpr uint32_t cfg0(uint32_t prescale, uint32_t step)
   {
      return ((prescale & CFG0_PRESCALE_MASK) << CFG0_PRESCALE_OFFSET) |
             ((step     & CFG0_STEP_MASK)     << CFG0_STEP_OFFSET);
   }
}

class OpenTitanTimer final : public IHardwareTimer
{
public:
   static constexpr uint64_t TIMER_FREQ_HZ = 10'000;

   /**
    * @brief Bind the driver to a mapped register window
    * @param csr          Base of the rv_timer register window
    * @param base_freq_hz Clock feeding the timer block
    *
    * ASSERTION: base_freq_hz / TIMER_FREQ_HZ - 1 fits the 12-bit prescaler
    */
   OpenTitanTimer(volatile uint32_t* csr, uint64_t base_freq_hz) noexcept;

   void setup() noexcept override;

   /**
    * @brief Read the 64-bit counter
    *
    * The counter is read as two 32-bit halves; the upper half is re-read until
    * it is stable so a carry between the reads is never observed.
    */
   [[nodiscard]] TimePoint now() const noexcept override;

   [[nodiscard]] Duration from_milliseconds(uint32_t ms) const noexcept override;
   [[nodiscard]] Duration from_microseconds(uint32_t us) const noexcept override;

   /**
    * @brief Program compare and enable the timer0 interrupt
    *
    * Follows the RISC-V privileged architecture manual (3.1.15) sequence for a 64-bit
    * compare on a 32-bit bus: low to all-ones, high, then low, so no
    * intermediate value can match early.
    */
   void set_alarm(TimePoint deadline) noexcept override;

   void disarm() noexcept override;

   void ack_interrupt() noexcept override;

   [[nodiscard]] uint32_t prescale() const noexcept { return prescaler; }

private:
   [[nodiscard]] uint32_t read(std::size_t offset) const noexcept;
   void write(std::size_t offset, uint32_t value) noexcept;

   volatile uint32_t* csr;
   uint32_t prescaler;
   bool initialised{false};
};

} // namespace chronomux

#endif // CHRONOMUX_OPENTITAN_TIMER_HPP
