/**
 * @file test_opentitan_timer.cpp
 * @brief Register-level tests for OpenTitanTimer
 *
 * The register window is a plain array, so the tests check the values the
 * driver leaves behind.
 */

#include "chronomux/opentitan_timer.hpp"

#include <gtest/gtest.h>
#include <array>
#include <cstdint>

using namespace chronomux;
using namespace chronomux::rv_timer;

class OpenTitanTimerTest : public ::testing::Test
{
protected:
   static constexpr uint64_t BASE_CLOCK_HZ = 24'000'000; // 24 MHz => prescale 2399

   std::array<uint32_t, REGISTER_WINDOW_SIZE / sizeof(uint32_t)> regs{};

   uint32_t& reg(std::size_t offset) { return regs[offset / sizeof(uint32_t)]; }

   volatile uint32_t* window() { return regs.data(); }
};

TEST_F(OpenTitanTimerTest, PrescalerDerivedFromBaseClock)
{
   OpenTitanTimer timer(window(), BASE_CLOCK_HZ);
   EXPECT_EQ(timer.prescale(), 2399u);
}

TEST_F(OpenTitanTimerTest, SetupProgramsBlock)
{
   reg(INTR_ENABLE0_REG_OFFSET) = 1;

   OpenTitanTimer timer(window(), BASE_CLOCK_HZ);
   timer.setup();

   EXPECT_EQ(reg(CFG0_REG_OFFSET), cfg0(2399, 1));
   EXPECT_EQ(reg(CFG0_REG_OFFSET) & CFG0_PRESCALE_MASK, 2399u);
   EXPECT_EQ((reg(CFG0_REG_OFFSET) >> CFG0_STEP_OFFSET) & CFG0_STEP_MASK, 1u);
   EXPECT_EQ(reg(COMPARE_LOWER0_0_REG_OFFSET), 0xffffffffu);
   EXPECT_EQ(reg(COMPARE_UPPER0_0_REG_OFFSET), 0xffffffffu);
   EXPECT_EQ(reg(INTR_STATE0_REG_OFFSET), 1u);   // w1c of the timer0 bit
   EXPECT_EQ(reg(INTR_ENABLE0_REG_OFFSET), 0u);
   EXPECT_EQ(reg(CTRL_REG_OFFSET), 1u);
}

TEST_F(OpenTitanTimerTest, NowCombinesBothHalves)
{
   OpenTitanTimer timer(window(), BASE_CLOCK_HZ);
   timer.setup();

   reg(TIMER_V_UPPER0_REG_OFFSET) = 0x1;
   reg(TIMER_V_LOWER0_REG_OFFSET) = 0x2345;
   EXPECT_EQ(timer.now().value, 0x1'0000'2345ull);
}

TEST_F(OpenTitanTimerTest, ConversionsAt10kHz)
{
   OpenTitanTimer timer(window(), BASE_CLOCK_HZ);

   EXPECT_EQ(timer.from_milliseconds(10).value, 100u);
   EXPECT_EQ(timer.from_milliseconds(1).value, 10u);
   EXPECT_EQ(timer.from_microseconds(100).value, 1u);
   EXPECT_EQ(timer.from_microseconds(101).value, 2u);   // rounds up
   EXPECT_EQ(timer.from_microseconds(1).value, 1u);
}

TEST_F(OpenTitanTimerTest, DeadlineAddsToCounter)
{
   OpenTitanTimer timer(window(), BASE_CLOCK_HZ);
   timer.setup();

   reg(TIMER_V_LOWER0_REG_OFFSET) = 1000;
   EXPECT_EQ(timer.deadline(timer.from_milliseconds(5)).value, 1050u);
}

TEST_F(OpenTitanTimerTest, SetAlarmWritesCompareAndEnables)
{
   OpenTitanTimer timer(window(), BASE_CLOCK_HZ);
   timer.setup();

   timer.set_alarm(TimePoint{0x0000'0002'8000'0001ull});

   EXPECT_EQ(reg(COMPARE_UPPER0_0_REG_OFFSET), 0x2u);
   EXPECT_EQ(reg(COMPARE_LOWER0_0_REG_OFFSET), 0x8000'0001u);
   EXPECT_EQ(reg(INTR_ENABLE0_REG_OFFSET), 1u);
}

TEST_F(OpenTitanTimerTest, DisarmParksCompareAtMax)
{
   OpenTitanTimer timer(window(), BASE_CLOCK_HZ);
   timer.setup();
   timer.set_alarm(TimePoint{500});

   timer.disarm();
   EXPECT_EQ(reg(INTR_ENABLE0_REG_OFFSET), 0u);
   EXPECT_EQ(reg(COMPARE_LOWER0_0_REG_OFFSET), 0xffffffffu);
   EXPECT_EQ(reg(COMPARE_UPPER0_0_REG_OFFSET), 0xffffffffu);
}

TEST_F(OpenTitanTimerTest, AckClearsStateAndDisables)
{
   OpenTitanTimer timer(window(), BASE_CLOCK_HZ);
   timer.setup();
   timer.set_alarm(TimePoint{500});

   reg(INTR_STATE0_REG_OFFSET) = 0;
   timer.ack_interrupt();
   EXPECT_EQ(reg(INTR_STATE0_REG_OFFSET), 1u);
   EXPECT_EQ(reg(INTR_ENABLE0_REG_OFFSET), 0u);
}
