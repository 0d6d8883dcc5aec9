/**
 * @file test_port_timer.cpp
 * @brief Unit tests for PortTimer over the Linux simulation port
 *
 * Port time only moves through chronomux_port_time_advance(), which makes
 * every expectation here exact. One port tick is 1us.
 */

#include "chronomux/port_timer.hpp"
#include "chronomux/port.h"

#include <gtest/gtest.h>

using namespace chronomux;

class PortTimerTest : public ::testing::Test
{
protected:
   PortTimer timer;

   void SetUp() override
   {
      chronomux_port_time_reset(0);
      timer.setup();
   }

   void TearDown() override
   {
      chronomux_port_time_reset(0);
   }
};

TEST_F(PortTimerTest, NowReflectsPortTime)
{
   EXPECT_TRUE(timer.is_setup());
   EXPECT_EQ(timer.now().value, 0u);

   chronomux_port_time_advance(250);
   EXPECT_EQ(timer.now().value, 250u);
}

TEST_F(PortTimerTest, ConversionsUsePortFrequency)
{
   EXPECT_EQ(timer.from_milliseconds(0).value, 0u);
   EXPECT_EQ(timer.from_milliseconds(1).value, 1000u);
   EXPECT_EQ(timer.from_milliseconds(50).value, 50'000u);
   EXPECT_EQ(timer.from_microseconds(7).value, 7u);
}

TEST_F(PortTimerTest, DeadlineIsRelativeToNow)
{
   chronomux_port_time_advance(1000);
   EXPECT_EQ(timer.deadline(Duration{500}).value, 1500u);
   EXPECT_EQ(timer.deadline(timer.from_milliseconds(2)).value, 3000u);
}

TEST_F(PortTimerTest, SetAlarmArmsAndEnables)
{
   EXPECT_EQ(chronomux_port_time_armed_deadline(), UINT64_MAX);

   timer.set_alarm(TimePoint{4000});
   EXPECT_TRUE(chronomux_port_time_irq_enabled());
   EXPECT_EQ(chronomux_port_time_armed_deadline(), 4000u);

   // Replaces the previous deadline
   timer.set_alarm(TimePoint{2000});
   EXPECT_EQ(chronomux_port_time_armed_deadline(), 2000u);
}

TEST_F(PortTimerTest, DisarmAndAckDisableTheInterrupt)
{
   timer.set_alarm(TimePoint{10});
   timer.disarm();
   EXPECT_FALSE(chronomux_port_time_irq_enabled());
   EXPECT_EQ(chronomux_port_time_armed_deadline(), UINT64_MAX);

   timer.set_alarm(TimePoint{20});
   timer.ack_interrupt();
   EXPECT_FALSE(chronomux_port_time_irq_enabled());
}

TEST_F(PortTimerTest, SetupIsIdempotent)
{
   timer.set_alarm(TimePoint{10});
   chronomux_port_time_advance(3);

   timer.setup();
   EXPECT_FALSE(chronomux_port_time_irq_enabled());
   EXPECT_EQ(timer.now().value, 3u);
}
