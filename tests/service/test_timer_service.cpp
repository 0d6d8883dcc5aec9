/**
 * @file test_timer_service.cpp
 * @brief TimerService entry points: badge handling, deferred waits, interrupt entry
 */

#include "chronomux/timer_service.hpp"
#include "service/mock_hardware_timer.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <bit>
#include <thread>
#include <vector>

using namespace chronomux;
using chronomux::test::MockHardwareTimer;

class TimerServiceTest : public ::testing::Test
{
protected:
   MockHardwareTimer hw;
   int irq_acks{0};
   TimerService service{hw, TimerService::IrqAck{[this] { irq_acks++; }}};

   static constexpr Badge SHELL = 0x51;
   static constexpr Badge ML    = 0x52;

   void interrupt_at(uint64_t t)
   {
      hw.set_now(t);
      if (hw.due()) service.timer_interrupt_handle();
   }

   uint32_t connected() const
   {
      return service.inspect([](TimerManager const&, ClientRegistry const& registry) {
         return registry.connected();
      });
   }

   TimerMask pending(Badge badge)
   {
      return service.inspect([badge](TimerManager const& manager, ClientRegistry const& registry) {
         auto client = registry.lookup(badge);
         return client ? manager.pending_mask(*client) : TimerMask{0};
      });
   }
};

TEST_F(TimerServiceTest, DurationsAreConvertedFromMilliseconds)
{
   ASSERT_EQ(service.timer_oneshot(SHELL, 0, 250), TimerServiceError::Success);
   EXPECT_EQ(hw.alarm.value, 250u);
}

TEST_F(TimerServiceTest, UnknownBadgeConnectsOnFirstRequest)
{
   EXPECT_EQ(service.timer_oneshot(SHELL, 0, 10), TimerServiceError::Success);
   EXPECT_EQ(connected(), 1u);
}

TEST_F(TimerServiceTest, ReadOnlyRequestsDoNotTakeASlot)
{
   auto polled = service.timer_completed_timers(SHELL);
   EXPECT_EQ(polled.error, TimerServiceError::Success);
   EXPECT_EQ(polled.mask, 0u);
   EXPECT_EQ(service.timer_cancel(SHELL, 3), TimerServiceError::NoSuchTimer);
   EXPECT_EQ(service.timer_cancel(SHELL, TIMERS_PER_CLIENT), TimerServiceError::InvalidTimerId);
   EXPECT_EQ(service.timer_capscan(SHELL), TimerServiceError::Success);
   EXPECT_EQ(connected(), 0u);
}

TEST_F(TimerServiceTest, StrayPollerCannotLockOutClients)
{
   for (Badge b = 1; b < Config::MAX_CLIENTS; ++b) {
      ASSERT_EQ(service.timer_oneshot(b, 0, 100), TimerServiceError::Success);
   }

   Badge const poller = 0x99;
   EXPECT_EQ(service.timer_completed_timers(poller).mask, 0u);

   // The last slot is still free for a client that arms a timer
   EXPECT_EQ(service.timer_periodic(ML, 1, 10), TimerServiceError::Success);
   EXPECT_EQ(connected(), Config::MAX_CLIENTS);
}

TEST_F(TimerServiceTest, InvalidBadgeIsRefused)
{
   EXPECT_EQ(service.timer_oneshot(0, 0, 10), TimerServiceError::NoSuchClient);
   EXPECT_EQ(service.timer_completed_timers(0).error, TimerServiceError::NoSuchClient);
   EXPECT_EQ(service.timer_cancel(0, 0), TimerServiceError::NoSuchClient);
   EXPECT_EQ(service.timer_capscan(0), TimerServiceError::NoSuchClient);
}

TEST_F(TimerServiceTest, TooManyClients)
{
   for (Badge b = 1; b <= Config::MAX_CLIENTS; ++b) {
      ASSERT_EQ(service.timer_oneshot(b, 0, 100), TimerServiceError::Success);
   }

   Badge const extra = Config::MAX_CLIENTS + 1;
   EXPECT_EQ(service.timer_oneshot(extra, 0, 100), TimerServiceError::TooManyClients);
   EXPECT_EQ(service.timer_periodic(extra, 0, 100), TimerServiceError::TooManyClients);

   // A disconnect makes room
   service.timer_disconnect(1);
   EXPECT_EQ(service.timer_oneshot(extra, 0, 100), TimerServiceError::Success);
}

TEST_F(TimerServiceTest, InterruptFiresAndAcknowledges)
{
   ASSERT_EQ(service.timer_oneshot(SHELL, 4, 20), TimerServiceError::Success);

   interrupt_at(20);
   EXPECT_EQ(irq_acks, 1);
   EXPECT_EQ(service.interrupts_handled(), 1u);

   auto done = service.timer_completed_timers(SHELL);
   EXPECT_TRUE(done.ok());
   EXPECT_EQ(done.mask, 1u << 4);
}

TEST_F(TimerServiceTest, WaitIsDeferredUntilFire)
{
   ASSERT_EQ(service.timer_periodic(ML, 1, 10), TimerServiceError::Success);

   int calls = 0;
   TimerMask seen = 0;
   EXPECT_EQ(service.timer_wait(ML, Waiter{[&](TimerServiceError error, TimerMask mask) {
      EXPECT_EQ(error, TimerServiceError::Success);
      calls++;
      seen = mask;
   }}), TimerServiceError::Success);
   EXPECT_EQ(calls, 0);

   interrupt_at(10);
   EXPECT_EQ(calls, 1);
   EXPECT_EQ(seen, 1u << 1);
   EXPECT_EQ(pending(ML), 0u);
}

TEST_F(TimerServiceTest, RefusedWaitStillReplies)
{
   int calls = 0;
   TimerServiceError last = TimerServiceError::Success;
   auto make_waiter = [&] {
      return Waiter{[&](TimerServiceError error, TimerMask) { calls++; last = error; }};
   };

   ASSERT_EQ(service.timer_wait(SHELL, make_waiter()), TimerServiceError::Success);
   EXPECT_EQ(service.timer_wait(SHELL, make_waiter()), TimerServiceError::WaitAlreadyPending);
   EXPECT_EQ(calls, 1);
   EXPECT_EQ(last, TimerServiceError::WaitAlreadyPending);

   EXPECT_EQ(service.timer_wait(0, make_waiter()), TimerServiceError::NoSuchClient);
   EXPECT_EQ(calls, 2);
   EXPECT_EQ(last, TimerServiceError::NoSuchClient);
}

TEST_F(TimerServiceTest, DisconnectReleasesTimers)
{
   ASSERT_EQ(service.timer_oneshot(SHELL, 0, 10), TimerServiceError::Success);
   ASSERT_EQ(service.timer_oneshot(ML, 0, 30), TimerServiceError::Success);

   service.timer_disconnect(SHELL);
   EXPECT_EQ(hw.alarm.value, 30u);

   // Reconnecting starts from a clean table
   EXPECT_EQ(service.timer_cancel(SHELL, 0), TimerServiceError::NoSuchTimer);
}

TEST_F(TimerServiceTest, CapscanSucceedsForConnectedClient)
{
   ASSERT_EQ(service.timer_periodic(SHELL, 3, 100), TimerServiceError::Success);
   EXPECT_EQ(service.timer_capscan(SHELL), TimerServiceError::Success);
}

TEST_F(TimerServiceTest, CancelRacingInterruptIsLinearized)
{
   // Fire first: cancel reports NoSuchTimer, the completion survives
   ASSERT_EQ(service.timer_oneshot(SHELL, 2, 10), TimerServiceError::Success);
   interrupt_at(10);
   EXPECT_EQ(service.timer_cancel(SHELL, 2), TimerServiceError::NoSuchTimer);
   EXPECT_EQ(pending(SHELL), 1u << 2);

   // Cancel first: the interrupt finds nothing to fire
   ASSERT_EQ(service.timer_oneshot(SHELL, 3, 10), TimerServiceError::Success);
   EXPECT_EQ(service.timer_cancel(SHELL, 3), TimerServiceError::Success);
   hw.set_now(20);
   service.timer_interrupt_handle();
   EXPECT_EQ(pending(SHELL), 1u << 2);
}

/* ============================================================================
 * Concurrency
 * ========================================================================= */

TEST_F(TimerServiceTest, ClientsAndInterruptsFromSeparateThreads)
{
   constexpr int ROUNDS = 2000;

   std::atomic<bool> stop{false};
   std::atomic<uint64_t> collected{0};

   // Interrupt source: keeps moving time and servicing the comparator
   std::thread isr([&] {
      while (!stop.load()) {
         hw.advance(1);
         service.timer_interrupt_handle();
      }
   });

   std::vector<std::thread> clients;
   for (Badge badge = 1; badge <= Config::MAX_CLIENTS; ++badge) {
      clients.emplace_back([&, badge] {
         for (int i = 0; i < ROUNDS; ++i) {
            TimerId const id = static_cast<TimerId>(i % TIMERS_PER_CLIENT);
            auto add = service.timer_oneshot(badge, id, 1 + (i % 3));
            EXPECT_TRUE(add == TimerServiceError::Success || add == TimerServiceError::TimerAlreadyExists);

            if (i % 4 == 0) {
               auto cancel = service.timer_cancel(badge, id);
               EXPECT_TRUE(cancel == TimerServiceError::Success || cancel == TimerServiceError::NoSuchTimer);
            }

            auto done = service.timer_completed_timers(badge);
            EXPECT_TRUE(done.ok());
            collected.fetch_add(static_cast<uint64_t>(std::popcount(done.mask)));
         }
      });
   }

   for (auto& t : clients) t.join();
   stop.store(true);
   isr.join();

   // Every structure is still consistent
   service.inspect([](TimerManager const& manager, ClientRegistry const& registry) {
      EXPECT_EQ(registry.connected(), Config::MAX_CLIENTS);
      std::size_t outstanding = 0;
      for (ClientId c = 0; c < Config::MAX_CLIENTS; ++c) {
         outstanding += static_cast<std::size_t>(std::popcount(manager.outstanding(c)));
      }
      EXPECT_EQ(outstanding, manager.size());
      EXPECT_EQ(manager.size() > 0, manager.armed_deadline().has_value());
   });

   // Drain: every timer still outstanding is due after this
   hw.advance(10);
   service.timer_interrupt_handle();
   for (Badge badge = 1; badge <= Config::MAX_CLIENTS; ++badge) {
      collected.fetch_add(static_cast<uint64_t>(std::popcount(service.timer_completed_timers(badge).mask)));
   }

   service.inspect([](TimerManager const& manager, ClientRegistry const&) {
      EXPECT_EQ(manager.size(), 0u);
      EXPECT_FALSE(manager.armed_deadline().has_value());
   });
   // The last round of every client is never cancelled
   EXPECT_GT(collected.load(), 0u);
}
