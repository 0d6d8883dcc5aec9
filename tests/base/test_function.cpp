/**
 * @file test_function.cpp
 * @brief Unit tests for chronomux::Function
 *
 * Exercised the way the service uses it: parked waiters that are detached,
 * replaced or dropped, and reply continuations nested inside a waiter.
 */

#include "chronomux/function.hpp"
#include "chronomux/timer_types.hpp"

#include <gtest/gtest.h>
#include <utility>

using namespace chronomux;

namespace
{
   // Counts live copies so tests can see exactly when the stored callable dies
   struct Tracked
   {
      int* alive;
      int* calls;

      Tracked(int* alive, int* calls) noexcept : alive(alive), calls(calls) { ++*alive; }
      Tracked(Tracked const& other) noexcept : alive(other.alive), calls(other.calls) { ++*alive; }
      Tracked(Tracked&& other) noexcept : alive(other.alive), calls(other.calls) { ++*alive; }
      ~Tracked() { --*alive; }

      void operator()(TimerServiceError, TimerMask) const { ++*calls; }
   };
}

class FunctionTest : public ::testing::Test
{
protected:
   int alive{0};
   int calls{0};
};

/* ============================================================================
 * Storage
 * ========================================================================= */

TEST_F(FunctionTest, EmptyUntilAssigned)
{
   Waiter waiter;
   EXPECT_FALSE(waiter);

   Waiter from_null(nullptr);
   EXPECT_FALSE(from_null);

   waiter = Waiter{Tracked{&alive, &calls}};
   EXPECT_TRUE(waiter);
   EXPECT_EQ(alive, 1);
}

TEST_F(FunctionTest, ResetDestroysWithoutInvoking)
{
   Waiter waiter{Tracked{&alive, &calls}};
   ASSERT_EQ(alive, 1);

   waiter = nullptr;
   EXPECT_FALSE(waiter);
   EXPECT_EQ(alive, 0);
   EXPECT_EQ(calls, 0);

   waiter.reset();
   EXPECT_EQ(alive, 0);
}

TEST_F(FunctionTest, ScopeExitDestroysStoredCallable)
{
   {
      Waiter waiter{Tracked{&alive, &calls}};
      EXPECT_EQ(alive, 1);
   }
   EXPECT_EQ(alive, 0);
}

TEST_F(FunctionTest, EmplaceReplacesPreviousCallable)
{
   int first = 0;
   int second = 0;

   Function<void(), 16> ack([&first] { first++; });
   ack();
   ack.emplace([&second] { second++; });
   ack();

   EXPECT_EQ(first, 1);
   EXPECT_EQ(second, 1);
}

/* ============================================================================
 * Moves
 * ========================================================================= */

TEST_F(FunctionTest, DetachLeavesSlotEmpty)
{
   Waiter slot{Tracked{&alive, &calls}};

   Waiter detached = std::move(slot);
   EXPECT_FALSE(slot);
   EXPECT_TRUE(detached);
   EXPECT_EQ(alive, 1);

   detached(TimerServiceError::Success, 1);
   EXPECT_EQ(calls, 1);
}

TEST_F(FunctionTest, MoveAssignOverLiveCallable)
{
   int other_calls = 0;
   Waiter a{Tracked{&alive, &calls}};
   Waiter b{[&other_calls](TimerServiceError, TimerMask) { other_calls++; }};

   b = std::move(a);
   EXPECT_FALSE(a);
   EXPECT_EQ(alive, 1);

   b(TimerServiceError::Success, 0);
   EXPECT_EQ(calls, 1);
   EXPECT_EQ(other_calls, 0);
}

TEST_F(FunctionTest, SelfMoveAssignmentKeepsCallable)
{
   Waiter waiter{Tracked{&alive, &calls}};

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wpragmas"
#pragma GCC diagnostic ignored "-Wself-move"
   waiter = std::move(waiter);
#pragma GCC diagnostic pop

   ASSERT_TRUE(waiter);
   waiter(TimerServiceError::Success, 0);
   EXPECT_EQ(calls, 1);
   EXPECT_EQ(alive, 1);
}

/* ============================================================================
 * Invocation
 * ========================================================================= */

TEST_F(FunctionTest, WaiterReceivesStatusAndMask)
{
   TimerServiceError seen_error = TimerServiceError::UnknownError;
   TimerMask seen_mask = 0;

   Waiter waiter([&](TimerServiceError error, TimerMask mask) {
      seen_error = error;
      seen_mask  = mask;
   });

   waiter(TimerServiceError::WaitAlreadyPending, 0b101);
   EXPECT_EQ(seen_error, TimerServiceError::WaitAlreadyPending);
   EXPECT_EQ(seen_mask, 0b101u);
}

TEST_F(FunctionTest, MutableCaptureAccumulates)
{
   TimerMask total = 0;
   Function<TimerMask(TimerMask)> collect([acc = TimerMask{0}](TimerMask m) mutable { return acc |= m; });

   total = collect(0b001);
   total = collect(0b100);
   EXPECT_EQ(total, 0b101u);
}

TEST_F(FunctionTest, ReplyNestedInsideWaiter)
{
   int replies = 0;
   TimerMask last = 0;
   Function<void(TimerMask), 32> reply([&replies, &last](TimerMask m) { replies++; last = m; });

   Waiter waiter([reply = std::move(reply)](TimerServiceError, TimerMask mask) { reply(mask); });
   EXPECT_FALSE(reply);

   Waiter parked = std::move(waiter);
   parked(TimerServiceError::Success, 0x80u);
   EXPECT_EQ(replies, 1);
   EXPECT_EQ(last, 0x80u);
}

TEST_F(FunctionTest, InvokedCallableMayRefillItsSlot)
{
   // wake path: detach, invoke, and the continuation parks a new waiter
   Waiter slot;
   int rounds = 0;

   slot = Waiter{[&slot, &rounds](TimerServiceError, TimerMask) {
      rounds++;
      slot = Waiter{[&rounds](TimerServiceError, TimerMask) { rounds += 10; }};
   }};

   Waiter first = std::move(slot);
   first(TimerServiceError::Success, 1);
   ASSERT_TRUE(slot);

   Waiter second = std::move(slot);
   second(TimerServiceError::Success, 1);
   EXPECT_EQ(rounds, 11);
   EXPECT_FALSE(slot);
}

TEST_F(FunctionTest, InlineSizesFitServiceCallables)
{
   static_assert(Waiter::inline_size == Config::WAITER_INLINE_SIZE);
   static_assert(sizeof(Function<void(TimerMask), 32>) <= Waiter::inline_size,
                 "A reply continuation must fit inside a waiter");
   SUCCEED();
}
