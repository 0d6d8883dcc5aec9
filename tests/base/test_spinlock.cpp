/**
 * @file test_spinlock.cpp
 * @brief Unit tests for chronomux::Spinlock
 */

#include "chronomux/spinlock.hpp"

#include <gtest/gtest.h>
#include <thread>
#include <vector>

using namespace chronomux;

TEST(SpinlockTest, TryLockFailsWhileHeld)
{
   Spinlock lock;

   EXPECT_FALSE(lock.held());
   EXPECT_TRUE(lock.try_lock());
   EXPECT_TRUE(lock.held());
   EXPECT_FALSE(lock.try_lock());

   lock.unlock();
   EXPECT_FALSE(lock.held());
   EXPECT_TRUE(lock.try_lock());
   lock.unlock();
}

TEST(SpinlockTest, GuardReleasesOnScopeExit)
{
   Spinlock lock;
   {
      SpinlockGuard guard(lock);
      EXPECT_TRUE(lock.held());
   }
   EXPECT_FALSE(lock.held());
}

TEST(SpinlockTest, MutualExclusionUnderContention)
{
   constexpr int THREADS    = 4;
   constexpr int ITERATIONS = 20000;

   Spinlock lock;
   long counter = 0; // deliberately non-atomic

   std::vector<std::thread> threads;
   for (int t = 0; t < THREADS; ++t) {
      threads.emplace_back([&] {
         for (int i = 0; i < ITERATIONS; ++i) {
            SpinlockGuard guard(lock);
            ++counter;
         }
      });
   }
   for (auto& thread : threads) thread.join();

   EXPECT_EQ(counter, static_cast<long>(THREADS) * ITERATIONS);
}
