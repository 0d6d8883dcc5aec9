/**
 * @file spinlock.hpp
 * @brief The service lock
 *
 * One Spinlock guards all TimerService state. It is taken both by IPC entry
 * points and by the timer interrupt entry, so every critical section under it
 * must be short and must never block.
 *
 *   SpinlockGuard guard(lock);
 *   manager.cancel(client, id);
 */

#ifndef CHRONOMUX_SPINLOCK_HPP
#define CHRONOMUX_SPINLOCK_HPP

#include <atomic>

namespace chronomux
{

class Spinlock
{
public:
   constexpr Spinlock() = default;

   Spinlock(Spinlock const&)            = delete;
   Spinlock& operator=(Spinlock const&) = delete;

   /**
    * @brief Busy-wait until acquired, relaxing the core between attempts
    */
   void lock() noexcept;
   void unlock() noexcept;

   [[nodiscard]] bool try_lock() noexcept { return !flag.test_and_set(std::memory_order_acquire); }

   /**
    * @brief Racy snapshot, for assertions only
    */
   [[nodiscard]] bool held() const noexcept { return flag.test(std::memory_order_relaxed); }

private:
   std::atomic_flag flag{};
};

class SpinlockGuard
{
public:
   explicit SpinlockGuard(Spinlock& lock) noexcept : lock(lock) { lock.lock(); }
   ~SpinlockGuard() { lock.unlock(); }

   SpinlockGuard(SpinlockGuard const&)            = delete;
   SpinlockGuard& operator=(SpinlockGuard const&) = delete;

private:
   Spinlock& lock;
};

} // namespace chronomux

#endif // CHRONOMUX_SPINLOCK_HPP
