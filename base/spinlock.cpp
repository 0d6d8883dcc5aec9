#include "chronomux/spinlock.hpp"
#include "chronomux/port.h"

namespace chronomux
{

void Spinlock::lock() noexcept
{
   while (flag.test_and_set(std::memory_order_acquire)) {
      // Spin on a plain load so contended waiters do not hammer the cache line
      while (flag.test(std::memory_order_relaxed)) {
         chronomux_port_cpu_relax();
      }
   }
}

void Spinlock::unlock() noexcept
{
   flag.clear(std::memory_order_release);
}

} // namespace chronomux
