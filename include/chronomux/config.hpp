/**
 * chronomux compile-time configuration
 *
 * All tables in the service are statically sized from these constants, there
 * is no heap allocation on the timer paths.
*/
#ifndef CHRONOMUX_CONFIG_HPP
#define CHRONOMUX_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <limits>

namespace chronomux
{
   struct Config
   {
      // Number of client protection domains the service can multiplex.
      static constexpr uint32_t MAX_CLIENTS       = 4;
      // Virtual timers per client. One completion bit per timer, so bounded by the mask width.
      static constexpr uint32_t TIMERS_PER_CLIENT = 32;
      static constexpr uint32_t MAX_TIMERS        = MAX_CLIENTS * TIMERS_PER_CLIENT;

      // Inline storage for a parked wait continuation (must hold a captured reply callable).
      static constexpr std::size_t WAITER_INLINE_SIZE = 64;
      static constexpr std::size_t REPLY_INLINE_SIZE  = 32;

      // Simulation only: stack given to each client fiber, and the inline size of its entry callable.
      static constexpr std::size_t CLIENT_STACK_SIZE         = 64 * 1024;
      static constexpr std::size_t PROCESS_ENTRY_INLINE_SIZE = 64;

      static_assert(MAX_CLIENTS > 0, "Unsupported configuration");
      static_assert(TIMERS_PER_CLIENT > 0 && TIMERS_PER_CLIENT <= std::numeric_limits<uint32_t>::digits,
                    "TIMERS_PER_CLIENT must fit in the 32-bit completion mask");
      static_assert(MAX_TIMERS < std::numeric_limits<uint16_t>::max(), "Deadline index uses 16-bit positions");
   };
}

#endif
