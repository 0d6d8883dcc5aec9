/**
 * @file timer_types.hpp
 * @brief Identifiers and status codes shared by the service, IPC and clients
 */

#ifndef CHRONOMUX_TIMER_TYPES_HPP
#define CHRONOMUX_TIMER_TYPES_HPP

#include "chronomux/config.hpp"
#include "chronomux/function.hpp"

#include <cstdint>

namespace chronomux
{

using Badge     = uint64_t; // Kernel-assigned endpoint badge, 0 is never a client
using ClientId  = uint32_t; // Service-assigned slot, 0 .. Config::MAX_CLIENTS-1
using TimerId   = uint32_t; // Per-client, 0 .. Config::TIMERS_PER_CLIENT-1
using TimerMask = uint32_t; // Bit i set: TimerId i completed and not yet collected

static constexpr TimerId TIMERS_PER_CLIENT = Config::TIMERS_PER_CLIENT;

/**
 * @brief Status of every TimerService operation
 *
 * The ordinals are carried across the IPC boundary and must not change.
 */
enum class TimerServiceError : uint32_t
{
   Success            = 0,
   NoSuchTimer        = 1,
   TimerAlreadyExists = 2,
   InvalidTimerId     = 3,
   InvalidDuration    = 4,
   NoSuchClient       = 5,
   TooManyClients     = 6,
   WaitAlreadyPending = 7,
   DeserializeFailed  = 8,
   SerializeFailed    = 9,
   UnknownError       = 10,
};

static constexpr uint32_t TIMER_SERVICE_ERROR_COUNT = 11;

[[nodiscard]] constexpr const char* to_string(TimerServiceError error) noexcept
{
   switch (error) {
      case TimerServiceError::Success:            return "Success";
      case TimerServiceError::NoSuchTimer:        return "NoSuchTimer";
      case TimerServiceError::TimerAlreadyExists: return "TimerAlreadyExists";
      case TimerServiceError::InvalidTimerId:     return "InvalidTimerId";
      case TimerServiceError::InvalidDuration:    return "InvalidDuration";
      case TimerServiceError::NoSuchClient:       return "NoSuchClient";
      case TimerServiceError::TooManyClients:     return "TooManyClients";
      case TimerServiceError::WaitAlreadyPending: return "WaitAlreadyPending";
      case TimerServiceError::DeserializeFailed:  return "DeserializeFailed";
      case TimerServiceError::SerializeFailed:    return "SerializeFailed";
      case TimerServiceError::UnknownError:       return "UnknownError";
   }
   return "???";
}

/**
 * @brief Result of a completed-timers query: status plus the collected mask
 */
struct CompletedTimers
{
   TimerServiceError error{TimerServiceError::Success};
   TimerMask mask{0};

   [[nodiscard]] constexpr bool ok() const noexcept { return error == TimerServiceError::Success; }
};

/**
 * @brief Continuation for a deferred wait
 *
 * Invoked exactly once, with Success and the collected (now cleared) mask
 * when a completion is available, or with an error if the wait was refused.
 * It runs inside the service critical section and must not block.
 */
using Waiter = Function<void(TimerServiceError, TimerMask), Config::WAITER_INLINE_SIZE>;

} // namespace chronomux

#endif // CHRONOMUX_TIMER_TYPES_HPP
