/**
 * @file timer_client.hpp
 * @brief Client-side TimerService library
 *
 * Wraps the message-register protocol in typed calls. The endpoint decides
 * what a call means: on the target it is a kernel IPC call on the badged
 * capability, in simulation it blocks the calling fiber until the service
 * replies.
 *
 * Example:
 *   TimerClient timer(endpoint);
 *   timer.periodic(1, 50);
 *   auto done = timer.wait();   // done.mask has bit 1 set
 */

#ifndef CHRONOMUX_TIMER_CLIENT_HPP
#define CHRONOMUX_TIMER_CLIENT_HPP

#include "chronomux/ipc.hpp"
#include "chronomux/timer_types.hpp"

#include <cstdint>

namespace chronomux
{

/**
 * @brief A channel to the TimerService
 */
class IEndpoint
{
public:
   virtual ~IEndpoint() = default;

   /**
    * @brief Send a request and return the service's reply
    */
   virtual ipc::Message call(ipc::Message const& request) = 0;
};

class TimerClient
{
public:
   explicit TimerClient(IEndpoint& endpoint) noexcept : endpoint(endpoint) {}

   /**
    * @brief Start one-shot timer `id`, firing `duration_ms` from now
    */
   [[nodiscard]] TimerServiceError oneshot(TimerId id, uint32_t duration_ms);

   /**
    * @brief Start periodic timer `id`, firing every `period_ms` until cancelled
    */
   [[nodiscard]] TimerServiceError periodic(TimerId id, uint32_t period_ms);

   [[nodiscard]] TimerServiceError cancel(TimerId id);

   /**
    * @brief Collect (and clear) the completed timers
    */
   [[nodiscard]] CompletedTimers completed_timers();

   /**
    * @brief Block until at least one timer completed, then collect
    */
   [[nodiscard]] CompletedTimers wait();

   /**
    * @brief Non-blocking collect
    */
   [[nodiscard]] CompletedTimers poll() { return completed_timers(); }

   [[nodiscard]] TimerServiceError capscan();

private:
   IEndpoint& endpoint;

   CompletedTimers request(ipc::Request const& request);
};

} // namespace chronomux

#endif // CHRONOMUX_TIMER_CLIENT_HPP
