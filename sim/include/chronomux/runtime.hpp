/**
 * @file runtime.hpp
 * @brief Simulation runtime: the TimerService and its clients in one process
 *
 * The runtime stands in for the kernel around the service:
 *   - Each client process runs on its own fiber (port context API) and owns
 *     a badge. Its endpoint call blocks the fiber until the service replies.
 *   - Simulated time advances event by event to the programmed comparator
 *     deadline, where the port delivers the timer interrupt to the service.
 *
 * Nothing runs concurrently: the runtime resumes every runnable client until
 * all of them are blocked or finished, then advances time.
 *
 * Example:
 *   sim::Runtime rt;
 *   rt.spawn(0x10, [](TimerClient& timer) {
 *      (void)timer.oneshot(0, 100);
 *      auto done = timer.wait();
 *   });
 *   rt.run_for_ms(150);
 */

#ifndef CHRONOMUX_RUNTIME_HPP
#define CHRONOMUX_RUNTIME_HPP

#include "chronomux/config.hpp"
#include "chronomux/function.hpp"
#include "chronomux/ipc.hpp"
#include "chronomux/port.h"
#include "chronomux/port_timer.hpp"
#include "chronomux/timer_client.hpp"
#include "chronomux/timer_service.hpp"
#include "chronomux/timer_types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace chronomux::sim
{

class Runtime
{
public:
   using Entry = Function<void(TimerClient&), Config::PROCESS_ENTRY_INLINE_SIZE>;

   /**
    * @brief Reset the simulated port to t=0 and start the service on it
    *
    * Only one Runtime may exist at a time; the port is process-global.
    */
   Runtime();
   ~Runtime();

   Runtime(Runtime const&)            = delete;
   Runtime& operator=(Runtime const&) = delete;

   /**
    * @brief Create a client process; it first runs on the next scheduling pass
    * @return Process index, for finished()/blocked()
    */
   std::size_t spawn(Badge badge, Entry entry);

   /**
    * @brief Advance simulated time by `duration`, servicing every interrupt on the way
    */
   void run_for(Duration duration);
   void run_for_ms(uint32_t ms) { run_for(timer.from_milliseconds(ms)); }

   /**
    * @brief Run until no timer is armed and no client can make progress
    * @return false if `limit` elapsed first (e.g. a periodic timer is running)
    */
   bool run_until_quiescent(Duration limit);

   /**
    * @brief Resume runnable clients until all are blocked or finished
    */
   void schedule();

   [[nodiscard]] TimePoint now() const { return timer.now(); }
   [[nodiscard]] uint64_t now_ms() const { return now().value * 1000 / chronomux_port_time_freq_hz(); }

   [[nodiscard]] bool finished(std::size_t process) const;
   [[nodiscard]] bool blocked(std::size_t process) const;
   [[nodiscard]] bool all_finished() const;
   [[nodiscard]] std::size_t process_count() const noexcept { return processes.size(); }

   [[nodiscard]] TimerService&     service()    noexcept { return timer_service; }
   [[nodiscard]] ipc::Dispatcher&  dispatcher() noexcept { return ipc_dispatcher; }
   [[nodiscard]] PortTimer&        hardware()   noexcept { return timer; }

private:
   struct Process;

   /**
    * @brief Endpoint of one client: dispatches in place, parks the fiber on a deferred reply
    */
   class Endpoint final : public IEndpoint
   {
   public:
      explicit Endpoint(Process& process) noexcept : process(process) {}
      ipc::Message call(ipc::Message const& request) override;

   private:
      Process& process;
   };

   struct Process
   {
      Process(Runtime& runtime, Badge badge, Entry&& entry);

      Runtime&     runtime;
      Badge        badge;
      Entry        entry;
      Endpoint     endpoint;
      TimerClient  client;

      ipc::Message reply{};
      bool         has_reply{false};
      bool         waiting_for_reply{false};

      alignas(CHRONOMUX_PORT_CONTEXT_ALIGN) std::array<std::byte, CHRONOMUX_PORT_CONTEXT_SIZE> context_storage{};
      alignas(CHRONOMUX_STACK_ALIGN) std::array<std::byte, Config::CLIENT_STACK_SIZE> stack{};

      chronomux_port_context_t* context() noexcept
      {
         return reinterpret_cast<chronomux_port_context_t*>(context_storage.data());
      }
      chronomux_port_context_t const* context() const noexcept
      {
         return reinterpret_cast<chronomux_port_context_t const*>(context_storage.data());
      }

      [[nodiscard]] bool finished() const noexcept { return chronomux_port_context_finished(context()); }
      [[nodiscard]] bool runnable() const noexcept { return !finished() && !waiting_for_reply; }

      static void entry_trampoline(void* self);
   };

   PortTimer       timer;
   TimerService    timer_service;
   ipc::Dispatcher ipc_dispatcher;

   std::vector<std::unique_ptr<Process>> processes;

   /**
    * @brief Advance to the next comparator deadline if it is not after `end`
    * @return false (time moved to `end`) when no interrupt is due by then
    */
   bool step_until(TimePoint end);
};

} // namespace chronomux::sim

#endif // CHRONOMUX_RUNTIME_HPP
