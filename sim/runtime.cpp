#include "chronomux/runtime.hpp"
#include "chronomux/panic.hpp"

#include <cassert>
#include <limits>
#include <utility>

#include "DEBUG_PRINT.hpp"

namespace chronomux::sim
{

static constexpr uint64_t NOTHING_ARMED = std::numeric_limits<uint64_t>::max();

/* ============================================================================
 * Processes
 * ========================================================================= */

Runtime::Process::Process(Runtime& runtime, Badge badge, Entry&& entry)
   : runtime(runtime)
   , badge(badge)
   , entry(std::move(entry))
   , endpoint(*this)
   , client(endpoint)
{
   chronomux_port_context_init(context(), stack.data(), stack.size(), &Process::entry_trampoline, this);
}

void Runtime::Process::entry_trampoline(void* self)
{
   auto* process = static_cast<Process*>(self);
   LOG_CLIENT("badge 0x%llx started", static_cast<unsigned long long>(process->badge));
   process->entry(process->client);
   LOG_CLIENT("badge 0x%llx finished", static_cast<unsigned long long>(process->badge));
}

ipc::Message Runtime::Endpoint::call(ipc::Message const& request)
{
   process.has_reply = false;

   Process* caller = &process;
   process.runtime.ipc_dispatcher.dispatch(process.badge, request, [caller](ipc::Message const& reply) {
      caller->reply             = reply;
      caller->has_reply         = true;
      caller->waiting_for_reply = false;
   });

   if (!process.has_reply) {
      // Deferred reply: park until the service answers from its interrupt entry
      assert(chronomux_port_in_context() && "Blocking endpoint call outside of a client process");
      process.waiting_for_reply = true;
      LOG_CLIENT("badge 0x%llx blocked on reply", static_cast<unsigned long long>(process.badge));
      while (!process.has_reply) {
         chronomux_port_yield();
      }
   }

   process.has_reply = false;
   return process.reply;
}

/* ============================================================================
 * Runtime
 * ========================================================================= */

Runtime::Runtime()
   : timer_service(timer, TimerService::IrqAck{[] { chronomux_port_irq_ack(); }})
   , ipc_dispatcher(timer_service)
{
   chronomux_port_init();
   chronomux_port_time_reset(0);
   chronomux_port_time_register_isr_handler(&TimerService::isr_trampoline, &timer_service);
   LOG_SIM("runtime started");
}

Runtime::~Runtime()
{
   // Unwind clients still parked in a call before the service goes away
   for (auto& process : processes) {
      chronomux_port_context_destroy(process->context());
   }
   processes.clear();
   chronomux_port_time_reset(0);
}

std::size_t Runtime::spawn(Badge badge, Entry entry)
{
   processes.push_back(std::make_unique<Process>(*this, badge, std::move(entry)));
   LOG_SIM("spawned badge 0x%llx as process %zu", static_cast<unsigned long long>(badge), processes.size() - 1);
   return processes.size() - 1;
}

void Runtime::schedule()
{
   bool progressed = true;
   while (progressed) {
      progressed = false;
      // Index loop: a client may spawn another client
      for (std::size_t i = 0; i < processes.size(); ++i) {
         Process& process = *processes[i];
         if (!process.runnable()) continue;
         chronomux_port_resume(process.context());
         progressed = true;
      }
   }
}

bool Runtime::step_until(TimePoint end)
{
   TimePoint const now   = timer.now();
   uint64_t const  armed = chronomux_port_time_armed_deadline();

   if (armed == NOTHING_ARMED || armed > end.value) {
      if (end > now) chronomux_port_time_advance((end - now).value);
      return false;
   }

   uint64_t const irqs_before = chronomux_port_time_irq_count();
   chronomux_port_time_advance(armed > now.value ? armed - now.value : 0);
   CHRONOMUX_INVARIANT(chronomux_port_time_irq_count() != irqs_before,
                       "comparator armed for %llu but no interrupt was delivered",
                       static_cast<unsigned long long>(armed));
   return true;
}

void Runtime::run_for(Duration duration)
{
   TimePoint const end = timer.now() + duration;
   LOG_SIM("run until %llu", static_cast<unsigned long long>(end.value));

   schedule();
   while (step_until(end)) {
      schedule();
   }
   schedule();
}

bool Runtime::run_until_quiescent(Duration limit)
{
   TimePoint const end = timer.now() + limit;

   schedule();
   while (chronomux_port_time_armed_deadline() != NOTHING_ARMED) {
      if (!step_until(end)) {
         schedule();
         return false;
      }
      schedule();
   }
   return true;
}

bool Runtime::finished(std::size_t process) const
{
   assert(process < processes.size());
   return processes[process]->finished();
}

bool Runtime::blocked(std::size_t process) const
{
   assert(process < processes.size());
   return processes[process]->waiting_for_reply;
}

bool Runtime::all_finished() const
{
   for (auto const& process : processes) {
      if (!process->finished()) return false;
   }
   return true;
}

} // namespace chronomux::sim
