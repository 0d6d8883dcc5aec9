#include "chronomux/timer_service.hpp"

#include <cassert>
#include <utility>

#include "DEBUG_PRINT.hpp"

namespace chronomux
{

TimerService::TimerService(IHardwareTimer& hw, IrqAck irq_ack)
   : manager(hw)
   , irq_ack(std::move(irq_ack))
{
}

std::optional<ClientId> TimerService::client_for(Badge badge) noexcept
{
   assert(lock.held() && "Client lookup outside the service lock");
   return registry.connect(badge);
}

TimerServiceError TimerService::refusal(Badge badge) noexcept
{
   return badge == ClientRegistry::INVALID_BADGE ? TimerServiceError::NoSuchClient
                                                 : TimerServiceError::TooManyClients;
}

/* ============================================================================
 * Client Requests
 * ========================================================================= */

TimerServiceError TimerService::timer_oneshot(Badge badge, TimerId id, uint32_t duration_ms)
{
   SpinlockGuard guard(lock);

   auto client = client_for(badge);
   if (!client) return refusal(badge);

   return manager.add_oneshot(*client, id, manager.hardware().from_milliseconds(duration_ms));
}

TimerServiceError TimerService::timer_periodic(Badge badge, TimerId id, uint32_t duration_ms)
{
   SpinlockGuard guard(lock);

   auto client = client_for(badge);
   if (!client) return refusal(badge);

   return manager.add_periodic(*client, id, manager.hardware().from_milliseconds(duration_ms));
}

TimerServiceError TimerService::timer_cancel(Badge badge, TimerId id)
{
   SpinlockGuard guard(lock);

   if (badge == ClientRegistry::INVALID_BADGE) return TimerServiceError::NoSuchClient;

   // A badge that never armed anything has nothing to cancel
   auto client = registry.lookup(badge);
   if (!client) {
      return id < Config::TIMERS_PER_CLIENT ? TimerServiceError::NoSuchTimer : TimerServiceError::InvalidTimerId;
   }

   return manager.cancel(*client, id);
}

CompletedTimers TimerService::timer_completed_timers(Badge badge)
{
   SpinlockGuard guard(lock);

   if (badge == ClientRegistry::INVALID_BADGE) return {TimerServiceError::NoSuchClient, 0};

   auto client = registry.lookup(badge);
   if (!client) return {TimerServiceError::Success, 0};

   return manager.completed_timers(*client);
}

TimerServiceError TimerService::timer_wait(Badge badge, Waiter&& waiter)
{
   SpinlockGuard guard(lock);

   TimerServiceError result = refusal(badge);
   if (auto client = client_for(badge)) {
      result = manager.wait(*client, std::move(waiter));
   }

   // The manager only consumes the waiter on success
   if (result != TimerServiceError::Success) {
      LOG_TIMER("badge 0x%llx: wait refused (%s)", static_cast<unsigned long long>(badge), to_string(result));
      waiter(result, 0);
   }
   return result;
}

TimerServiceError TimerService::timer_capscan(Badge badge)
{
   SpinlockGuard guard(lock);

   if (badge == ClientRegistry::INVALID_BADGE) return TimerServiceError::NoSuchClient;

   if (auto client = registry.lookup(badge)) {
      LOG_TIMER("capscan: client %u, %u client(s) connected, %zu timer(s) outstanding",
                *client, registry.connected(), manager.size());
   } else {
      LOG_TIMER("capscan: badge 0x%llx not connected, %u client(s) connected, %zu timer(s) outstanding",
                static_cast<unsigned long long>(badge), registry.connected(), manager.size());
   }
   if (auto armed = manager.armed_deadline()) {
      LOG_TIMER("capscan: comparator armed for %llu", static_cast<unsigned long long>(armed->value));
   } else {
      LOG_TIMER("capscan: comparator disarmed");
   }
   manager.for_each_timer([]([[maybe_unused]] VirtualTimer const& timer) {
      LOG_TIMER("capscan:   client %u timer %2u %-8s deadline=%llu period=%llu expirations=%llu",
                timer.client, timer.id, timer.periodic ? "periodic" : "oneshot",
                static_cast<unsigned long long>(timer.deadline.value),
                static_cast<unsigned long long>(timer.period.value),
                static_cast<unsigned long long>(timer.expirations));
   });
   return TimerServiceError::Success;
}

void TimerService::timer_disconnect(Badge badge)
{
   SpinlockGuard guard(lock);

   if (auto client = registry.disconnect(badge)) {
      manager.release_client(*client);
   }
}

/* ============================================================================
 * Interrupt Entry
 * ========================================================================= */

void TimerService::timer_interrupt_handle()
{
   {
      SpinlockGuard guard(lock);
      ++interrupt_count;
      [[maybe_unused]] uint32_t const fired = manager.service_interrupt();
      LOG_HW("timer interrupt #%llu serviced, %u timer(s) fired",
             static_cast<unsigned long long>(interrupt_count), fired);
   }

   // The platform line is unmasked only once the service state is consistent
   if (irq_ack) irq_ack();
}

void TimerService::isr_trampoline(void* self)
{
   static_cast<TimerService*>(self)->timer_interrupt_handle();
}

} // namespace chronomux
