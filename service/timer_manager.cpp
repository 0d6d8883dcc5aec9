#include "chronomux/timer_manager.hpp"
#include "chronomux/panic.hpp"

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <utility>

#include "DEBUG_PRINT.hpp"

namespace chronomux
{

TimerManager::TimerManager(IHardwareTimer& hw) : hw(hw)
{
   hw.setup();
   armed_for.reset();
}

/* ============================================================================
 * Client Operations
 * ========================================================================= */

TimerServiceError TimerManager::check_ids(ClientId client, TimerId id) const noexcept
{
   if (client >= Config::MAX_CLIENTS)       return TimerServiceError::NoSuchClient;
   if (id >= Config::TIMERS_PER_CLIENT)     return TimerServiceError::InvalidTimerId;
   return TimerServiceError::Success;
}

TimerServiceError TimerManager::add_oneshot(ClientId client, TimerId id, Duration duration)
{
   return add_timer(client, id, duration, false);
}

TimerServiceError TimerManager::add_periodic(ClientId client, TimerId id, Duration period)
{
   return add_timer(client, id, period, true);
}

TimerServiceError TimerManager::add_timer(ClientId client, TimerId id, Duration duration, bool periodic)
{
   if (auto err = check_ids(client, id); err != TimerServiceError::Success) return err;
   if (periodic && duration.is_zero()) return TimerServiceError::InvalidDuration;

   auto& table = clients[client];
   if (table.outstanding(id)) return TimerServiceError::TimerAlreadyExists;

   auto& timer = table.slots[id];
   timer = VirtualTimer{
      .client      = client,
      .id          = id,
      .deadline    = hw.deadline(duration),
      .period      = periodic ? duration : Duration{},
      .periodic    = periodic,
      .expirations = 0,
      .sequence    = next_sequence++,
      .heap_index  = VirtualTimer::NOT_IN_INDEX,
   };
   table.in_use |= timer_bit(id);
   link(timer);

   LOG_TIMER("client %u: %s timer %u armed for %llu (+%llu)",
             client, periodic ? "periodic" : "oneshot", id,
             static_cast<unsigned long long>(timer.deadline.value),
             static_cast<unsigned long long>(duration.value));

   rearm_earliest();
   return TimerServiceError::Success;
}

TimerServiceError TimerManager::cancel(ClientId client, TimerId id)
{
   if (auto err = check_ids(client, id); err != TimerServiceError::Success) return err;

   auto& table = clients[client];
   if (!table.outstanding(id)) return TimerServiceError::NoSuchTimer;

   auto& timer = table.slots[id];
   CHRONOMUX_INVARIANT(index.contains(&timer), "timer %u/%u outstanding but not indexed", client, id);

   index.remove(&timer);
   table.in_use &= ~timer_bit(id);
   timer = VirtualTimer{};

   LOG_TIMER("client %u: timer %u cancelled", client, id);

   rearm_earliest();
   return TimerServiceError::Success;
}

CompletedTimers TimerManager::completed_timers(ClientId client)
{
   if (client >= Config::MAX_CLIENTS) return {TimerServiceError::NoSuchClient, 0};
   return {TimerServiceError::Success, clients[client].take_completed()};
}

TimerServiceError TimerManager::wait(ClientId client, Waiter&& waiter)
{
   assert(waiter && "Waiting with an empty continuation");

   if (client >= Config::MAX_CLIENTS) return TimerServiceError::NoSuchClient;

   auto& table = clients[client];
   if (table.waiting()) return TimerServiceError::WaitAlreadyPending;

   if (table.completed != 0) {
      TimerMask mask = table.take_completed();
      LOG_TIMER("client %u: wait satisfied immediately (mask=0x%08x)", client, mask);
      waiter(TimerServiceError::Success, mask);
      return TimerServiceError::Success;
   }

   table.waiter = std::move(waiter);
   LOG_TIMER("client %u: waiting", client);
   return TimerServiceError::Success;
}

void TimerManager::release_client(ClientId client)
{
   if (client >= Config::MAX_CLIENTS) return;

   auto& table = clients[client];
   for (TimerId id = 0; id < Config::TIMERS_PER_CLIENT; ++id) {
      if (!table.outstanding(id)) continue;
      index.remove(&table.slots[id]);
      table.slots[id] = VirtualTimer{};
   }
   table.in_use    = 0;
   table.completed = 0;
   table.waiter    = nullptr;

   LOG_TIMER("client %u: released", client);

   rearm_earliest();
}

/* ============================================================================
 * Interrupt Path
 * ========================================================================= */

uint32_t TimerManager::service_interrupt()
{
   hw.ack_interrupt();
   armed_for.reset();

   TimePoint const now = hw.now();
   uint32_t fired = 0;

   for (;;) {
      VirtualTimer* timer = index.top();
      if (!timer || timer->deadline > now) break;

      (void)index.pop_min();

      CHRONOMUX_INVARIANT(timer->client < Config::MAX_CLIENTS && timer->id < Config::TIMERS_PER_CLIENT,
                          "deadline index holds a timer with ids %u/%u", timer->client, timer->id);
      auto& table = clients[timer->client];
      CHRONOMUX_INVARIANT(table.outstanding(timer->id) && &table.slots[timer->id] == timer,
                          "deadline index and client %u table disagree on timer %u", timer->client, timer->id);

      table.completed |= timer_bit(timer->id);
      ++fired;

      LOG_TIMER("client %u: timer %u fired (deadline=%llu now=%llu)",
                timer->client, timer->id,
                static_cast<unsigned long long>(timer->deadline.value),
                static_cast<unsigned long long>(now.value));

      if (timer->periodic) {
         advance_periodic(*timer, now);
         link(*timer);
      } else {
         table.in_use &= ~timer_bit(timer->id);
         *timer = VirtualTimer{};
      }
   }

   // Not fatal: a match latched before the last cancel disarmed the comparator still arrives
   if (fired == 0) {
      LOG_HW("spurious timer interrupt at %llu (%zu timer(s) outstanding)",
             static_cast<unsigned long long>(now.value), static_cast<std::size_t>(index.size()));
   }

   wake_waiters();
   rearm_earliest();
   return fired;
}

void TimerManager::advance_periodic(VirtualTimer& timer, TimePoint now) noexcept
{
   assert(!timer.period.is_zero());
   assert(timer.deadline <= now);

   // Grid points deadline, deadline + P, ... up to and including now have all passed
   uint64_t const passed = (now - timer.deadline).value / timer.period.value + 1;

   timer.expirations += passed;
   timer.deadline = timer.deadline + timer.period * passed;

   if (passed > 1) {
      LOG_TIMER("client %u: periodic timer %u missed %llu period(s)",
                timer.client, timer.id, static_cast<unsigned long long>(passed - 1));
   }
}

void TimerManager::wake_waiters()
{
   for (ClientId client = 0; client < Config::MAX_CLIENTS; ++client) {
      auto& table = clients[client];
      if (!table.waiting() || table.completed == 0) continue;

      // Detach before invoking so the continuation may start a new wait
      Waiter waiter = std::move(table.waiter);
      table.waiter = nullptr;

      TimerMask mask = table.take_completed();
      LOG_TIMER("client %u: woken (mask=0x%08x)", client, mask);
      waiter(TimerServiceError::Success, mask);
   }
}

/* ============================================================================
 * Hardware Arming
 * ========================================================================= */

void TimerManager::link(VirtualTimer& timer)
{
   bool const linked = index.push(&timer);
   CHRONOMUX_INVARIANT(linked, "deadline index refused timer %u/%u", timer.client, timer.id);
}

void TimerManager::rearm_earliest()
{
   VirtualTimer const* next = index.top();

   if (!next) {
      if (armed_for) {
         hw.disarm();
         armed_for.reset();
         LOG_HW("comparator disarmed");
      }
      return;
   }

   if (armed_for && *armed_for == next->deadline) return;

   hw.set_alarm(next->deadline);
   armed_for = next->deadline;
   LOG_HW("comparator armed for %llu", static_cast<unsigned long long>(next->deadline.value));
}

/* ============================================================================
 * Introspection
 * ========================================================================= */

std::optional<TimerInfo> TimerManager::timer_info(ClientId client, TimerId id) const
{
   if (check_ids(client, id) != TimerServiceError::Success) return std::nullopt;

   auto const& table = clients[client];
   if (!table.outstanding(id)) return std::nullopt;

   auto const& timer = table.slots[id];
   return TimerInfo{
      .deadline    = timer.deadline,
      .period      = timer.period,
      .periodic    = timer.periodic,
      .expirations = timer.expirations,
   };
}

TimerMask TimerManager::outstanding(ClientId client) const
{
   return client < Config::MAX_CLIENTS ? clients[client].in_use : 0;
}

TimerMask TimerManager::pending_mask(ClientId client) const
{
   return client < Config::MAX_CLIENTS ? clients[client].completed : 0;
}

bool TimerManager::waiting(ClientId client) const
{
   return client < Config::MAX_CLIENTS && clients[client].waiting();
}

} // namespace chronomux
