#include "chronomux/ipc.hpp"
#include "chronomux/timer_service.hpp"

#include <limits>
#include <type_traits>
#include <utility>

#include "DEBUG_PRINT.hpp"

namespace chronomux::ipc
{

// Helper for std::visit with lambdas
template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

static constexpr Word U32_MAX = std::numeric_limits<uint32_t>::max();

static constexpr Message make_message(Label label, uint32_t length) noexcept
{
   return Message{.label = static_cast<uint32_t>(label), .length = length, .words = {}};
}

/* ============================================================================
 * Requests
 * ========================================================================= */

Message encode_request(Request const& request) noexcept
{
   return std::visit(overloaded{
      [](CompletedTimersRequest const&) { return make_message(Label::CompletedTimers, 0); },
      [](OneshotRequest const& r) {
         auto m = make_message(Label::Oneshot, 2);
         m.words[0] = r.id;
         m.words[1] = r.duration_ms;
         return m;
      },
      [](PeriodicRequest const& r) {
         auto m = make_message(Label::Periodic, 2);
         m.words[0] = r.id;
         m.words[1] = r.duration_ms;
         return m;
      },
      [](CancelRequest const& r) {
         auto m = make_message(Label::Cancel, 1);
         m.words[0] = r.id;
         return m;
      },
      [](WaitRequest const&)    { return make_message(Label::Wait, 0); },
      [](CapscanRequest const&) { return make_message(Label::Capscan, 0); },
   }, request);
}

std::optional<Request> decode_request(Message const& message) noexcept
{
   if (message.length > MAX_WORDS) return std::nullopt;

   auto const& w = message.words;
   auto needs = [&](uint32_t n) { return message.length >= n; };
   auto fits  = [](Word v) { return v <= U32_MAX; };

   switch (static_cast<Label>(message.label)) {
      case Label::CompletedTimers:
         return CompletedTimersRequest{};

      case Label::Oneshot:
         if (!needs(2) || !fits(w[0]) || !fits(w[1])) return std::nullopt;
         return OneshotRequest{static_cast<TimerId>(w[0]), static_cast<uint32_t>(w[1])};

      case Label::Periodic:
         if (!needs(2) || !fits(w[0]) || !fits(w[1])) return std::nullopt;
         return PeriodicRequest{static_cast<TimerId>(w[0]), static_cast<uint32_t>(w[1])};

      case Label::Cancel:
         if (!needs(1) || !fits(w[0])) return std::nullopt;
         return CancelRequest{static_cast<TimerId>(w[0])};

      case Label::Wait:
         return WaitRequest{};

      case Label::Capscan:
         return CapscanRequest{};
   }
   return std::nullopt;
}

/* ============================================================================
 * Replies
 * ========================================================================= */

Message encode_reply(TimerServiceError error, TimerMask mask) noexcept
{
   Message m{};
   m.label    = static_cast<uint32_t>(error);
   m.length   = 1;
   m.words[0] = mask;
   return m;
}

CompletedTimers decode_reply(Message const& message) noexcept
{
   if (message.label >= TIMER_SERVICE_ERROR_COUNT) return {TimerServiceError::UnknownError, 0};

   auto const error = static_cast<TimerServiceError>(message.label);
   if (message.length < 1 || message.length > MAX_WORDS || message.words[0] > U32_MAX) {
      return {TimerServiceError::DeserializeFailed, 0};
   }
   return {error, static_cast<TimerMask>(message.words[0])};
}

/* ============================================================================
 * Dispatcher
 * ========================================================================= */

void Dispatcher::dispatch(Badge badge, Message const& message, ReplyFn reply)
{
   auto request = decode_request(message);
   if (!request) {
      LOG_IPC("badge 0x%llx: undecodable request (label=%u length=%u)",
              static_cast<unsigned long long>(badge), message.label, message.length);
      reply(encode_reply(TimerServiceError::DeserializeFailed));
      return;
   }

   LOG_IPC("badge 0x%llx: request label=%u", static_cast<unsigned long long>(badge), message.label);

   std::visit(overloaded{
      [&](CompletedTimersRequest const&) {
         auto result = service.timer_completed_timers(badge);
         reply(encode_reply(result.error, result.mask));
      },
      [&](OneshotRequest const& r) {
         reply(encode_reply(service.timer_oneshot(badge, r.id, r.duration_ms)));
      },
      [&](PeriodicRequest const& r) {
         reply(encode_reply(service.timer_periodic(badge, r.id, r.duration_ms)));
      },
      [&](CancelRequest const& r) {
         reply(encode_reply(service.timer_cancel(badge, r.id)));
      },
      [&](WaitRequest const&) {
         // Reply travels with the waiter, possibly long after we return
         (void)service.timer_wait(badge, Waiter{[reply = std::move(reply)](TimerServiceError error, TimerMask mask) {
            reply(encode_reply(error, mask));
         }});
      },
      [&](CapscanRequest const&) {
         reply(encode_reply(service.timer_capscan(badge)));
      },
   }, *request);
}

} // namespace chronomux::ipc
