/**
 * @file ipc.hpp
 * @brief TimerService wire format and request dispatch
 *
 * A request travels in message registers: the label selects the operation
 * and the words carry its arguments. The reply label is the
 * TimerServiceError ordinal and words[0] the completion mask (when the
 * operation returns one).
 *
 *   label              words
 *   CompletedTimers=0  -
 *   Oneshot=1          [0]=timer id  [1]=duration in ms
 *   Periodic=2         [0]=timer id  [1]=duration in ms
 *   Cancel=3           [0]=timer id
 *   Wait=4             -             (reply deferred until a timer fires)
 *   Capscan=5          -
 */

#ifndef CHRONOMUX_IPC_HPP
#define CHRONOMUX_IPC_HPP

#include "chronomux/config.hpp"
#include "chronomux/function.hpp"
#include "chronomux/timer_types.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <variant>

namespace chronomux
{

class TimerService;

namespace ipc
{
   using Word = uint64_t;

   static constexpr uint32_t MAX_WORDS = 4;

   struct Message
   {
      uint32_t label{0};
      uint32_t length{0};                    // Words in use
      std::array<Word, MAX_WORDS> words{};
   };

   enum class Label : uint32_t
   {
      CompletedTimers = 0,
      Oneshot         = 1,
      Periodic        = 2,
      Cancel          = 3,
      Wait            = 4,
      Capscan         = 5,
   };

   struct CompletedTimersRequest {};
   struct OneshotRequest  { TimerId id{0}; uint32_t duration_ms{0}; };
   struct PeriodicRequest { TimerId id{0}; uint32_t duration_ms{0}; };
   struct CancelRequest   { TimerId id{0}; };
   struct WaitRequest     {};
   struct CapscanRequest  {};

   using Request = std::variant<CompletedTimersRequest,
                                OneshotRequest,
                                PeriodicRequest,
                                CancelRequest,
                                WaitRequest,
                                CapscanRequest>;

   [[nodiscard]] Message encode_request(Request const& request) noexcept;

   /**
    * @brief Parse a request
    * @return nullopt for an unknown label, a short message or an argument
    *         that does not fit its field
    */
   [[nodiscard]] std::optional<Request> decode_request(Message const& message) noexcept;

   [[nodiscard]] Message encode_reply(TimerServiceError error, TimerMask mask = 0) noexcept;

   /**
    * @brief Parse a reply; an unknown status maps to UnknownError
    */
   [[nodiscard]] CompletedTimers decode_reply(Message const& message) noexcept;

   /**
    * @brief Routes decoded requests to the TimerService
    *
    * Every request gets exactly one reply through `reply`. All replies are
    * sent before dispatch() returns except Wait, whose reply is sent when
    * the caller's next completion arrives.
    */
   class Dispatcher
   {
   public:
      using ReplyFn = Function<void(Message const&), Config::REPLY_INLINE_SIZE>;

      explicit Dispatcher(TimerService& service) noexcept : service(service) {}

      void dispatch(Badge badge, Message const& message, ReplyFn reply);

   private:
      TimerService& service;
   };

} // namespace ipc
} // namespace chronomux

#endif // CHRONOMUX_IPC_HPP
