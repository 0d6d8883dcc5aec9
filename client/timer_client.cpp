#include "chronomux/timer_client.hpp"

#include "DEBUG_PRINT.hpp"

namespace chronomux
{

CompletedTimers TimerClient::request(ipc::Request const& request)
{
   ipc::Message const reply = endpoint.call(ipc::encode_request(request));
   CompletedTimers result = ipc::decode_reply(reply);
   if (!result.ok()) {
      LOG_CLIENT("request %zu failed: %s", request.index(), to_string(result.error));
   }
   return result;
}

TimerServiceError TimerClient::oneshot(TimerId id, uint32_t duration_ms)
{
   return request(ipc::OneshotRequest{id, duration_ms}).error;
}

TimerServiceError TimerClient::periodic(TimerId id, uint32_t period_ms)
{
   return request(ipc::PeriodicRequest{id, period_ms}).error;
}

TimerServiceError TimerClient::cancel(TimerId id)
{
   return request(ipc::CancelRequest{id}).error;
}

CompletedTimers TimerClient::completed_timers()
{
   return request(ipc::CompletedTimersRequest{});
}

CompletedTimers TimerClient::wait()
{
   return request(ipc::WaitRequest{});
}

TimerServiceError TimerClient::capscan()
{
   return request(ipc::CapscanRequest{}).error;
}

} // namespace chronomux
