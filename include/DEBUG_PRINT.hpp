// Channelled debug logging, compiled out unless DEBUG_PRINT_ENABLE is set
#ifndef DEBUG_PRINT_HPP
#define DEBUG_PRINT_HPP

#include <cstdint>
#include <cstdio>

#ifndef DEBUG_PRINT_ENABLE
#  define DEBUG_PRINT_ENABLE 0
#endif

extern "C" uint64_t chronomux_port_time_now(void);

namespace chronomux::debug
{
   enum class Channel
   {
      Timer,
      Hardware,
      Ipc,
      Client,
      Sim,
      Test
   };

#if DEBUG_PRINT_ENABLE
   inline const char* color(Channel ch) noexcept
   {
      switch (ch) {
         case Channel::Timer:    return "\x1b[36m"; // cyan
         case Channel::Hardware: return "\x1b[35m"; // magenta
         case Channel::Ipc:      return "\x1b[34m"; // blue
         case Channel::Client:   return "\x1b[33m"; // yellow
         case Channel::Sim:      return "\x1b[37m"; // grey
         case Channel::Test:     return "\x1b[32m"; // green
      }
      return "\x1b[0m";
   }

   inline const char* label(Channel ch) noexcept
   {
      switch (ch) {
         case Channel::Timer:    return "TIMER ";
         case Channel::Hardware: return "HW    ";
         case Channel::Ipc:      return "IPC   ";
         case Channel::Client:   return "CLIENT";
         case Channel::Sim:      return "SIM   ";
         case Channel::Test:     return "TEST  ";
      }
      return "????";
   }

   inline constexpr const char* reset() noexcept { return "\x1b[0m"; }

   template <typename... Args>
   inline void print(Channel ch, const char* fmt, Args... args)
   {
      // prefix with tick + channel label
      std::printf("%s[tick=%010llu][%s] ",
                  color(ch),
                  static_cast<unsigned long long>(chronomux_port_time_now()),
                  label(ch));
      if constexpr (sizeof...(args) == 0) std::printf("%s", fmt);
      else std::printf(fmt, args...);
      std::printf("%s\n", reset());
   }
#endif

}

#if DEBUG_PRINT_ENABLE
#  define LOG_TIMER(fmt, ...)   chronomux::debug::print(chronomux::debug::Channel::Timer,    fmt, ##__VA_ARGS__)
#  define LOG_HW(fmt, ...)      chronomux::debug::print(chronomux::debug::Channel::Hardware, fmt, ##__VA_ARGS__)
#  define LOG_IPC(fmt, ...)     chronomux::debug::print(chronomux::debug::Channel::Ipc,      fmt, ##__VA_ARGS__)
#  define LOG_CLIENT(fmt, ...)  chronomux::debug::print(chronomux::debug::Channel::Client,   fmt, ##__VA_ARGS__)
#  define LOG_SIM(fmt, ...)     chronomux::debug::print(chronomux::debug::Channel::Sim,      fmt, ##__VA_ARGS__)
#  define LOG_TEST(fmt, ...)    chronomux::debug::print(chronomux::debug::Channel::Test,     fmt, ##__VA_ARGS__)
#  define TRUE_FALSE(what) ((what) ? "TRUE" : "FALSE")
#else
#  define LOG_TIMER(...)  ((void)0)
#  define LOG_HW(...)     ((void)0)
#  define LOG_IPC(...)    ((void)0)
#  define LOG_CLIENT(...) ((void)0)
#  define LOG_SIM(...)    ((void)0)
#  define LOG_TEST(...)   ((void)0)
#  define TRUE_FALSE(what)
#endif

#endif
