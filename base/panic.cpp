#include "chronomux/panic.hpp"
#include "chronomux/port.h"

#include <cstdarg>
#include <cstdio>
#include <cstdlib>

namespace chronomux
{

void panic(char const* what, ...) noexcept
{
   std::fprintf(stderr, "\x1b[31m[tick=%010llu][PANIC ] ",
                static_cast<unsigned long long>(chronomux_port_time_now()));

   va_list args;
   va_start(args, what);
   std::vfprintf(stderr, what, args);
   va_end(args);

   std::fprintf(stderr, "\x1b[0m\n");
   std::fflush(stderr);
   std::abort();
}

} // namespace chronomux
