/**
 * @file panic.hpp
 * @brief Fatal stop for internal invariant violations
 *
 * Client mistakes are returned as TimerServiceError. panic() is reserved for
 * states that can only come from a bug in the service itself, where carrying
 * on would silently lose completions for unrelated clients.
 */

#ifndef CHRONOMUX_PANIC_HPP
#define CHRONOMUX_PANIC_HPP

namespace chronomux
{

/**
 * @brief Report an internal invariant violation and halt the service
 * @param what printf-style format
 */
[[noreturn]] void panic(char const* what, ...) noexcept __attribute__((format(printf, 1, 2)));

} // namespace chronomux

#define CHRONOMUX_INVARIANT(cond, ...) \
   do { if (!(cond)) ::chronomux::panic(__VA_ARGS__); } while (0)

#endif // CHRONOMUX_PANIC_HPP
