/**
 * @file client_registry.hpp
 * @brief Badge to ClientId mapping
 *
 * The kernel stamps every request with the badge of the endpoint capability
 * it arrived on. The registry hands out one of Config::MAX_CLIENTS slots per
 * badge, so the TimerManager only ever sees small dense ClientIds.
 */

#ifndef CHRONOMUX_CLIENT_REGISTRY_HPP
#define CHRONOMUX_CLIENT_REGISTRY_HPP

#include "chronomux/config.hpp"
#include "chronomux/timer_types.hpp"

#include <array>
#include <cstdint>
#include <optional>

namespace chronomux
{

class ClientRegistry
{
public:
   static constexpr Badge INVALID_BADGE = 0;

   /**
    * @brief Get the slot for a badge, allocating one on first contact
    * @return nullopt for the invalid badge or when every slot is taken
    */
   [[nodiscard]] std::optional<ClientId> connect(Badge badge) noexcept;

   [[nodiscard]] std::optional<ClientId> lookup(Badge badge) const noexcept;

   /**
    * @brief Free the badge's slot
    * @return The ClientId it held, so the caller can release its timers
    */
   std::optional<ClientId> disconnect(Badge badge) noexcept;

   [[nodiscard]] std::optional<Badge> badge_of(ClientId client) const noexcept;

   [[nodiscard]] uint32_t connected() const noexcept;

private:
   std::array<Badge, Config::MAX_CLIENTS> badges{}; // INVALID_BADGE marks a free slot
};

} // namespace chronomux

#endif // CHRONOMUX_CLIENT_REGISTRY_HPP
