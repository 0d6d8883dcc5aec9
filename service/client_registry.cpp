#include "chronomux/client_registry.hpp"

#include "DEBUG_PRINT.hpp"

namespace chronomux
{

std::optional<ClientId> ClientRegistry::connect(Badge badge) noexcept
{
   if (badge == INVALID_BADGE) return std::nullopt;
   if (auto known = lookup(badge)) return known;

   for (ClientId client = 0; client < Config::MAX_CLIENTS; ++client) {
      if (badges[client] == INVALID_BADGE) {
         badges[client] = badge;
         LOG_TIMER("badge 0x%llx connected as client %u", static_cast<unsigned long long>(badge), client);
         return client;
      }
   }

   LOG_TIMER("badge 0x%llx refused, all %u client slots taken",
             static_cast<unsigned long long>(badge), Config::MAX_CLIENTS);
   return std::nullopt;
}

std::optional<ClientId> ClientRegistry::lookup(Badge badge) const noexcept
{
   if (badge == INVALID_BADGE) return std::nullopt;

   for (ClientId client = 0; client < Config::MAX_CLIENTS; ++client) {
      if (badges[client] == badge) return client;
   }
   return std::nullopt;
}

std::optional<ClientId> ClientRegistry::disconnect(Badge badge) noexcept
{
   auto client = lookup(badge);
   if (client) {
      badges[*client] = INVALID_BADGE;
      LOG_TIMER("badge 0x%llx disconnected from client %u", static_cast<unsigned long long>(badge), *client);
   }
   return client;
}

std::optional<Badge> ClientRegistry::badge_of(ClientId client) const noexcept
{
   if (client >= Config::MAX_CLIENTS || badges[client] == INVALID_BADGE) return std::nullopt;
   return badges[client];
}

uint32_t ClientRegistry::connected() const noexcept
{
   uint32_t count = 0;
   for (Badge b : badges) {
      if (b != INVALID_BADGE) ++count;
   }
   return count;
}

} // namespace chronomux
