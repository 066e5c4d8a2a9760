#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace app
{

// Payload carried by the ticket QR code: TICKET-ID-<id>|PRECIO:<price>
struct Ticket
{
    std::optional<std::uint32_t> id;
    std::uint32_t                price = 0;
};

std::string format_ticket(std::uint32_t id, std::uint32_t price);

// Price is the integer after PRECIO: in its own |-separated field. nullopt when the field is
// missing, not a number, zero or out of range. The id is optional.
std::optional<Ticket> parse_ticket(std::string_view payload);

// Random ticket: 1..9 coin units, id in 0..9998. nullopt if libsodium cannot initialize.
std::optional<Ticket> issue_ticket();

}  // namespace app
