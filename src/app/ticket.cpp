#include <cctype>
#include <limits>
#include <sodium.h>

#include "app/ticket.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace app
{

static bool ensure_sodium_init()
{
    static int ok = (sodium_init() >= 0);  // -1 means failed
    return ok;
}

// Whole field must be digits; no sign, no whitespace.
static std::optional<std::uint32_t> parse_u32(std::string_view s)
{
    if (s.empty() || s.size() > 10)
        return std::nullopt;
    std::uint64_t v = 0;
    for (char c : s)
    {
        if (!std::isdigit((unsigned char)c))
            return std::nullopt;
        v = v * 10 + (std::uint64_t)(c - '0');
    }
    if (v > std::numeric_limits<std::uint32_t>::max())
        return std::nullopt;
    return (std::uint32_t)v;
}

std::string format_ticket(std::uint32_t id, std::uint32_t price)
{
    std::string out(constants::TICKET_ID_PREFIX);
    out += std::to_string(id);
    out += constants::TICKET_FIELD_SEP;
    out += constants::TICKET_PRICE_PREFIX;
    out += std::to_string(price);
    return out;
}

std::optional<Ticket> parse_ticket(std::string_view payload)
{
    Ticket t;
    bool   have_price = false;

    std::size_t pos = 0;
    while (pos <= payload.size())
    {
        std::size_t end = payload.find(constants::TICKET_FIELD_SEP, pos);
        if (end == std::string_view::npos)
            end = payload.size();
        const std::string_view field = payload.substr(pos, end - pos);

        if (field.rfind(constants::TICKET_PRICE_PREFIX, 0) == 0)
        {
            auto p = parse_u32(field.substr(constants::TICKET_PRICE_PREFIX.size()));
            if (!p || *p == 0)
            {
                LOG_WARN("[TICKET] bad price field '%.*s'", (int)field.size(), field.data());
                return std::nullopt;
            }
            t.price    = *p;
            have_price = true;
        }
        else if (field.rfind(constants::TICKET_ID_PREFIX, 0) == 0)
        {
            t.id = parse_u32(field.substr(constants::TICKET_ID_PREFIX.size()));
        }
        pos = end + 1;
    }

    if (!have_price)
    {
        LOG_WARN("[TICKET] no %.*s field in '%.*s'", (int)constants::TICKET_PRICE_PREFIX.size(),
                 constants::TICKET_PRICE_PREFIX.data(), (int)payload.size(), payload.data());
        return std::nullopt;
    }
    if (t.price % constants::COIN_DENOMINATION != 0)
        LOG_INFO("[TICKET] price %u is not a multiple of %u, rounding coins up", t.price,
                 constants::COIN_DENOMINATION);
    return t;
}

std::optional<Ticket> issue_ticket()
{
    if (!ensure_sodium_init())
    {
        LOG_ERROR("[TICKET] libsodium init failed");
        return std::nullopt;
    }
    Ticket t;
    t.id = randombytes_uniform(constants::TICKET_MAX_ID);
    t.price =
        (randombytes_uniform(constants::TICKET_MAX_UNITS) + 1) * constants::COIN_DENOMINATION;
    LOG_INFO("[TICKET] issued %s", format_ticket(*t.id, t.price).c_str());
    return t;
}

}  // namespace app
