#pragma once
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>

#include "util/log.hpp"

namespace constants
{
// HM-10 / BT-05 / AT-09 style UART modules: 0000ffe0-... service, 0000ffe1-... characteristic.
// Matched as case-insensitive substrings so vendor variants of the base UUID still work.
inline constexpr std::string_view UART_SVC_FRAGMENT = "ffe0";
inline constexpr std::string_view UART_CHR_FRAGMENT = "ffe1";

// Serial Port Profile (HC-05 / HC-06)
inline constexpr std::string_view SPP_UUID = "00001101-0000-1000-8000-00805f9b34fb";

// Every outgoing command is terminated the same way on both transports
inline constexpr std::string_view LINE_TERMINATOR = "\r\n";

// Controller -> terminal tokens
inline constexpr std::string_view TOKEN_RATE_ACK = "ST";
inline constexpr char             TOKEN_COIN     = '$';
inline constexpr char             TOKEN_PAID     = 'P';

// Value of one '$' token
inline constexpr std::uint32_t COIN_DENOMINATION = 5;
// The protocol never produces a legitimate token this long
inline constexpr std::size_t RX_BUFFER_CEILING = 50;

// Ticket payload: TICKET-ID-<id>|PRECIO:<price>
inline constexpr std::string_view TICKET_ID_PREFIX    = "TICKET-ID-";
inline constexpr std::string_view TICKET_PRICE_PREFIX = "PRECIO:";
inline constexpr char             TICKET_FIELD_SEP    = '|';
inline constexpr std::uint32_t    TICKET_MAX_UNITS    = 9;
inline constexpr std::uint32_t    TICKET_MAX_ID       = 9999;  // exclusive

inline constexpr std::uint32_t DEFAULT_SCAN_TIMEOUT_MS    = 10000;
inline constexpr std::uint32_t DEFAULT_CONNECT_TIMEOUT_MS = 15000;

// Control socket path (Unix domain socket)
[[maybe_unused]] static std::string ctl_sock_path()
{
    if (const char *p = std::getenv("PARKTERM_CTL_SOCK"); p && *p)
    {
        return std::string(p);
    }
    const char *home      = std::getenv("HOME");
    std::string base      = home && *home ? std::string(home) : "/tmp";
    std::string sock_path = base + "/.cache/parkterm/ctl.sock";
    LOG_SYSTEM("Listening on %s", sock_path.c_str());
    return sock_path;
}

}  // namespace constants
