#pragma once
#include <cstdint>
#include <string>

#include "util/constants.hpp"

namespace parkterm
{

enum class TransportMode
{
    Bluez,
    Loopback
};

struct Config
{
    TransportMode mode               = TransportMode::Bluez;
    std::string   adapter            = "hci0";
    std::uint32_t scan_timeout_ms    = constants::DEFAULT_SCAN_TIMEOUT_MS;
    std::uint32_t connect_timeout_ms = constants::DEFAULT_CONNECT_TIMEOUT_MS;
    std::string   ctl_sock;  // empty: constants::ctl_sock_path()
};

// Reads PARKTERM_* variables. Invalid values are logged and left at their defaults.
Config load_config_from_env();

}  // namespace parkterm
