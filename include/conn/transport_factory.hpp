#pragma once
#include <string>

#include "conn/connection_manager.hpp"
#include "util/config.hpp"

namespace conn
{

// LE descriptors get a LeTransport, Classic ones an SppTransport, both on cfg.adapter with
// cfg.connect_timeout_ms.
TransportFactory make_bluez_factory(const parkterm::Config &cfg);

}  // namespace conn
