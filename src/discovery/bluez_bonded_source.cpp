#include "discovery/bluez_sources.hpp"
#include "transport/bluez_dbus_util.hpp"
#include "util/log.hpp"

#include <cstring>

#include <systemd/sd-bus.h>

namespace discovery
{

// ======================================================================
// Function: BluezBondedSource::list_bonded
// - In: adapter name
// - Out: paired or bonded Device1 objects, nullopt if BlueZ can't be reached
// - Note: short-lived bus, nothing is kept between calls
// ======================================================================
std::optional<std::vector<Advert>> BluezBondedSource::list_bonded()
{
    sd_bus *bus = nullptr;
    int     r   = sd_bus_open_system(&bus);
    if (r < 0 || !bus)
    {
        LOG_ERROR("[SCAN] failed to connect system bus: %s", std::strerror(-r));
        return std::nullopt;
    }

    std::vector<bluez::DeviceProps> all;
    r = bluez::list_devices(bus, adapter_, all);
    sd_bus_flush_close_unref(bus);
    if (r < 0)
        return std::nullopt;

    std::vector<Advert> out;
    for (auto &d : all)
    {
        if (!d.paired && !d.bonded)
            continue;
        out.push_back(Advert{d.address, d.name, d.path});
    }
    LOG_INFO("[SCAN] %zu bonded device(s) of %zu known on %s", out.size(), all.size(),
             adapter_.c_str());
    return out;
}

}  // namespace discovery
