#include "discovery/device_catalog.hpp"
#include "transport/bluez_dbus_util.hpp"

namespace discovery
{

bool DeviceCatalog::add(transport::DeviceDescriptor d)
{
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto &e : devices_)
        if (bluez::mac_eq(e.address, d.address))
            return false;
    devices_.push_back(std::move(d));
    return true;
}

void DeviceCatalog::clear()
{
    std::lock_guard<std::mutex> lk(mu_);
    devices_.clear();
}

std::vector<transport::DeviceDescriptor> DeviceCatalog::snapshot() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return devices_;
}

std::optional<transport::DeviceDescriptor> DeviceCatalog::find(const std::string &address) const
{
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto &e : devices_)
        if (bluez::mac_eq(e.address, address))
            return e;
    return std::nullopt;
}

std::size_t DeviceCatalog::size() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return devices_.size();
}

}  // namespace discovery
