#include "discovery/device_discovery.hpp"

#include "util/log.hpp"

namespace discovery
{
using parkterm::Err;

DeviceDiscovery::DeviceDiscovery(ILeScanner               &le,
                                 IBondedSource            &bonded,
                                 std::chrono::milliseconds scan_timeout)
    : le_(le), bonded_(bonded), timeout_(scan_timeout)
{
}

DeviceDiscovery::~DeviceDiscovery()
{
    stop_scan();
}

void DeviceDiscovery::set_listener(Listener l)
{
    std::lock_guard<std::mutex> lk(listener_mu_);
    listener_ = std::move(l);
}

void DeviceDiscovery::publish()
{
    Listener l;
    {
        std::lock_guard<std::mutex> lk(listener_mu_);
        l = listener_;
    }
    if (l)
        l(catalog_.snapshot());
}

void DeviceDiscovery::offer(const Advert &a, transport::Kind kind)
{
    if (a.name.empty() || a.address.empty())
        return;  // nothing an operator could pick

    transport::DeviceDescriptor d;
    d.name    = a.name;
    d.address = a.address;
    d.kind    = kind;
    d.handle  = a.handle;
    if (!catalog_.add(d))
        return;
    LOG_INFO("[SCAN] + %s '%s' (%s)", d.address.c_str(), d.name.c_str(),
             transport::kind_name(kind));
    publish();
}

// ======================================================================
// Function: DeviceDiscovery::scan
// - In: idle or scanning
// - Out: LE scan running for the timeout, bonded devices already merged
// - Note: the LE sightings race the bonded listing, whichever reports an address first keeps it
// ======================================================================
Err DeviceDiscovery::scan()
{
    if (scanning_.exchange(true))
    {
        LOG_DEBUG("[SCAN] already scanning");
        return Err::Ok;
    }
    catalog_.clear();
    publish();

    Err le_res = le_.start(
        timeout_, [this](const Advert &a) { offer(a, transport::Kind::Ble); },
        [this] {
            scanning_.store(false);
            LOG_SYSTEM("[SCAN] finished, %zu device(s)", catalog_.size());
        });
    if (le_res != Err::Ok)
    {
        scanning_.store(false);
        LOG_WARN("[SCAN] LE scan unavailable: %s", parkterm::err_name(le_res));
    }

    auto bonded = bonded_.list_bonded();
    if (bonded)
    {
        for (const auto &a : *bonded)
            offer(a, transport::Kind::Classic);
    }
    else
    {
        LOG_WARN("[SCAN] bonded device listing unavailable");
    }

    if (le_res != Err::Ok && !bonded)
    {
        LOG_SYSTEM("[SCAN] failed: no enumeration source available");
        return Err::ScanFailed;
    }
    LOG_SYSTEM("[SCAN] started (%lld ms), %zu bonded device(s)", (long long)timeout_.count(),
               bonded ? bonded->size() : (std::size_t)0);
    return Err::Ok;
}

void DeviceDiscovery::stop_scan()
{
    le_.stop();
    if (scanning_.exchange(false))
        LOG_INFO("[SCAN] stopped, %zu device(s)", catalog_.size());
}

}  // namespace discovery
