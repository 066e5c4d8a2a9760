#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "discovery/device_catalog.hpp"
#include "discovery/sources.hpp"
#include "transport/device.hpp"
#include "util/errors.hpp"

namespace discovery
{

// Merges the LE radio scan and the bonded Classic listing into one catalog.
class DeviceDiscovery
{
  public:
    using Listener = std::function<void(const std::vector<transport::DeviceDescriptor> &)>;

    DeviceDiscovery(ILeScanner &le, IBondedSource &bonded, std::chrono::milliseconds scan_timeout);
    ~DeviceDiscovery();

    // Clears the catalog and runs both sources. No-op while a scan is running.
    // ScanFailed only if neither source could be used.
    parkterm::Err scan();
    // Safe when idle. Does not touch any connection.
    void stop_scan();
    bool scanning() const { return scanning_.load(); }

    std::vector<transport::DeviceDescriptor>   devices() const { return catalog_.snapshot(); }
    std::optional<transport::DeviceDescriptor> find(const std::string &address) const
    {
        return catalog_.find(address);
    }

    // Called with the whole catalog after every addition (and once after scan() clears it).
    void set_listener(Listener l);

  private:
    void offer(const Advert &a, transport::Kind kind);
    void publish();

    ILeScanner               &le_;
    IBondedSource            &bonded_;
    std::chrono::milliseconds timeout_;
    DeviceCatalog             catalog_;
    std::atomic_bool          scanning_{false};
    std::mutex                listener_mu_;
    Listener                  listener_;
};

}  // namespace discovery
