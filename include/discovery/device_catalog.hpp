#pragma once
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "transport/device.hpp"

namespace discovery
{

// De-duplicated device list keyed by address (case-insensitive). First sighting wins.
class DeviceCatalog
{
  public:
    // false if the address is already known
    bool add(transport::DeviceDescriptor d);
    void clear();

    std::vector<transport::DeviceDescriptor>   snapshot() const;
    std::optional<transport::DeviceDescriptor> find(const std::string &address) const;
    std::size_t                                size() const;

  private:
    mutable std::mutex                       mu_;
    std::vector<transport::DeviceDescriptor> devices_;  // insertion order
};

}  // namespace discovery
