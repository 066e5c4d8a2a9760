#pragma once
#include <string>

#include "transport/itransport.hpp"

namespace transport
{

// A device as reported by discovery. Address is the identity; name is informational.
struct DeviceDescriptor
{
    std::string name;
    std::string address;  // "AA:BB:CC:DD:EE:FF"
    Kind        kind = Kind::Ble;
    std::string handle;  // BlueZ object path, e.g. /org/bluez/hci0/dev_AA_BB_CC_DD_EE_FF
};

}  // namespace transport
