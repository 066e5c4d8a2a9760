// include/transport/bluez_dbus_util.hpp
#pragma once
#include <cctype>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

#include <systemd/sd-bus.h>

namespace bluez
{

inline constexpr const char *SERVICE         = "org.bluez";
inline constexpr const char *IFACE_ADAPTER   = "org.bluez.Adapter1";
inline constexpr const char *IFACE_DEVICE    = "org.bluez.Device1";
inline constexpr const char *IFACE_GATT_SVC  = "org.bluez.GattService1";
inline constexpr const char *IFACE_GATT_CHR  = "org.bluez.GattCharacteristic1";
inline constexpr const char *IFACE_PROFILE   = "org.bluez.Profile1";
inline constexpr const char *IFACE_PROFILE_M = "org.bluez.ProfileManager1";
inline constexpr const char *IFACE_OBJ_MGR   = "org.freedesktop.DBus.ObjectManager";
inline constexpr const char *IFACE_PROPS     = "org.freedesktop.DBus.Properties";

static inline std::string to_lower(std::string s)
{
    for (auto &c : s)
        c = (char)std::tolower((unsigned char)c);
    return s;
}

static inline std::string to_upper(std::string s)
{
    for (auto &c : s)
        c = (char)std::toupper((unsigned char)c);
    return s;
}

// case-insensitive substring match, used for the ffe0/ffe1 UUID fragments
static inline bool icontains(const std::string &haystack, std::string_view needle)
{
    return to_lower(haystack).find(to_lower(std::string(needle))) != std::string::npos;
}

static inline bool mac_eq(const std::string &a, const std::string &b)
{
    return to_upper(a) == to_upper(b);
}

// "/org/bluez/hci0/dev_AA_BB_CC_DD_EE_FF" -> "AA:BB:CC:DD:EE:FF" ("" if not a device path)
static inline std::string path_to_mac(const std::string &obj_path)
{
    auto pos = obj_path.rfind("/dev_");
    if (pos == std::string::npos)
        return {};
    std::string tail = obj_path.substr(pos + 5);
    if (tail.find('/') != std::string::npos)
        return {};
    for (auto &c : tail)
        if (c == '_')
            c = ':';
    return to_upper(tail);
}

// "AA:BB:CC:DD:EE:FF" -> "/org/bluez/hci0/dev_AA_BB_CC_DD_EE_FF"
static inline std::string mac_to_path(const std::string &adapter, const std::string &mac)
{
    std::string tail = to_upper(mac);
    for (auto &c : tail)
        if (c == ':')
            c = '_';
    return "/org/bluez/" + adapter + "/dev_" + tail;
}

static inline std::string device_prefix(const std::string &adapter)
{
    return "/org/bluez/" + adapter + "/dev_";
}

static inline bool is_device_path(const std::string &adapter, const char *path)
{
    if (!path)
        return false;
    const std::string p(path);
    const std::string prefix = device_prefix(adapter);
    // device object itself, not one of its GATT children
    return p.rfind(prefix, 0) == 0 && p.find('/', prefix.size()) == std::string::npos;
}

[[maybe_unused]] static inline int read_var_s(sd_bus_message *m, std::string &out)
{
    // read variant "s"
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "s");
    if (r < 0)
        return r;
    const char *s = nullptr;
    r             = sd_bus_message_read(m, "s", &s);
    if (r >= 0 && s)
        out = s;
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

[[maybe_unused]] static inline int read_var_o(sd_bus_message *m, std::string &out)
{
    // read variant "o"
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "o");
    if (r < 0)
        return r;
    const char *s = nullptr;
    r             = sd_bus_message_read(m, "o", &s);
    if (r >= 0 && s)
        out = s;
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

[[maybe_unused]] static inline int read_var_b(sd_bus_message *m, bool &out)
{
    // read variant "b"
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "b");
    if (r < 0)
        return r;
    int b = 0;
    r     = sd_bus_message_read(m, "b", &b);
    if (r >= 0)
        out = (b != 0);
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

[[maybe_unused]] static inline int read_var_i16(sd_bus_message *m, int16_t &out)
{
    // read variant "n" (int16)
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "n");
    if (r < 0)
        return r;
    r      = sd_bus_message_read(m, "n", &out);
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

// Appends one {sv} dict entry whose variant holds a single basic value.
// Caller has opened the a{sv} container.
template <typename T>
static inline int append_dict_entry(sd_bus_message *msg, const char *key, const char *sig, T val)
{
    int r = sd_bus_message_open_container(msg, SD_BUS_TYPE_DICT_ENTRY, "sv");
    if (r < 0)
        return r;
    r = sd_bus_message_append(msg, "s", key);
    if (r < 0)
        return r;
    r = sd_bus_message_open_container(msg, SD_BUS_TYPE_VARIANT, sig);
    if (r < 0)
        return r;
    r = sd_bus_message_append(msg, sig, val);
    if (r < 0)
        return r;
    r = sd_bus_message_close_container(msg);  // variant
    if (r < 0)
        return r;
    return sd_bus_message_close_container(msg);  // dict-entry
}

// Frees a slot and nulls the pointer
static inline void unref_slot(sd_bus_slot *&s)
{
    if (s)
    {
        sd_bus_slot_unref(s);
        s = nullptr;
    }
}

static inline const char *bus_err_text(const sd_bus_error &err, int r)
{
    return err.message ? err.message : std::strerror(-r);
}

// Device1 properties picked out of ObjectManager.GetManagedObjects
struct DeviceProps
{
    std::string path;
    std::string address;
    std::string name;
    bool        paired    = false;
    bool        bonded    = false;
    bool        connected = false;
};

// Walks GetManagedObjects and collects every Device1 under the adapter.
// Returns a negative errno on bus failure.
int list_devices(sd_bus *bus, const std::string &adapter, std::vector<DeviceProps> &out);

// Parses one Device1 a{sv} property block. m is positioned at the array.
int read_device_props(sd_bus_message *m, DeviceProps &dev);

// Adapter1.StartDiscovery / StopDiscovery, treating InProgress as success.
bool adapter_start_discovery(sd_bus *bus, const std::string &adapter_path);
bool adapter_stop_discovery(sd_bus *bus, const std::string &adapter_path);

// Adapter1.SetDiscoveryFilter(Transport=le, DuplicateData=false)
bool adapter_set_le_filter(sd_bus *bus, const std::string &adapter_path);

}  // namespace bluez
