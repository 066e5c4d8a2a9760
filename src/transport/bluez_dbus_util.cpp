#include "transport/bluez_dbus_util.hpp"
#include "util/log.hpp"

#include <cerrno>
#include <cstring>

namespace bluez
{

// ======================================================================
// Function: read_device_props
// - In: m positioned at a Device1 a{sv}
// - Out: Address / Name / Paired / Bonded / Connected copied into dev
// - Note: unknown keys are skipped; dev.path is left to the caller
// ======================================================================
int read_device_props(sd_bus_message *m, DeviceProps &dev)
{
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0)
        return r;
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0)
    {
        const char *key = nullptr;
        if ((r = sd_bus_message_read(m, "s", &key)) < 0)
            return r;

        if (key && std::strcmp(key, "Address") == 0)
            r = read_var_s(m, dev.address);
        else if (key && std::strcmp(key, "Name") == 0)
            r = read_var_s(m, dev.name);
        else if (key && std::strcmp(key, "Paired") == 0)
            r = read_var_b(m, dev.paired);
        else if (key && std::strcmp(key, "Bonded") == 0)
            r = read_var_b(m, dev.bonded);
        else if (key && std::strcmp(key, "Connected") == 0)
            r = read_var_b(m, dev.connected);
        else
            r = sd_bus_message_skip(m, "v");
        if (r < 0)
            return r;

        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;  // dict-entry
    }
    if (r < 0)
        return r;
    return sd_bus_message_exit_container(m);  // a{sv}
}

// ======================================================================
// Function: list_devices
// - In: bus open, adapter name ("hci0")
// - Out: one DeviceProps per /org/bluez/<adapter>/dev_* object
// - Note: address falls back to the one encoded in the object path
// ======================================================================
int list_devices(sd_bus *bus, const std::string &adapter, std::vector<DeviceProps> &out)
{
    if (!bus)
        return -ENOTCONN;

    sd_bus_message *reply = nullptr;
    sd_bus_error    err{};
    int r = sd_bus_call_method(bus, SERVICE, "/", IFACE_OBJ_MGR, "GetManagedObjects", &err,
                               &reply, "");
    if (r < 0)
    {
        LOG_WARN("[BLUEZ] GetManagedObjects failed: %s", bus_err_text(err, r));
        sd_bus_error_free(&err);
        if (reply)
            sd_bus_message_unref(reply);
        return r;
    }
    sd_bus_error_free(&err);

    // Walk a{oa{sa{sv}}}
    r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{oa{sa{sv}}}");
    if (r < 0)
        goto out;
    // --- Objects
    while ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "oa{sa{sv}}")) > 0)
    {
        const char *obj = nullptr;
        if ((r = sd_bus_message_read(reply, "o", &obj)) < 0)
            goto out;

        if (!is_device_path(adapter, obj))
        {
            if ((r = sd_bus_message_skip(reply, "a{sa{sv}}")) < 0)
                goto out;
            if ((r = sd_bus_message_exit_container(reply)) < 0)
                goto out;
            continue;
        }

        DeviceProps dev;
        dev.path = obj;
        bool is_dev = false;

        // --- Interfaces
        if ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{sa{sv}}")) < 0)
            goto out;
        while ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "sa{sv}")) > 0)
        {
            const char *iface = nullptr;
            if ((r = sd_bus_message_read(reply, "s", &iface)) < 0)
                goto out;
            if (iface && std::strcmp(iface, IFACE_DEVICE) == 0)
            {
                is_dev = true;
                r      = read_device_props(reply, dev);
            }
            else
            {
                r = sd_bus_message_skip(reply, "a{sv}");
            }
            if (r < 0)
                goto out;
            if ((r = sd_bus_message_exit_container(reply)) < 0)
                goto out;
        }
        if (r < 0)
            goto out;
        if ((r = sd_bus_message_exit_container(reply)) < 0)
            goto out;  // a{sa{sv}}
        if ((r = sd_bus_message_exit_container(reply)) < 0)
            goto out;  // dict-entry

        if (is_dev)
        {
            if (dev.address.empty())
                dev.address = path_to_mac(dev.path);
            out.push_back(std::move(dev));
        }
    }
    if (r >= 0)
        r = sd_bus_message_exit_container(reply);

out:
    if (reply)
        sd_bus_message_unref(reply);
    if (r < 0)
    {
        LOG_WARN("[BLUEZ] GetManagedObjects walk failed: %s", std::strerror(-r));
        return r;
    }
    return (int)out.size();
}

// ======================================================================
// Function: adapter_start_discovery
// - In: bus open, adapter_path valid
// - Out: true if discovery is running afterwards
// - Note: InProgress means another client already started it
// ======================================================================
bool adapter_start_discovery(sd_bus *bus, const std::string &adapter_path)
{
    if (!bus)
        return false;

    sd_bus_error    err{};
    sd_bus_message *rep = nullptr;
    int r = sd_bus_call_method(bus, SERVICE, adapter_path.c_str(), IFACE_ADAPTER,
                               "StartDiscovery", &err, &rep, "");
    if (rep)
        sd_bus_message_unref(rep);
    if (r < 0)
    {
        if (err.name && std::string(err.name) == "org.bluez.Error.InProgress")
        {
            LOG_INFO("[BLUEZ] StartDiscovery already in progress on %s", adapter_path.c_str());
            sd_bus_error_free(&err);
            return true;
        }
        LOG_WARN("[BLUEZ] StartDiscovery failed: %s", bus_err_text(err, r));
        sd_bus_error_free(&err);
        return false;
    }
    sd_bus_error_free(&err);
    LOG_INFO("[BLUEZ] StartDiscovery OK on %s", adapter_path.c_str());
    return true;
}

// ======================================================================
// Function: adapter_stop_discovery
// - In: bus open, adapter_path valid
// - Out: true if StopDiscovery succeeds or discovery was not running
// ======================================================================
bool adapter_stop_discovery(sd_bus *bus, const std::string &adapter_path)
{
    if (!bus)
        return false;

    sd_bus_error    err{};
    sd_bus_message *rep = nullptr;
    int r = sd_bus_call_method(bus, SERVICE, adapter_path.c_str(), IFACE_ADAPTER,
                               "StopDiscovery", &err, &rep, "");
    if (rep)
        sd_bus_message_unref(rep);
    if (r < 0)
    {
        // NotReady / Failed "No discovery started" are both fine here
        const bool idle = err.name && (std::string(err.name) == "org.bluez.Error.NotReady" ||
                                       std::string(err.name) == "org.bluez.Error.Failed");
        if (!idle)
            LOG_WARN("[BLUEZ] StopDiscovery failed: %s", bus_err_text(err, r));
        sd_bus_error_free(&err);
        return idle;
    }
    sd_bus_error_free(&err);
    LOG_INFO("[BLUEZ] StopDiscovery OK on %s", adapter_path.c_str());
    return true;
}

// ======================================================================
// Function: adapter_set_le_filter
// - In: bus open, adapter_path valid
// - Out: true on success
// - Note: no UUID filter, the coin controllers do not advertise ffe0
// ======================================================================
bool adapter_set_le_filter(sd_bus *bus, const std::string &adapter_path)
{
    if (!bus)
        return false;

    sd_bus_message *msg = nullptr, *rep = nullptr;
    sd_bus_error    err{};
    int r = sd_bus_message_new_method_call(bus, &msg, SERVICE, adapter_path.c_str(),
                                           IFACE_ADAPTER, "SetDiscoveryFilter");
    if (r < 0)
        goto out;

    r = sd_bus_message_open_container(msg, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0)
        goto out;
    r = append_dict_entry(msg, "Transport", "s", "le");
    if (r < 0)
        goto out;
    r = append_dict_entry(msg, "DuplicateData", "b", 0);
    if (r < 0)
        goto out;
    r = sd_bus_message_close_container(msg);  // a{sv}
    if (r < 0)
        goto out;

    r = sd_bus_call(bus, msg, 0, &err, &rep);
out:
    if (msg)
        sd_bus_message_unref(msg);
    if (rep)
        sd_bus_message_unref(rep);

    if (r < 0)
    {
        LOG_WARN("[BLUEZ] SetDiscoveryFilter failed: %s", bus_err_text(err, r));
        sd_bus_error_free(&err);
        return false;
    }
    sd_bus_error_free(&err);
    LOG_INFO("[BLUEZ] SetDiscoveryFilter OK (Transport=le)");
    return true;
}

}  // namespace bluez
