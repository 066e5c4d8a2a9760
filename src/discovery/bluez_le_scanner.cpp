/*
 * BluezLeScanner call flow
 *
 *  start()
 *    └─ match InterfacesAdded / PropertiesChanged
 *    └─ list_devices (cache of already known objects) ──────────────────────────▶  ObjectManager.GetManagedObjects
 *    └─ adapter_set_le_filter ──────────────────────────────────────────────────▶  Adapter1.SetDiscoveryFilter
 *    └─ adapter_start_discovery ────────────────────────────────────────────────▶  Adapter1.StartDiscovery
 *    └─ spawn bus loop (until deadline)
 *
 *  InterfacesAdded(Device1)            ─── note_device ──▶ on_advert
 *  PropertiesChanged(Device1 RSSI/Name) ── note_seen   ──▶ on_advert
 *
 *  deadline ─── StopDiscovery ──▶ on_done
 *  stop()   ─── StopDiscovery, close bus, join
 */
#include "discovery/bluez_sources.hpp"
#include "transport/bluez_dbus_util.hpp"
#include "util/log.hpp"

#include <atomic>
#include <cstring>
#include <mutex>
#include <thread>
#include <unordered_map>

#include <systemd/sd-bus.h>

namespace discovery
{
using parkterm::Err;

struct BluezLeScanner::Impl
{
    sd_bus      *bus        = nullptr;
    sd_bus_slot *added_slot = nullptr;
    sd_bus_slot *props_slot = nullptr;

    // serialize all sd-bus access
    std::mutex       bus_mu;
    std::thread      loop;
    std::atomic_bool running{false};
    std::atomic_bool discovery_on{false};

    std::string adapter_path;  // "/org/bluez/hci0"

    struct Known
    {
        std::string address;
        std::string name;
    };
    // Guarded by bus_mu: callbacks run under bus_mu.
    std::unordered_map<std::string, Known> known;

    OnAdvert on_advert;
    OnDone   on_done;
};

namespace
{

int scan_on_iface_added(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto       *self = static_cast<BluezLeScanner *>(userdata);
    const char *obj  = nullptr;
    int         r    = sd_bus_message_read(m, "o", &obj);
    if (r < 0 || !obj)
        return r < 0 ? r : -EINVAL;
    if (!bluez::is_device_path(self->adapter(), obj))
        return 0;

    bluez::DeviceProps dev;
    bool               is_dev = false;

    r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sa{sv}}");
    if (r < 0)
        return r;
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sa{sv}")) > 0)
    {
        const char *iface = nullptr;
        if ((r = sd_bus_message_read(m, "s", &iface)) < 0)
            return r;
        if (iface && std::strcmp(iface, bluez::IFACE_DEVICE) == 0)
        {
            is_dev = true;
            r      = bluez::read_device_props(m, dev);
        }
        else
        {
            r = sd_bus_message_skip(m, "a{sv}");
        }
        if (r < 0)
            return r;
        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;
    }
    if (r < 0)
        return r;
    if ((r = sd_bus_message_exit_container(m)) < 0)
        return r;

    if (is_dev)
        self->note_device(obj, dev.address, dev.name);
    return 0;
}

int scan_on_props_changed(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto       *self  = static_cast<BluezLeScanner *>(userdata);
    const char *iface = nullptr;
    int         r     = sd_bus_message_read(m, "s", &iface);
    if (r < 0)
        return r;
    if (!iface || std::strcmp(iface, bluez::IFACE_DEVICE) != 0)
        return 0;

    const char *path = sd_bus_message_get_path(m);
    if (!bluez::is_device_path(self->adapter(), path))
        return 0;

    bool        seen     = false;  // RSSI updates mean an advertisement was just received
    bool        name_hit = false;
    std::string name;

    r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0)
        return r;
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0)
    {
        const char *key = nullptr;
        if ((r = sd_bus_message_read(m, "s", &key)) < 0)
            return r;
        if (key && std::strcmp(key, "Name") == 0)
        {
            r        = bluez::read_var_s(m, name);
            name_hit = true;
        }
        else
        {
            if (key && std::strcmp(key, "RSSI") == 0)
                seen = true;
            r = sd_bus_message_skip(m, "v");
        }
        if (r < 0)
            return r;
        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;
    }
    if (r < 0)
        return r;

    if (seen || name_hit)
        self->note_seen(path, name_hit ? &name : nullptr);
    return 0;
}

}  // namespace

BluezLeScanner::BluezLeScanner(std::string adapter)
    : impl_(std::make_unique<Impl>()), adapter_(std::move(adapter))
{
    impl_->adapter_path = "/org/bluez/" + adapter_;
}

BluezLeScanner::~BluezLeScanner()
{
    stop();
}

bool BluezLeScanner::scanning() const
{
    return impl_->running.load();
}

// bus_mu held (bus loop)
void BluezLeScanner::note_device(const std::string &path,
                                 const std::string &address,
                                 const std::string &name)
{
    auto &k = impl_->known[path];
    k.address = address.empty() ? bluez::path_to_mac(path) : address;
    if (!name.empty())
        k.name = name;
    LOG_DEBUG("[SCAN] new object %s addr=%s name='%s'", path.c_str(), k.address.c_str(),
              k.name.c_str());
    if (impl_->on_advert && impl_->running.load())
        impl_->on_advert(Advert{k.address, k.name, path});
}

// bus_mu held (bus loop)
void BluezLeScanner::note_seen(const std::string &path, const std::string *name)
{
    auto &k = impl_->known[path];
    if (k.address.empty())
        k.address = bluez::path_to_mac(path);
    if (name)
        k.name = *name;
    if (impl_->on_advert && impl_->running.load())
        impl_->on_advert(Advert{k.address, k.name, path});
}

// ======================================================================
// Function: BluezLeScanner::start
// - In: timeout, callbacks
// - Out: Ok with discovery running on the adapter, ScanFailed / BusUnavailable otherwise
// - Note: a previous scan that already timed out is cleaned up first
// ======================================================================
Err BluezLeScanner::start(std::chrono::milliseconds timeout, OnAdvert on_advert, OnDone on_done)
{
    if (impl_->running.load())
        return Err::Ok;
    teardown();

    int r = sd_bus_open_system(&impl_->bus);
    if (r < 0 || !impl_->bus)
    {
        LOG_ERROR("[SCAN] failed to connect system bus: %s", std::strerror(-r));
        impl_->bus = nullptr;
        return Err::BusUnavailable;
    }

    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        impl_->on_advert = std::move(on_advert);
        impl_->on_done   = std::move(on_done);

        r = sd_bus_match_signal(impl_->bus, &impl_->added_slot, bluez::SERVICE, "/",
                                bluez::IFACE_OBJ_MGR, "InterfacesAdded", scan_on_iface_added,
                                this);
        if (r >= 0)
            r = sd_bus_match_signal(impl_->bus, &impl_->props_slot, bluez::SERVICE, nullptr,
                                    bluez::IFACE_PROPS, "PropertiesChanged",
                                    scan_on_props_changed, this);
        if (r < 0)
            LOG_ERROR("[SCAN] signal subscription failed: %s", std::strerror(-r));

        // names of objects BlueZ already knows, so RSSI-only updates still carry a name
        std::vector<bluez::DeviceProps> cached;
        if (r >= 0 && bluez::list_devices(impl_->bus, adapter_, cached) >= 0)
        {
            for (auto &d : cached)
                impl_->known[d.path] = Impl::Known{d.address, d.name};
        }

        if (r >= 0)
        {
            (void)bluez::adapter_set_le_filter(impl_->bus, impl_->adapter_path);
            if (bluez::adapter_start_discovery(impl_->bus, impl_->adapter_path))
                impl_->discovery_on.store(true);
        }
    }
    if (!impl_->discovery_on.load())
    {
        teardown();
        return Err::ScanFailed;
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    impl_->running.store(true);
    impl_->loop = std::thread([this, deadline] {
        bool expired = false;
        while (impl_->running.load(std::memory_order_relaxed))
        {
            {
                std::lock_guard<std::mutex> lk(impl_->bus_mu);
                while (sd_bus_process(impl_->bus, nullptr) > 0)
                {
                }
                if (std::chrono::steady_clock::now() >= deadline)
                {
                    if (impl_->discovery_on.exchange(false))
                        (void)bluez::adapter_stop_discovery(impl_->bus, impl_->adapter_path);
                    expired = true;
                    break;
                }
            }
            // do not hold the lock while waiting, stop() needs it
            const uint64_t WAIT_USEC = 100000;  // 100ms
            if (sd_bus_wait(impl_->bus, WAIT_USEC) < 0 && !impl_->running.load())
                break;
        }
        if (expired && impl_->running.exchange(false))
        {
            LOG_INFO("[SCAN] LE scan timed out");
            if (impl_->on_done)
                impl_->on_done();
        }
    });
    LOG_INFO("[SCAN] LE scan on %s for %lld ms", impl_->adapter_path.c_str(),
             (long long)timeout.count());
    return Err::Ok;
}

void BluezLeScanner::stop()
{
    if (impl_->running.exchange(false))
        LOG_INFO("[SCAN] LE scan cancelled");
    teardown();
}

// ======================================================================
// Function: BluezLeScanner::teardown
// - In: running already false
// - Out: discovery stopped, bus closed, loop joined
// - Note: joins outside of bus_mu
// ======================================================================
void BluezLeScanner::teardown()
{
    if (impl_->bus)
    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        if (impl_->discovery_on.exchange(false))
            (void)bluez::adapter_stop_discovery(impl_->bus, impl_->adapter_path);
        // wake the loop if it's in sd_bus_wait()
        sd_bus_close(impl_->bus);
    }
    if (impl_->loop.joinable())
        impl_->loop.join();

    bluez::unref_slot(impl_->added_slot);
    bluez::unref_slot(impl_->props_slot);
    if (impl_->bus)
    {
        sd_bus_flush_close_unref(impl_->bus);
        impl_->bus = nullptr;
    }
    impl_->known.clear();
    impl_->on_advert = nullptr;
    impl_->on_done   = nullptr;
}

}  // namespace discovery
