/*
 * LeTransport call flow
 *
 *  connect()
 *    └─ sd_bus_open_system + match PropertiesChanged ───────────────────────────▶  org.bluez
 *    └─ connect_device ─────────────────────────────────────────────────────────▶  Device1.Connect
 *    └─ wait_services_resolved (pump bus until ServicesResolved=true)
 *    └─ find_uart_characteristic ───────────────────────────────────────────────▶  GetManagedObjects
 *    └─ start_notify ───────────────────────────────────────────────────────────▶  GattCharacteristic1.StartNotify
 *    └─ spawn bus loop
 *
 *  bus loop ◀── PropertiesChanged(Value)     ─── deliver_rx_bytes ──▶ on_rx
 *           ◀── PropertiesChanged(Connected=false) ── fire_closed ──▶ on_closed
 *
 *  send()   ──────────────────────────────────────────────────────────────────▶  GattCharacteristic1.WriteValue
 *  disconnect()
 *    └─ stop inbound delivery, StopNotify, Device1.Disconnect, close bus, join loop
 */
#include "transport/le_transport.hpp"
#include "transport/bluez_dbus_util.hpp"
#include "util/log.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <mutex>
#include <thread>
#include <vector>

#include <systemd/sd-bus.h>

using parkterm::Err;

namespace transport
{

struct LeTransport::Impl
{
    sd_bus      *bus        = nullptr;
    sd_bus_slot *props_slot = nullptr;

    // serialize all sd-bus access
    std::mutex  bus_mu;
    std::thread loop;

    std::atomic_bool       running{false};
    std::atomic_bool       connected{false};
    std::atomic_bool       services_resolved{false};
    std::atomic_bool       subscribed{false};
    std::atomic<LinkState> state{LinkState::Disconnected};

    std::string chr_path;  // remote UART characteristic (notify + write)

    // inbound delivery, cleared by disconnect() before the link goes down
    std::mutex rx_mu;
    OnChunk    on_rx;
    OnClosed   on_closed;
    bool       receiving = false;
};

namespace
{

std::uint64_t now_ms()
{
    using namespace std::chrono;
    return (std::uint64_t)duration_cast<milliseconds>(steady_clock::now().time_since_epoch())
        .count();
}

std::uint64_t remaining_usec(std::uint64_t deadline_ms)
{
    const std::uint64_t now = now_ms();
    return now >= deadline_ms ? 0 : (deadline_ms - now) * 1000ULL;
}

// drain everything queued on the bus; caller holds bus_mu
void process_pending(sd_bus *bus)
{
    while (sd_bus_process(bus, nullptr) > 0)
    {
    }
}

int le_on_props_changed(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto       *self  = static_cast<LeTransport *>(userdata);
    const char *iface = nullptr;
    int         r     = sd_bus_message_read(m, "s", &iface);
    if (r < 0)
        return r;

    const bool is_dev = iface && std::strcmp(iface, bluez::IFACE_DEVICE) == 0;
    const bool is_chr = iface && std::strcmp(iface, bluez::IFACE_GATT_CHR) == 0;
    if (!is_dev && !is_chr)
        return 0;

    bool        connected_hit = false, connected_val = false;
    bool        resolved_hit = false, resolved_val = false;
    bool        value_hit = false;
    const void *val_buf   = nullptr;
    size_t      val_len   = 0;

    r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0)
        return r;
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0)
    {
        const char *key = nullptr;
        if ((r = sd_bus_message_read(m, "s", &key)) < 0)
            return r;

        if (is_dev && key && std::strcmp(key, "Connected") == 0)
        {
            r             = bluez::read_var_b(m, connected_val);
            connected_hit = true;
        }
        else if (is_dev && key && std::strcmp(key, "ServicesResolved") == 0)
        {
            r            = bluez::read_var_b(m, resolved_val);
            resolved_hit = true;
        }
        else if (is_chr && key && std::strcmp(key, "Value") == 0)
        {
            r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "ay");
            if (r < 0)
                return r;
            r = sd_bus_message_read_array(m, 'y', &val_buf, &val_len);
            if (r < 0)
                return r;
            value_hit = true;
            r         = sd_bus_message_exit_container(m);
        }
        else
        {
            r = sd_bus_message_skip(m, "v");
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

    const char *path = sd_bus_message_get_path(m);
    if (!path)
        return 0;

    if (is_dev && self->config().dev_path == path)
    {
        if (resolved_hit)
            self->note_services_resolved(resolved_val);
        if (connected_hit)
            self->note_connected(connected_val);
    }
    if (value_hit && !self->chr_path().empty() && self->chr_path() == path && val_buf &&
        val_len)
    {
        LOG_DEBUG("[LE] notify on %s len=%zu", path, val_len);
        self->deliver_rx_bytes(static_cast<const std::uint8_t *>(val_buf), val_len);
    }
    return 0;
}

struct GattChr
{
    std::string path;
    std::string uuid;
    std::string service;
};

}  // namespace

LeTransport::LeTransport(LeConfig cfg) : impl_(std::make_unique<Impl>()), cfg_(std::move(cfg))
{
    if (cfg_.dev_path.empty() && !cfg_.address.empty())
        cfg_.dev_path = bluez::mac_to_path(cfg_.adapter, cfg_.address);
    if (cfg_.address.empty())
        cfg_.address = bluez::path_to_mac(cfg_.dev_path);
}

LeTransport::~LeTransport()
{
    disconnect();
}

LinkState LeTransport::state() const
{
    return impl_->state.load();
}

const std::string &LeTransport::chr_path() const
{
    return impl_->chr_path;
}

void LeTransport::note_services_resolved(bool v)
{
    impl_->services_resolved.store(v);
    LOG_DEBUG("[LE] ServicesResolved=%d on %s", (int)v, cfg_.dev_path.c_str());
}

void LeTransport::note_connected(bool v)
{
    const bool was = impl_->connected.exchange(v);
    if (was && !v)
    {
        impl_->subscribed.store(false);
        if (impl_->state.load() == LinkState::Connected)
        {
            LOG_SYSTEM("[LE] link to %s dropped", cfg_.address.c_str());
            fire_closed();
        }
    }
}

void LeTransport::deliver_rx_bytes(const std::uint8_t *data, std::size_t len)
{
    std::lock_guard<std::mutex> lk(impl_->rx_mu);
    if (!impl_->receiving || !impl_->on_rx)
        return;
    impl_->on_rx(Chunk(data, data + len));
}

void LeTransport::fire_closed()
{
    OnClosed cb;
    {
        std::lock_guard<std::mutex> lk(impl_->rx_mu);
        if (!impl_->receiving)
            return;
        impl_->receiving = false;
        impl_->on_rx     = nullptr;
        cb               = std::move(impl_->on_closed);
        impl_->on_closed = nullptr;
    }
    impl_->state.store(LinkState::Disconnected);
    if (cb)
        cb();
}

// ======================================================================
// Function: LeTransport::connect_device
// - In: bus open, cfg_.dev_path set
// - Out: Ok once Device1.Connect returns, ConnectTimeout past the deadline
// - Note: AlreadyConnected counts as success
// ======================================================================
Err LeTransport::connect_device(std::uint64_t deadline_ms)
{
    std::lock_guard<std::mutex> lk(impl_->bus_mu);

    sd_bus_message *msg = nullptr, *rep = nullptr;
    sd_bus_error    err{};
    int r = sd_bus_message_new_method_call(impl_->bus, &msg, bluez::SERVICE,
                                           cfg_.dev_path.c_str(), bluez::IFACE_DEVICE, "Connect");
    if (r < 0)
    {
        LOG_WARN("[LE] Connect new_method_call failed: %s", std::strerror(-r));
        return Err::ConnectFailed;
    }

    const std::uint64_t usec = remaining_usec(deadline_ms);
    r = usec ? sd_bus_call(impl_->bus, msg, usec, &err, &rep) : -ETIMEDOUT;
    sd_bus_message_unref(msg);
    if (rep)
        sd_bus_message_unref(rep);

    if (r < 0)
    {
        const char *ename = err.name ? err.name : "";
        Err         out   = Err::ConnectFailed;
        if (std::strcmp(ename, "org.bluez.Error.AlreadyConnected") == 0)
        {
            out = Err::Ok;
        }
        else if (r == -ETIMEDOUT || std::strcmp(ename, "org.freedesktop.DBus.Error.NoReply") == 0 ||
                 std::strcmp(ename, "org.freedesktop.DBus.Error.Timeout") == 0)
        {
            LOG_WARN("[LE] Device1.Connect timed out (%s)", cfg_.address.c_str());
            out = Err::ConnectTimeout;
        }
        else
        {
            LOG_WARN("[LE] Device1.Connect failed: %s: %s", *ename ? ename : "errno",
                     bluez::bus_err_text(err, r));
        }
        sd_bus_error_free(&err);
        if (out != Err::Ok)
            return out;
    }
    else
    {
        sd_bus_error_free(&err);
    }

    impl_->connected.store(true);
    LOG_INFO("[LE] Device1.Connect OK on %s", cfg_.dev_path.c_str());
    return Err::Ok;
}

// ======================================================================
// Function: LeTransport::wait_services_resolved
// - In: bus open, Connect succeeded
// - Out: Ok when GATT discovery finished, ConnectTimeout past the deadline
// - Note: pumps the bus itself, the loop thread is not running yet
// ======================================================================
Err LeTransport::wait_services_resolved(std::uint64_t deadline_ms)
{
    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        sd_bus_error err{};
        int          b = 0;
        int r = sd_bus_get_property_trivial(impl_->bus, bluez::SERVICE, cfg_.dev_path.c_str(),
                                            bluez::IFACE_DEVICE, "ServicesResolved", &err, 'b',
                                            &b);
        sd_bus_error_free(&err);
        if (r >= 0 && b)
            impl_->services_resolved.store(true);
    }

    while (!impl_->services_resolved.load())
    {
        const std::uint64_t usec = remaining_usec(deadline_ms);
        if (usec == 0)
        {
            LOG_WARN("[LE] services not resolved before deadline on %s", cfg_.address.c_str());
            return Err::ConnectTimeout;
        }
        {
            std::lock_guard<std::mutex> lk(impl_->bus_mu);
            process_pending(impl_->bus);
        }
        if (impl_->services_resolved.load())
            break;
        sd_bus_wait(impl_->bus, usec < 100000 ? usec : 100000);
    }
    LOG_INFO("[LE] ServicesResolved on %s", cfg_.dev_path.c_str());
    return Err::Ok;
}

// ======================================================================
// Function: LeTransport::find_uart_characteristic
// - In: services resolved
// - Out: true and chr_path set if a service matching svc_fragment carries a characteristic
//        matching chr_fragment
// - Note: UUIDs are matched by substring, case-insensitive
// ======================================================================
bool LeTransport::find_uart_characteristic()
{
    std::lock_guard<std::mutex> lk(impl_->bus_mu);

    sd_bus_message *reply = nullptr;
    sd_bus_error    err{};
    int r = sd_bus_call_method(impl_->bus, bluez::SERVICE, "/", bluez::IFACE_OBJ_MGR,
                               "GetManagedObjects", &err, &reply, "");
    if (r < 0)
    {
        LOG_WARN("[LE] GetManagedObjects failed: %s", bluez::bus_err_text(err, r));
        sd_bus_error_free(&err);
        if (reply)
            sd_bus_message_unref(reply);
        return false;
    }
    sd_bus_error_free(&err);

    const std::string        dev_prefix = cfg_.dev_path + "/";
    std::vector<std::string> services;  // paths of services matching svc_fragment
    std::vector<GattChr>     chrs;

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

        const std::string path(obj ? obj : "");
        if (path.rfind(dev_prefix, 0) != 0)
        {
            // skip subtree
            if ((r = sd_bus_message_skip(reply, "a{sa{sv}}")) < 0)
                goto out;
            if ((r = sd_bus_message_exit_container(reply)) < 0)
                goto out;
            continue;
        }

        // --- Interfaces
        if ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{sa{sv}}")) < 0)
            goto out;
        while ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "sa{sv}")) > 0)
        {
            const char *iface = nullptr;
            if ((r = sd_bus_message_read(reply, "s", &iface)) < 0)
                goto out;

            const bool is_svc = iface && std::strcmp(iface, bluez::IFACE_GATT_SVC) == 0;
            const bool is_chr = iface && std::strcmp(iface, bluez::IFACE_GATT_CHR) == 0;
            if (!is_svc && !is_chr)
            {
                if ((r = sd_bus_message_skip(reply, "a{sv}")) < 0)
                    goto out;
                if ((r = sd_bus_message_exit_container(reply)) < 0)
                    goto out;
                continue;
            }

            // --- Properties: UUID (s), Service (o, characteristics only)
            GattChr c;
            c.path = path;
            if ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{sv}")) < 0)
                goto out;
            while ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0)
            {
                const char *key = nullptr;
                if ((r = sd_bus_message_read(reply, "s", &key)) < 0)
                    goto out;
                if (key && std::strcmp(key, "UUID") == 0)
                    r = bluez::read_var_s(reply, c.uuid);
                else if (is_chr && key && std::strcmp(key, "Service") == 0)
                    r = bluez::read_var_o(reply, c.service);
                else
                    r = sd_bus_message_skip(reply, "v");
                if (r < 0)
                    goto out;
                if ((r = sd_bus_message_exit_container(reply)) < 0)
                    goto out;  // dict-entry
            }
            if (r < 0)
                goto out;
            if ((r = sd_bus_message_exit_container(reply)) < 0)
                goto out;  // a{sv}

            if (is_svc && bluez::icontains(c.uuid, cfg_.svc_fragment))
                services.push_back(path);
            else if (is_chr && bluez::icontains(c.uuid, cfg_.chr_fragment))
                chrs.push_back(std::move(c));

            if ((r = sd_bus_message_exit_container(reply)) < 0)
                goto out;  // dict-entry (interface)
        }
        if (r < 0)
            goto out;
        if ((r = sd_bus_message_exit_container(reply)) < 0)
            goto out;  // a{sa{sv}}
        if ((r = sd_bus_message_exit_container(reply)) < 0)
            goto out;  // dict-entry (object)
    }

out:
    if (reply)
        sd_bus_message_unref(reply);
    if (r < 0)
    {
        LOG_WARN("[LE] GATT walk failed: %s", std::strerror(-r));
        return false;
    }

    for (const auto &c : chrs)
    {
        for (const auto &s : services)
        {
            if (c.service == s)
            {
                impl_->chr_path = c.path;
                LOG_INFO("[LE] UART characteristic %s (%s) in %s", c.path.c_str(),
                         c.uuid.c_str(), s.c_str());
                return true;
            }
        }
    }
    LOG_WARN("[LE] no *%s* characteristic under a *%s* service on %s", cfg_.chr_fragment.c_str(),
             cfg_.svc_fragment.c_str(), cfg_.address.c_str());
    return false;
}

// ======================================================================
// Function: LeTransport::start_notify
// - In: chr_path found
// - Out: Ok once StartNotify succeeds
// - Note: transient failures (CCCD race, BlueZ busy) are retried until the deadline
// ======================================================================
Err LeTransport::start_notify(std::uint64_t deadline_ms)
{
    while (true)
    {
        sd_bus_error err{};
        int          r = 0;
        {
            std::lock_guard<std::mutex> lk(impl_->bus_mu);
            sd_bus_message *rep = nullptr;
            r = sd_bus_call_method(impl_->bus, bluez::SERVICE, impl_->chr_path.c_str(),
                                   bluez::IFACE_GATT_CHR, "StartNotify", &err, &rep, "");
            if (rep)
                sd_bus_message_unref(rep);
        }
        if (r >= 0)
        {
            sd_bus_error_free(&err);
            impl_->subscribed.store(true);
            LOG_INFO("[LE] notifications enabled on %s", impl_->chr_path.c_str());
            return Err::Ok;
        }

        const char *ename     = err.name ? err.name : "";
        const char *emsg      = err.message ? err.message : "";
        const bool  transient = std::strstr(emsg, "ATT error: 0x0e") != nullptr ||  // CCCD race
                               std::strcmp(ename, "org.freedesktop.DBus.Error.NoReply") == 0 ||
                               std::strcmp(ename, "org.bluez.Error.InProgress") == 0;
        if (!transient)
        {
            LOG_WARN("[LE] StartNotify failed: %s", *emsg ? emsg : std::strerror(-r));
            sd_bus_error_free(&err);
            return Err::ConnectFailed;
        }
        LOG_INFO("[LE] StartNotify transient failure (%s); retrying", *emsg ? emsg : ename);
        sd_bus_error_free(&err);

        if (remaining_usec(deadline_ms) < 200000)
            return Err::ConnectTimeout;
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
}

// ======================================================================
// Function: LeTransport::connect
// - In: fresh instance (Disconnected)
// - Out: Ok with the bus loop running, or the failure with everything released
// - Note: blocks for at most connect_timeout_ms
// ======================================================================
Err LeTransport::connect(OnChunk on_rx, OnClosed on_closed)
{
    LinkState expected = LinkState::Disconnected;
    if (!impl_->state.compare_exchange_strong(expected, LinkState::Connecting))
    {
        LOG_WARN("[LE] connect on a %s link ignored", link_state_name(expected));
        return Err::ConnectFailed;
    }
    if (cfg_.dev_path.empty())
    {
        LOG_WARN("[LE] no device path for '%s'", cfg_.address.c_str());
        impl_->state.store(LinkState::Failed);
        return Err::ConnectFailed;
    }

    const std::uint64_t deadline = now_ms() + cfg_.connect_timeout_ms;
    LOG_INFO("[LE] connecting to %s (timeout %ums)", cfg_.address.c_str(),
             cfg_.connect_timeout_ms);

    {
        std::lock_guard<std::mutex> lk(impl_->rx_mu);
        impl_->on_rx     = std::move(on_rx);
        impl_->on_closed = std::move(on_closed);
        impl_->receiving = true;
    }

    int r = sd_bus_open_system(&impl_->bus);
    if (r < 0 || !impl_->bus)
    {
        LOG_ERROR("[LE] failed to connect system bus: %s", std::strerror(-r));
        impl_->bus = nullptr;
        {
            std::lock_guard<std::mutex> lk(impl_->rx_mu);
            impl_->receiving = false;
            impl_->on_rx     = nullptr;
            impl_->on_closed = nullptr;
        }
        impl_->state.store(LinkState::Failed);
        return Err::BusUnavailable;
    }

    // PropertiesChanged (Device1.Connected / ServicesResolved, GattCharacteristic1.Value)
    r = sd_bus_match_signal(impl_->bus, &impl_->props_slot, bluez::SERVICE, nullptr,
                            bluez::IFACE_PROPS, "PropertiesChanged", le_on_props_changed, this);

    Err e = Err::ConnectFailed;
    if (r < 0)
        LOG_ERROR("[LE] subscribe to PropertiesChanged failed: %s", std::strerror(-r));
    else
        e = connect_device(deadline);
    if (e == Err::Ok)
        e = wait_services_resolved(deadline);
    if (e == Err::Ok && !find_uart_characteristic())
        e = Err::CharacteristicNotFound;
    if (e == Err::Ok)
        e = start_notify(deadline);

    if (e != Err::Ok)
    {
        {
            std::lock_guard<std::mutex> lk(impl_->rx_mu);
            impl_->receiving = false;
            impl_->on_rx     = nullptr;
            impl_->on_closed = nullptr;
        }
        if (impl_->connected.load())
        {
            std::lock_guard<std::mutex> lk(impl_->bus_mu);
            sd_bus_error    derr{};
            sd_bus_message *drep = nullptr;
            (void)sd_bus_call_method(impl_->bus, bluez::SERVICE, cfg_.dev_path.c_str(),
                                     bluez::IFACE_DEVICE, "Disconnect", &derr, &drep, "");
            if (drep)
                sd_bus_message_unref(drep);
            sd_bus_error_free(&derr);
        }
        release_bus();
        impl_->state.store(LinkState::Failed);
        LOG_SYSTEM("[LE] connect to %s failed: %s", cfg_.address.c_str(), parkterm::err_name(e));
        return e;
    }

    impl_->running.store(true);
    impl_->loop = std::thread([this] {
        while (impl_->running.load(std::memory_order_relaxed))
        {
            {
                std::lock_guard<std::mutex> lk(impl_->bus_mu);
                process_pending(impl_->bus);
            }
            // do not hold the lock while waiting, send() needs it
            const uint64_t WAIT_USEC = 100000;  // 100ms
            if (sd_bus_wait(impl_->bus, WAIT_USEC) < 0 && !impl_->running.load())
                break;
        }
    });

    impl_->state.store(LinkState::Connected);
    LOG_SYSTEM("[LE] connected to %s", cfg_.address.c_str());
    return Err::Ok;
}

// ======================================================================
// Function: LeTransport::write_value
// - In: connected and chr_path valid
// - Out: true if WriteValue (type=request, offset=0) is acknowledged
// - Note: disconnect() clears running under bus_mu, so a write either
//         finishes before teardown starts or sees running == false
// ======================================================================
bool LeTransport::write_value(const std::uint8_t *data, std::size_t len)
{
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (!impl_->running.load() || !impl_->bus || impl_->chr_path.empty())
    {
        LOG_DEBUG("[LE] WriteValue skipped: link is being torn down");
        return false;
    }

    sd_bus_message *msg = nullptr, *rep = nullptr;
    sd_bus_error    err{};
    int r = sd_bus_message_new_method_call(impl_->bus, &msg, bluez::SERVICE,
                                           impl_->chr_path.c_str(), bluez::IFACE_GATT_CHR,
                                           "WriteValue");
    if (r < 0)
        goto out;
    r = sd_bus_message_append_array(msg, 'y', data, len);
    if (r < 0)
        goto out;
    // options a{sv}: Write Request (expects ATT response) at offset 0
    r = sd_bus_message_open_container(msg, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0)
        goto out;
    r = bluez::append_dict_entry(msg, "type", "s", "request");
    if (r < 0)
        goto out;
    r = bluez::append_dict_entry(msg, "offset", "q", (uint16_t)0);
    if (r < 0)
        goto out;
    r = sd_bus_message_close_container(msg);  // a{sv}
    if (r < 0)
        goto out;

    r = sd_bus_call(impl_->bus, msg, 0, &err, &rep);
out:
    if (msg)
        sd_bus_message_unref(msg);
    if (rep)
        sd_bus_message_unref(rep);
    if (r < 0)
    {
        if (-r == EBADMSG)
        {
            // Some BlueZ builds surface EBADMSG despite a successful ATT write.
            LOG_INFO("[LE] WriteValue returned EBADMSG; treating as soft error (len=%zu)", len);
            sd_bus_error_free(&err);
            return true;
        }
        LOG_WARN("[LE] WriteValue failed: %s", bluez::bus_err_text(err, r));
        sd_bus_error_free(&err);
        return false;
    }
    sd_bus_error_free(&err);
    LOG_DEBUG("[LE] WriteValue OK (len=%zu)", len);
    return true;
}

Err LeTransport::send(std::string_view command)
{
    if (impl_->state.load() != LinkState::Connected)
        return Err::NotConnected;

    const Chunk frame = frame_command(command);
    if (!write_value(frame.data(), frame.size()))
        return Err::SendFailed;
    return Err::Ok;
}

// ======================================================================
// Function: LeTransport::disconnect
// - In: any state, any thread except the bus loop
// - Out: inbound delivery stopped, link closed, bus released
// - Note: idempotent; the loop is joined outside of bus_mu
// ======================================================================
void LeTransport::disconnect()
{
    if (!impl_)
        return;
    if (!impl_->bus)
    {
        if (impl_->state.load() != LinkState::Failed)
            impl_->state.store(LinkState::Disconnected);
        return;
    }

    // 1. no callback into the owner from here on
    {
        std::lock_guard<std::mutex> lk(impl_->rx_mu);
        impl_->receiving = false;
        impl_->on_rx     = nullptr;
        impl_->on_closed = nullptr;
    }

    // 2. unsubscribe and drop the link, bus calls under the mutex
    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        bluez::unref_slot(impl_->props_slot);
        if (impl_->subscribed.exchange(false))
        {
            sd_bus_error    err{};
            sd_bus_message *rep = nullptr;
            int r = sd_bus_call_method(impl_->bus, bluez::SERVICE, impl_->chr_path.c_str(),
                                       bluez::IFACE_GATT_CHR, "StopNotify", &err, &rep, "");
            if (rep)
                sd_bus_message_unref(rep);
            if (r < 0)
                LOG_DEBUG("[LE] StopNotify: %s", bluez::bus_err_text(err, r));
            sd_bus_error_free(&err);
        }
        {
            sd_bus_error    err{};
            sd_bus_message *rep = nullptr;
            int r = sd_bus_call_method(impl_->bus, bluez::SERVICE, cfg_.dev_path.c_str(),
                                       bluez::IFACE_DEVICE, "Disconnect", &err, &rep, "");
            if (rep)
                sd_bus_message_unref(rep);
            if (r < 0)
                LOG_DEBUG("[LE] Device1.Disconnect: %s", bluez::bus_err_text(err, r));
            sd_bus_error_free(&err);
        }
        impl_->running.store(false);
        // wake the loop if it's in sd_bus_wait()
        sd_bus_close(impl_->bus);
    }

    // 3. join outside of the mutex
    if (impl_->loop.joinable())
        impl_->loop.join();
    release_bus();

    impl_->connected.store(false);
    impl_->services_resolved.store(false);
    impl_->state.store(LinkState::Disconnected);
    LOG_INFO("[LE] disconnected from %s", cfg_.address.c_str());
}

// caller must not hold bus_mu
void LeTransport::release_bus()
{
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    bluez::unref_slot(impl_->props_slot);
    if (impl_->bus)
    {
        sd_bus_flush_close_unref(impl_->bus);
        impl_->bus = nullptr;
    }
}

}  // namespace transport
