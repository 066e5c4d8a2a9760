/*
 * SppTransport call flow
 *
 *  connect()
 *    └─ export Profile1 at /org/parkterm/sppN ──────────────────────────────────▶  ProfileManager1.RegisterProfile(role=client)
 *    └─ spawn bus loop
 *    └─ ConnectProfile(SPP) async ──────────────────────────────────────────────▶  Device1.ConnectProfile
 *    ◀── Profile1.NewConnection(device, fd) ─── dup fd, wake connect()
 *    └─ spawn reader (poll/read) ── bytes ──▶ on_rx, EOF/HUP ──▶ on_closed
 *
 *  send()       ::send + wait for TIOCOUTQ to drain
 *  disconnect() stop reader, close fd, DisconnectProfile, UnregisterProfile, close bus
 */
#include "transport/spp_transport.hpp"
#include "transport/bluez_dbus_util.hpp"
#include "util/log.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <mutex>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <unistd.h>

#include <systemd/sd-bus.h>

using parkterm::Err;

namespace transport
{

struct SppTransport::Impl
{
    sd_bus      *bus          = nullptr;
    sd_bus_slot *profile_slot = nullptr;  // Profile1 vtable
    sd_bus_slot *connect_slot = nullptr;  // ConnectProfile (async)

    // serialize all sd-bus access
    std::mutex       bus_mu;
    std::thread      loop;
    std::atomic_bool running{false};

    std::string      profile_path;
    std::atomic_bool profile_registered{false};

    // connection hand-off from NewConnection / ConnectProfile reply
    std::mutex              mu;
    std::condition_variable cv;
    int                     fd          = -1;
    bool                    reply_seen  = false;
    bool                    reply_ok    = false;
    std::string             reply_error;

    std::thread      reader;
    std::atomic_bool reading{false};
    std::mutex       write_mu;

    std::atomic<LinkState> state{LinkState::Disconnected};

    // inbound delivery, cleared by disconnect() before the socket goes away
    std::mutex rx_mu;
    OnChunk    on_rx;
    OnClosed   on_closed;
    bool       receiving = false;
};

namespace
{

std::atomic<unsigned> g_profile_seq{0};

std::chrono::steady_clock::time_point deadline_after(std::uint32_t ms)
{
    return std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
}

int spp_Release(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    static_cast<SppTransport *>(userdata)->on_release();
    return sd_bus_reply_method_return(m, "");
}

// NewConnection(o device, h fd, a{sv} fd_properties)
int spp_NewConnection(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto       *self = static_cast<SppTransport *>(userdata);
    const char *dev  = nullptr;
    int         fd   = -1;
    int         r    = sd_bus_message_read(m, "oh", &dev, &fd);
    if (r < 0)
        return r;
    r = sd_bus_message_skip(m, "a{sv}");
    if (r < 0)
        return r;

    if (!self->on_new_connection(dev ? dev : "", fd))
        return sd_bus_reply_method_errorf(m, "org.bluez.Error.Rejected", "unexpected connection");
    return sd_bus_reply_method_return(m, "");
}

int spp_RequestDisconnection(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto       *self = static_cast<SppTransport *>(userdata);
    const char *dev  = nullptr;
    int         r    = sd_bus_message_read(m, "o", &dev);
    if (r < 0)
        return r;
    self->on_request_disconnection(dev ? dev : "");
    return sd_bus_reply_method_return(m, "");
}

int spp_on_connect_reply(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto *self = static_cast<SppTransport *>(userdata);
    if (sd_bus_message_is_method_error(m, nullptr))
    {
        const sd_bus_error *e = sd_bus_message_get_error(m);
        std::string         msg;
        msg += (e && e->name) ? e->name : "unknown";
        msg += ": ";
        msg += (e && e->message) ? e->message : "no message";
        self->on_connect_reply(false, msg);
    }
    else
    {
        self->on_connect_reply(true, "");
    }
    return 1;
}

const sd_bus_vtable profile_vtable[] = {
    SD_BUS_VTABLE_START(0),
    SD_BUS_METHOD("Release", "", "", spp_Release, SD_BUS_VTABLE_UNPRIVILEGED),
    SD_BUS_METHOD("NewConnection", "oha{sv}", "", spp_NewConnection, SD_BUS_VTABLE_UNPRIVILEGED),
    SD_BUS_METHOD("RequestDisconnection",
                  "o",
                  "",
                  spp_RequestDisconnection,
                  SD_BUS_VTABLE_UNPRIVILEGED),
    SD_BUS_VTABLE_END};

}  // namespace

SppTransport::SppTransport(SppConfig cfg) : impl_(std::make_unique<Impl>()), cfg_(std::move(cfg))
{
    if (cfg_.dev_path.empty() && !cfg_.address.empty())
        cfg_.dev_path = bluez::mac_to_path(cfg_.adapter, cfg_.address);
    if (cfg_.address.empty())
        cfg_.address = bluez::path_to_mac(cfg_.dev_path);
    impl_->profile_path = "/org/parkterm/spp" + std::to_string(g_profile_seq.fetch_add(1));
}

SppTransport::~SppTransport()
{
    disconnect();
}

LinkState SppTransport::state() const
{
    return impl_->state.load();
}

// ======================================================================
// Function: SppTransport::on_new_connection
// - In: BlueZ handed us an RFCOMM socket for device
// - Out: true if adopted (fd duplicated, connect() woken)
// - Note: the fd in the message is owned by the message, so it is dup'ed
// ======================================================================
bool SppTransport::on_new_connection(const std::string &device, int fd)
{
    if (device != cfg_.dev_path)
    {
        LOG_WARN("[SPP] NewConnection for %s, expected %s", device.c_str(),
                 cfg_.dev_path.c_str());
        return false;
    }

    std::lock_guard<std::mutex> lk(impl_->mu);
    if (impl_->fd >= 0)
    {
        LOG_WARN("[SPP] second NewConnection for %s rejected", device.c_str());
        return false;
    }
    int own = fcntl(fd, F_DUPFD_CLOEXEC, 3);
    if (own < 0)
    {
        LOG_ERROR("[SPP] dup of RFCOMM fd failed: %s", std::strerror(errno));
        return false;
    }
    int fl = fcntl(own, F_GETFL, 0);
    if (fl >= 0)
        (void)fcntl(own, F_SETFL, fl | O_NONBLOCK);

    impl_->fd = own;
    impl_->cv.notify_all();
    LOG_INFO("[SPP] NewConnection on %s (fd=%d)", device.c_str(), own);
    return true;
}

void SppTransport::on_request_disconnection(const std::string &device)
{
    LOG_INFO("[SPP] RequestDisconnection for %s", device.c_str());
    {
        std::lock_guard<std::mutex> lk(impl_->mu);
        if (impl_->fd >= 0)
            ::shutdown(impl_->fd, SHUT_RDWR);  // reader sees EOF
    }
    fire_closed();
}

void SppTransport::on_release()
{
    // runs on the bus loop with bus_mu held
    LOG_INFO("[SPP] profile %s released by BlueZ", impl_->profile_path.c_str());
    impl_->profile_registered.store(false);
}

void SppTransport::on_connect_reply(bool ok, const std::string &error)
{
    std::lock_guard<std::mutex> lk(impl_->mu);
    impl_->reply_seen  = true;
    impl_->reply_ok    = ok;
    impl_->reply_error = error;
    impl_->cv.notify_all();
    if (ok)
        LOG_DEBUG("[SPP] ConnectProfile OK on %s", cfg_.dev_path.c_str());
    else
        LOG_WARN("[SPP] ConnectProfile failed: %s", error.c_str());
}

void SppTransport::fire_closed()
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
    if (impl_->state.load() == LinkState::Connected)
    {
        impl_->state.store(LinkState::Disconnected);
        LOG_SYSTEM("[SPP] link to %s dropped", cfg_.address.c_str());
    }
    if (cb)
        cb();
}

// ======================================================================
// Function: SppTransport::register_profile
// - In: bus open
// - Out: Profile1 exported and registered as an SPP client
// ======================================================================
bool SppTransport::register_profile()
{
    std::lock_guard<std::mutex> lk(impl_->bus_mu);

    int r = sd_bus_add_object_vtable(impl_->bus, &impl_->profile_slot,
                                     impl_->profile_path.c_str(), bluez::IFACE_PROFILE,
                                     profile_vtable, this);
    if (r < 0)
    {
        LOG_ERROR("[SPP] add Profile1 vtable failed: %s", std::strerror(-r));
        return false;
    }

    sd_bus_message *msg = nullptr, *rep = nullptr;
    sd_bus_error    err{};
    r = sd_bus_message_new_method_call(impl_->bus, &msg, bluez::SERVICE, "/org/bluez",
                                       bluez::IFACE_PROFILE_M, "RegisterProfile");
    if (r < 0)
        goto out;
    r = sd_bus_message_append(msg, "os", impl_->profile_path.c_str(),
                              constants::SPP_UUID.data());
    if (r < 0)
        goto out;
    r = sd_bus_message_open_container(msg, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0)
        goto out;
    r = bluez::append_dict_entry(msg, "Role", "s", "client");
    if (r < 0)
        goto out;
    r = bluez::append_dict_entry(msg, "Name", "s", "parkterm serial");
    if (r < 0)
        goto out;
    r = bluez::append_dict_entry(msg, "AutoConnect", "b", 0);
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
        LOG_ERROR("[SPP] RegisterProfile failed: %s", bluez::bus_err_text(err, r));
        sd_bus_error_free(&err);
        return false;
    }
    sd_bus_error_free(&err);
    impl_->profile_registered.store(true);
    LOG_DEBUG("[SPP] profile registered at %s", impl_->profile_path.c_str());
    return true;
}

// ======================================================================
// Function: SppTransport::reader_loop
// - In: fd adopted, reading set
// - Out: forwards every read to on_rx until EOF, error or disconnect()
// - Note: 100ms poll tick so disconnect() never waits long for the join
// ======================================================================
void SppTransport::reader_loop()
{
    int fd = -1;
    {
        std::lock_guard<std::mutex> lk(impl_->mu);
        fd = impl_->fd;
    }

    std::uint8_t buf[256];
    bool         lost = false;
    while (impl_->reading.load())
    {
        pollfd p{fd, POLLIN, 0};
        int    r = ::poll(&p, 1, 100);
        if (r < 0)
        {
            if (errno == EINTR)
                continue;
            LOG_WARN("[SPP] poll failed: %s", std::strerror(errno));
            lost = true;
            break;
        }
        if (r == 0)
            continue;

        if (p.revents & POLLIN)
        {
            ssize_t n = ::read(fd, buf, sizeof(buf));
            if (n > 0)
            {
                std::lock_guard<std::mutex> lk(impl_->rx_mu);
                if (impl_->receiving && impl_->on_rx)
                    impl_->on_rx(Chunk(buf, buf + n));
                continue;
            }
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR))
                continue;
            if (n < 0)
                LOG_WARN("[SPP] read failed: %s", std::strerror(errno));
            lost = true;
            break;
        }
        if (p.revents & (POLLHUP | POLLERR | POLLNVAL))
        {
            lost = true;
            break;
        }
    }
    if (lost && impl_->reading.load())
        fire_closed();
}

// ======================================================================
// Function: SppTransport::connect
// - In: fresh instance (Disconnected)
// - Out: Ok with the reader running, or the failure with everything released
// - Note: blocks for at most connect_timeout_ms
// ======================================================================
Err SppTransport::connect(OnChunk on_rx, OnClosed on_closed)
{
    LinkState expected = LinkState::Disconnected;
    if (!impl_->state.compare_exchange_strong(expected, LinkState::Connecting))
    {
        LOG_WARN("[SPP] connect on a %s link ignored", link_state_name(expected));
        return Err::ConnectFailed;
    }
    if (cfg_.dev_path.empty())
    {
        LOG_WARN("[SPP] no device path for '%s'", cfg_.address.c_str());
        impl_->state.store(LinkState::Failed);
        return Err::ConnectFailed;
    }

    const auto deadline = deadline_after(cfg_.connect_timeout_ms);
    LOG_INFO("[SPP] connecting to %s (timeout %ums)", cfg_.address.c_str(),
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
        LOG_ERROR("[SPP] failed to connect system bus: %s", std::strerror(-r));
        impl_->bus = nullptr;
        disconnect();
        impl_->state.store(LinkState::Failed);
        return Err::BusUnavailable;
    }

    if (!register_profile())
    {
        disconnect();
        impl_->state.store(LinkState::Failed);
        LOG_SYSTEM("[SPP] connect to %s failed: %s", cfg_.address.c_str(),
                   parkterm::err_name(Err::ConnectFailed));
        return Err::ConnectFailed;
    }

    // the loop has to run before ConnectProfile: NewConnection is a call into us
    impl_->running.store(true);
    impl_->loop = std::thread([this] {
        while (impl_->running.load(std::memory_order_relaxed))
        {
            {
                std::lock_guard<std::mutex> lk(impl_->bus_mu);
                while (sd_bus_process(impl_->bus, nullptr) > 0)
                {
                }
            }
            const uint64_t WAIT_USEC = 100000;  // 100ms
            if (sd_bus_wait(impl_->bus, WAIT_USEC) < 0 && !impl_->running.load())
                break;
        }
    });

    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        r = sd_bus_call_method_async(impl_->bus, &impl_->connect_slot, bluez::SERVICE,
                                     cfg_.dev_path.c_str(), bluez::IFACE_DEVICE, "ConnectProfile",
                                     spp_on_connect_reply, this, "s",
                                     constants::SPP_UUID.data());
    }

    Err e = Err::Ok;
    if (r < 0)
    {
        LOG_ERROR("[SPP] ConnectProfile submit failed: %s", std::strerror(-r));
        e = Err::ConnectFailed;
    }
    else
    {
        std::unique_lock<std::mutex> lk(impl_->mu);
        const bool done = impl_->cv.wait_until(lk, deadline, [this] {
            return impl_->fd >= 0 || (impl_->reply_seen && !impl_->reply_ok);
        });
        if (impl_->fd < 0)
            e = done ? Err::ConnectFailed : Err::ConnectTimeout;
    }

    if (e != Err::Ok)
    {
        disconnect();
        impl_->state.store(LinkState::Failed);
        LOG_SYSTEM("[SPP] connect to %s failed: %s", cfg_.address.c_str(), parkterm::err_name(e));
        return e;
    }

    impl_->reading.store(true);
    impl_->reader = std::thread([this] { reader_loop(); });
    impl_->state.store(LinkState::Connected);
    LOG_SYSTEM("[SPP] connected to %s", cfg_.address.c_str());
    return Err::Ok;
}

// ======================================================================
// Function: SppTransport::send
// - In: connected
// - Out: Ok once every byte is queued and the socket send queue drained
// - Note: the drain wait is bounded by drain_timeout_ms, a slow drain is not an error
// ======================================================================
Err SppTransport::send(std::string_view command)
{
    if (impl_->state.load() != LinkState::Connected)
        return Err::NotConnected;

    const Chunk                 frame = frame_command(command);
    std::lock_guard<std::mutex> wl(impl_->write_mu);
    int                         fd = -1;
    {
        std::lock_guard<std::mutex> lk(impl_->mu);
        fd = impl_->fd;
    }
    if (fd < 0)
        return Err::NotConnected;

    const auto  deadline = deadline_after(cfg_.drain_timeout_ms);
    std::size_t off      = 0;
    while (off < frame.size())
    {
        ssize_t n = ::send(fd, frame.data() + off, frame.size() - off, MSG_NOSIGNAL);
        if (n > 0)
        {
            off += (std::size_t)n;
            continue;
        }
        if (n < 0 && errno == EINTR)
            continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK) &&
            std::chrono::steady_clock::now() < deadline)
        {
            pollfd p{fd, POLLOUT, 0};
            (void)::poll(&p, 1, 100);
            continue;
        }
        LOG_WARN("[SPP] send failed after %zu/%zu bytes: %s", off, frame.size(),
                 n < 0 ? std::strerror(errno) : "timeout");
        return Err::SendFailed;
    }

    // wait until the kernel handed everything to the controller
    while (true)
    {
        int queued = 0;
        if (ioctl(fd, TIOCOUTQ, &queued) < 0 || queued <= 0)
            break;
        if (std::chrono::steady_clock::now() >= deadline)
        {
            LOG_DEBUG("[SPP] %d bytes still queued after write", queued);
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    LOG_DEBUG("[SPP] wrote %zu bytes", frame.size());
    return Err::Ok;
}

// ======================================================================
// Function: SppTransport::disconnect
// - In: any state, any thread except the bus loop and the reader
// - Out: inbound delivery stopped, socket closed, profile unregistered, bus released
// - Note: idempotent
// ======================================================================
void SppTransport::disconnect()
{
    if (!impl_)
        return;

    // 1. no callback into the owner from here on
    {
        std::lock_guard<std::mutex> lk(impl_->rx_mu);
        impl_->receiving = false;
        impl_->on_rx     = nullptr;
        impl_->on_closed = nullptr;
    }

    // 2. reader first, then the socket
    impl_->reading.store(false);
    if (impl_->reader.joinable())
        impl_->reader.join();

    bool had_link = false;
    {
        std::lock_guard<std::mutex> wl(impl_->write_mu);
        std::lock_guard<std::mutex> lk(impl_->mu);
        if (impl_->fd >= 0)
        {
            ::shutdown(impl_->fd, SHUT_RDWR);
            ::close(impl_->fd);
            impl_->fd = -1;
            had_link  = true;
        }
        impl_->reply_seen = false;
        impl_->reply_ok   = false;
    }

    if (!impl_->bus)
    {
        if (impl_->state.load() != LinkState::Failed)
            impl_->state.store(LinkState::Disconnected);
        return;
    }

    // 3. profile and bus, calls under the mutex
    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        bluez::unref_slot(impl_->connect_slot);
        if (had_link)
        {
            sd_bus_error    err{};
            sd_bus_message *rep = nullptr;
            int r = sd_bus_call_method(impl_->bus, bluez::SERVICE, cfg_.dev_path.c_str(),
                                       bluez::IFACE_DEVICE, "DisconnectProfile", &err, &rep, "s",
                                       constants::SPP_UUID.data());
            if (rep)
                sd_bus_message_unref(rep);
            if (r < 0)
                LOG_DEBUG("[SPP] DisconnectProfile: %s", bluez::bus_err_text(err, r));
            sd_bus_error_free(&err);
        }
        if (impl_->profile_registered.exchange(false))
        {
            sd_bus_error    err{};
            sd_bus_message *rep = nullptr;
            int r = sd_bus_call_method(impl_->bus, bluez::SERVICE, "/org/bluez",
                                       bluez::IFACE_PROFILE_M, "UnregisterProfile", &err, &rep,
                                       "o", impl_->profile_path.c_str());
            if (rep)
                sd_bus_message_unref(rep);
            if (r < 0)
                LOG_DEBUG("[SPP] UnregisterProfile: %s", bluez::bus_err_text(err, r));
            sd_bus_error_free(&err);
        }
        bluez::unref_slot(impl_->profile_slot);
        impl_->running.store(false);
        // wake the loop if it's in sd_bus_wait()
        sd_bus_close(impl_->bus);
    }

    // 4. join outside of the mutex
    if (impl_->loop.joinable())
        impl_->loop.join();
    release_bus();

    impl_->state.store(LinkState::Disconnected);
    LOG_INFO("[SPP] disconnected from %s", cfg_.address.c_str());
}

void SppTransport::release_bus()
{
    bluez::unref_slot(impl_->connect_slot);
    bluez::unref_slot(impl_->profile_slot);
    if (impl_->bus)
    {
        sd_bus_flush_close_unref(impl_->bus);
        impl_->bus = nullptr;
    }
}

}  // namespace transport
