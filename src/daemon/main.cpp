#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "app/terminal.hpp"
#include "app/ticket.hpp"
#include "conn/transport_factory.hpp"
#include "ctl/ipc.hpp"
#include "discovery/bluez_sources.hpp"
#include "discovery/device_discovery.hpp"
#include "discovery/simulated_sources.hpp"
#include "transport/loopback_transport.hpp"
#include "util/config.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

using parkterm::Err;

namespace
{

// Everything the command handler works on; owned by main().
struct Daemon
{
    parkterm::Config            cfg;
    app::Terminal              *term = nullptr;
    discovery::DeviceDiscovery *disc = nullptr;

    // loopback mode: the link created last, for SIM/DROP
    std::mutex                                  loop_mu;
    std::weak_ptr<transport::LoopbackTransport> loop_link;
};

}  // namespace

// ---------------- helpers ----------------
static bool is_valid_mac(const std::string &mac)
{
    if (mac.size() != 17)
        return false;
    for (size_t i = 0; i < mac.size(); ++i)
    {
        if ((i % 3) == 2)
        {
            if (mac[i] != ':')
                return false;
        }
        else
        {
            unsigned char c = static_cast<unsigned char>(mac[i]);
            if (!std::isxdigit(c))
                return false;
        }
    }
    return true;
}

static std::string normalize_mac(std::string mac)
{
    std::transform(mac.begin(), mac.end(), mac.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return mac;
}

static std::string trim(const std::string &s)
{
    auto l = s.find_first_not_of(" \t\r");
    if (l == std::string::npos)
        return std::string{};
    auto r = s.find_last_not_of(" \t\r");
    return s.substr(l, r - l + 1);
}

// argument of "VERB <arg>", empty if none
static std::string arg_of(const std::string &line, size_t verb_len)
{
    return line.size() > verb_len ? trim(line.substr(verb_len)) : std::string{};
}

// snprintf result clamped to what landed in buf
static size_t printed(int n, size_t cap)
{
    if (n <= 0)
        return 0;
    return std::min((size_t)n, cap - 1);
}

static std::string result(Err e)
{
    if (e == Err::Ok)
        return "ok";
    return std::string("error: ") + parkterm::err_name(e);
}

static std::string status_text(Daemon &d)
{
    const auto snap = d.term->session().snapshot();
    const auto dev  = d.term->connection().active_device();

    char buf[512];
    int  n = std::snprintf(buf, sizeof(buf), "link: %s",
                           transport::link_state_name(d.term->connection().state()));
    std::string out(buf, printed(n, sizeof(buf)));
    if (dev)
        out += " " + dev->address + " '" + dev->name + "' (" + transport::kind_name(dev->kind) +
               ")";
    out += "\n";

    n = std::snprintf(buf, sizeof(buf), "session: %s", app::session_state_name(snap.state));
    out.append(buf, printed(n, sizeof(buf)));
    if (snap.state != app::SessionState::Idle)
    {
        n = std::snprintf(buf, sizeof(buf),
                          " #%llu price=%u coins=%u/%u inserted=%u missing=%u (%u coins)%s",
                          (unsigned long long)snap.id, snap.ticket.price,
                          snap.ticket.coins_received, snap.ticket.coins_required,
                          snap.amount_inserted, snap.amount_missing, snap.coins_missing,
                          snap.ticket.rate_confirmed ? " rate-confirmed" : "");
        out.append(buf, printed(n, sizeof(buf)));
    }
    out += "\n";
    out += "scan: ";
    out += d.disc->scanning() ? "running" : "idle";
    return out;
}

static std::string devices_text(Daemon &dm)
{
    auto devs = dm.disc->devices();
    if (devs.empty())
        return "no devices";
    std::string out;
    for (const auto &d : devs)
    {
        if (!out.empty())
            out += "\n";
        out += d.address + " '" + d.name + "' (" + transport::kind_name(d.kind) + ")";
    }
    return out;
}

static std::shared_ptr<transport::LoopbackTransport> loop_link(Daemon &d)
{
    std::lock_guard<std::mutex> lk(d.loop_mu);
    return d.loop_link.lock();
}

// ======================================================================
// Function: on_line
// - In: one command line from the control socket
// - Out: short reply for parktermctl; outcomes also logged at System level
// ======================================================================
static std::string on_line(Daemon &d, const std::string &line)
{
    LOG_DEBUG("[CMD] %s", line.c_str());

    if (line == "QUIT")
    {
        LOG_SYSTEM("[CMD] QUIT received, shutting down");
        return "bye";
    }
    if (line == "SCAN")
    {
        Err e = d.disc->scan();
        return result(e);
    }
    if (line == "STOPSCAN")
    {
        d.disc->stop_scan();
        return "ok";
    }
    if (line == "DEVICES")
        return devices_text(d);
    if (line == "STATUS")
        return status_text(d);
    if (line.rfind("CONNECT", 0) == 0)
    {
        std::string mac = normalize_mac(arg_of(line, 7));
        if (!is_valid_mac(mac))
        {
            LOG_WARN("[CMD] CONNECT: invalid MAC address '%s'", mac.c_str());
            return "error: invalid MAC address";
        }
        auto dev = d.disc->find(mac);
        if (!dev)
        {
            LOG_WARN("[CMD] CONNECT: %s is not in the device list, scan first", mac.c_str());
            return "error: unknown device";
        }
        d.disc->stop_scan();
        Err e = d.term->connect(*dev);
        if (e != Err::Ok)
            LOG_SYSTEM("[CMD] connect to %s failed: %s", mac.c_str(), parkterm::err_name(e));
        return result(e);
    }
    if (line == "DISCONNECT")
    {
        d.term->disconnect();
        return "ok";
    }
    if (line.rfind("TICKET", 0) == 0)
    {
        std::string payload = arg_of(line, 6);
        if (payload.empty())
            return "error: empty ticket payload";
        return result(d.term->scan_ticket(payload));
    }
    if (line == "ISSUE")
    {
        auto t = app::issue_ticket();
        if (!t || !t->id)
            return "error: cannot issue a ticket";
        std::string payload = app::format_ticket(*t->id, t->price);
        Err         e       = d.term->scan_ticket(payload);
        if (e != Err::Ok)
            return result(e);
        return "ok " + payload;
    }
    if (line == "RESEND")
        return result(d.term->session().resend_rate());
    if (line == "CANCEL")
    {
        d.term->session().cancel();
        return "ok";
    }
    if (line == "FINALIZE")
    {
        d.term->session().finalize();
        return "ok";
    }
    if (line.rfind("SIM ", 0) == 0 || line == "DROP")
    {
        if (d.cfg.mode != parkterm::TransportMode::Loopback)
            return "error: only available with PARKTERM_TRANSPORT=loopback";
        auto link = loop_link(d);
        if (!link)
            return result(Err::NoActiveConnection);
        if (line == "DROP")
        {
            link->drop_link();
            LOG_SYSTEM("[CMD] simulated link loss");
            return "ok";
        }
        // SIM keeps inner spaces, the controller bytes are sent as typed
        if (!link->inject(line.substr(4)))
            return result(Err::NotConnected);
        return "ok";
    }

    LOG_WARN("[CMD] unknown command: %s", line.c_str());
    return "error: unknown command";
}

// ---------------- backends ----------------
static conn::TransportFactory make_loopback_factory(Daemon &dm)
{
    return [&dm](const transport::DeviceDescriptor &d) -> std::shared_ptr<transport::ITransport> {
        auto link = std::make_shared<transport::LoopbackTransport>(d.kind);
        {
            std::lock_guard<std::mutex> lk(dm.loop_mu);
            dm.loop_link = link;
        }
        return link;
    };
}

static std::vector<discovery::Advert> bench_le_devices()
{
    return {{"00:00:00:00:00:01", "PARKTERM-SIM-LE", "loopback/le"}};
}

static std::vector<discovery::Advert> bench_bonded_devices()
{
    return {{"00:00:00:00:00:02", "PARKTERM-SIM-SPP", "loopback/spp"}};
}

int main()
{
    Daemon dm;
    dm.cfg = parkterm::load_config_from_env();
    const bool loopback = dm.cfg.mode == parkterm::TransportMode::Loopback;
    LOG_SYSTEM("Config: transport=%s adapter=%s scan=%ums connect=%ums",
               loopback ? "loopback" : "bluez", dm.cfg.adapter.c_str(), dm.cfg.scan_timeout_ms,
               dm.cfg.connect_timeout_ms);

    std::unique_ptr<discovery::ILeScanner>    le;
    std::unique_ptr<discovery::IBondedSource> bonded;
    conn::TransportFactory                    factory;
    if (loopback)
    {
        le      = std::make_unique<discovery::SimulatedLeScanner>(bench_le_devices());
        bonded  = std::make_unique<discovery::SimulatedBondedSource>(bench_bonded_devices());
        factory = make_loopback_factory(dm);
    }
    else
    {
        le      = std::make_unique<discovery::BluezLeScanner>(dm.cfg.adapter);
        bonded  = std::make_unique<discovery::BluezBondedSource>(dm.cfg.adapter);
        factory = conn::make_bluez_factory(dm.cfg);
    }

    discovery::DeviceDiscovery disc(*le, *bonded,
                                    std::chrono::milliseconds(dm.cfg.scan_timeout_ms));
    disc.set_listener([](const std::vector<transport::DeviceDescriptor> &devs) {
        LOG_DEBUG("[SCAN] catalog now has %zu device(s)", devs.size());
    });
    dm.disc = &disc;

    app::Terminal term(std::move(factory));
    term.session().set_listener([](const app::SessionSnapshot &s) {
        LOG_INFO("[SESSION] %s: inserted %u, missing %u", app::session_state_name(s.state),
                 s.amount_inserted, s.amount_missing);
    });
    term.start();
    dm.term = &term;

    // IPC server
    std::string sock = dm.cfg.ctl_sock.empty() ? constants::ctl_sock_path() : dm.cfg.ctl_sock;
    sock             = ipc::expand_user(sock);

    const bool served =
        ipc::start_server(sock, [&dm](const std::string &line) { return on_line(dm, line); });
    if (!served)
        LOG_ERROR("start_server failed");

    disc.stop_scan();
    term.stop();
    term.disconnect();
    dm.term = nullptr;
    dm.disc = nullptr;
    return served ? 0 : 1;
}
