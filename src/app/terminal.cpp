#include "app/terminal.hpp"
#include "app/ticket.hpp"

#include "util/log.hpp"

namespace app
{
using parkterm::Err;

Terminal::Terminal(conn::TransportFactory factory)
    : conn_(channel_, std::move(factory)), session_(conn_)
{
    conn_.set_teardown_hook([this] {
        std::lock_guard<std::mutex> lk(decode_mu_);
        decoder_.reset();
    });
    session_.set_boundary_hook([this] {
        std::lock_guard<std::mutex> lk(decode_mu_);
        decoder_.reset();
    });
}

Terminal::~Terminal()
{
    stop();
    conn_.disconnect();
    conn_.set_teardown_hook(nullptr);
    session_.set_boundary_hook(nullptr);
}

void Terminal::start()
{
    if (running_.exchange(true))
        return;
    channel_.resume();
    pump_ = std::thread([this] { pump_loop(); });
    LOG_DEBUG("[CONN] pump started");
}

void Terminal::stop()
{
    if (!running_.exchange(false))
        return;
    channel_.shutdown();
    if (pump_.joinable())
        pump_.join();
    LOG_DEBUG("[CONN] pump stopped");
}

void Terminal::pump_loop()
{
    while (running_.load())
        (void)pump_once(std::chrono::milliseconds(100));
}

// ======================================================================
// Function: Terminal::pump_once
// - In: any thread, but only one consumer at a time
// - Out: one chunk decoded and applied, or an implicit disconnect performed
// - Note: the epoch is re-checked under decode_mu_, teardown may have run since the pop
// ======================================================================
bool Terminal::pump_once(std::chrono::milliseconds wait)
{
    auto in = channel_.pop(wait);
    if (!in)
        return false;

    if (in->link_closed)
    {
        // not under decode_mu_: teardown takes it through the hook
        conn_.on_link_lost(in->epoch);
        return true;
    }

    std::lock_guard<std::mutex> lk(decode_mu_);
    if (!channel_.is_current(in->epoch))
    {
        LOG_DEBUG("[PROTO] dropped %zu bytes from a closed link", in->bytes.size());
        return true;
    }

    const proto::SessionView view = session_.view();
    const proto::Step        step = decoder_.feed(in->bytes, view);
    std::optional<std::uint64_t> sid;
    if (view.active)
        sid = view.session_id;
    for (const auto &ev : step.events)
        session_.on_protocol_event(ev, sid);
    return true;
}

Err Terminal::connect(const transport::DeviceDescriptor &d)
{
    return conn_.connect(d);
}

void Terminal::disconnect()
{
    conn_.disconnect();
}

Err Terminal::scan_ticket(std::string_view payload)
{
    if (!conn_.connected())
    {
        LOG_WARN("[TICKET] scanned without a controller connected; ticket kept");
        return Err::NoActiveConnection;
    }
    if (session_.active())
    {
        LOG_WARN("[TICKET] scanned while a session is active; ignored");
        return Err::SessionActive;
    }
    auto t = parse_ticket(payload);
    if (!t)
        return Err::InvalidTicket;

    if (t->id)
        LOG_INFO("[TICKET] ticket %u, price %u", *t->id, t->price);
    else
        LOG_INFO("[TICKET] ticket without id, price %u", t->price);
    return session_.start_session(t->price);
}

std::string Terminal::decoder_buffer()
{
    std::lock_guard<std::mutex> lk(decode_mu_);
    return decoder_.buffer();
}

}  // namespace app
