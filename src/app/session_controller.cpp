#include <limits>

#include "app/session_controller.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace app
{
using parkterm::Err;

const char *session_state_name(SessionState s)
{
    switch (s)
    {
        case SessionState::Idle:
            return "idle";
        case SessionState::TicketScanned:
            return "ticket-scanned";
        case SessionState::RateRequested:
            return "rate-requested";
        case SessionState::AwaitingCoins:
            return "awaiting-coins";
        case SessionState::PaymentComplete:
            return "payment-complete";
    }
    return "?";
}

SessionController::SessionController(conn::ConnectionManager &conn) : conn_(conn) {}

void SessionController::set_listener(Listener l)
{
    std::lock_guard<std::mutex> lk(mu_);
    listener_ = std::move(l);
}

void SessionController::set_boundary_hook(std::function<void()> hook)
{
    std::lock_guard<std::mutex> lk(mu_);
    on_boundary_ = std::move(hook);
}

// Coins to money, saturating: overpayment may push the count past the price range.
static std::uint32_t coins_to_amount(std::uint32_t coins)
{
    const std::uint64_t v   = (std::uint64_t)coins * constants::COIN_DENOMINATION;
    const std::uint64_t cap = std::numeric_limits<std::uint32_t>::max();
    return (std::uint32_t)(v > cap ? cap : v);
}

SessionSnapshot SessionController::snapshot_locked() const
{
    SessionSnapshot s;
    s.state = state_;
    s.id    = id_;
    if (!ticket_)
        return s;

    const TicketSession &t = *ticket_;
    s.ticket = t;
    // on completion the ticket price is what was paid, not the coin total
    s.amount_inserted = t.completed ? t.price : coins_to_amount(t.coins_received);
    if (t.coins_received < t.coins_required)
        s.coins_missing = t.coins_required - t.coins_received;
    s.amount_missing = coins_to_amount(s.coins_missing);
    return s;
}

void SessionController::publish(const SessionSnapshot &s)
{
    Listener l;
    {
        std::lock_guard<std::mutex> lk(mu_);
        l = listener_;
    }
    if (l)
        l(s);
}

// ======================================================================
// Function: SessionController::start_session
// - In: price > 0, link up, no session
// - Out: session created in TicketScanned and the coin count sent
// - Note: RateRequested only after the transport acknowledged the write
// ======================================================================
Err SessionController::start_session(std::uint32_t price)
{
    if (price == 0)
    {
        LOG_WARN("[SESSION] refusing price 0");
        return Err::InvalidPrice;
    }
    if (proto::coins_for_price(price) == 0)
    {
        LOG_WARN("[SESSION] refusing price %u: no coin count to send", price);
        return Err::InvalidPrice;
    }
    if (active())
    {
        LOG_WARN("[SESSION] refusing new ticket, a session is already active");
        return Err::SessionActive;
    }
    if (!conn_.connected())
    {
        LOG_WARN("[SESSION] refusing ticket, no controller connected");
        return Err::NoActiveConnection;
    }

    std::function<void()> boundary;
    {
        std::lock_guard<std::mutex> lk(mu_);
        boundary = on_boundary_;
    }
    if (boundary)
        boundary();

    std::uint64_t   id = 0;
    SessionSnapshot snap;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (ticket_)
            return Err::SessionActive;
        TicketSession t;
        t.price          = price;
        t.coins_required = proto::coins_for_price(price);
        ticket_          = t;
        state_           = SessionState::TicketScanned;
        id_              = next_id_++;
        id               = id_;
        snap             = snapshot_locked();
    }
    LOG_SYSTEM("[SESSION] ticket scanned: price %u -> %u coins", price, snap.ticket.coins_required);
    publish(snap);

    return send_rate(id);
}

Err SessionController::send_rate(std::uint64_t id)
{
    std::uint32_t required = 0;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!ticket_ || id_ != id)
            return Err::NoSession;
        required = ticket_->coins_required;
    }

    // blocking, outside the lock: coins may be decoded meanwhile
    const Err e = conn_.send(proto::rate_command(required));

    SessionSnapshot snap;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!ticket_ || id_ != id)
        {
            LOG_INFO("[SESSION] session reset while the coin count was in flight");
            return e;
        }
        if (e != Err::Ok)
        {
            LOG_SYSTEM("[SESSION] sending coin count %u failed: %s (state %s, retry possible)",
                       required, parkterm::err_name(e), session_state_name(state_));
            return e;
        }
        if (state_ == SessionState::TicketScanned)
        {
            const bool ahead = ticket_->rate_confirmed || ticket_->coins_received > 0;
            state_           = ahead ? SessionState::AwaitingCoins : SessionState::RateRequested;
        }
        snap = snapshot_locked();
    }
    LOG_SYSTEM("[SESSION] coin count %u sent, state %s", required, session_state_name(snap.state));
    publish(snap);
    return Err::Ok;
}

Err SessionController::resend_rate()
{
    std::uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!ticket_)
            return Err::NoSession;
        if (state_ != SessionState::TicketScanned && state_ != SessionState::RateRequested)
        {
            LOG_WARN("[SESSION] resend refused in state %s", session_state_name(state_));
            return Err::WrongState;
        }
        id = id_;
    }
    return send_rate(id);
}

// ======================================================================
// Function: SessionController::on_protocol_event
// - In: event from the decoder, optionally tagged with the session it was decoded for
// - Out: counters and state advanced
// - Note: completion is re-checked here, the decoder's view may be one step old
// ======================================================================
void SessionController::on_protocol_event(const proto::Event &ev,
                                          std::optional<std::uint64_t> session_id)
{
    SessionSnapshot snap;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!ticket_)
        {
            LOG_DEBUG("[SESSION] %s without session ignored", proto::event_name(ev.kind));
            return;
        }
        if (session_id && *session_id != id_)
            return;

        TicketSession &t = *ticket_;
        switch (ev.kind)
        {
            case proto::EventKind::RateConfirmed:
                if (t.rate_confirmed)
                    return;
                t.rate_confirmed = true;
                if (state_ == SessionState::RateRequested)
                    state_ = SessionState::AwaitingCoins;
                LOG_SYSTEM("[SESSION] controller confirmed rate (%u coins)", t.coins_required);
                break;

            case proto::EventKind::CoinReceived:
                if (t.completed ||
                    t.coins_received == std::numeric_limits<std::uint32_t>::max())
                    return;
                ++t.coins_received;
                if (state_ == SessionState::RateRequested)
                    state_ = SessionState::AwaitingCoins;
                LOG_SYSTEM("[SESSION] coin inserted (%u/%u)", t.coins_received, t.coins_required);
                break;

            case proto::EventKind::PaymentComplete:
                if (t.completed || t.coins_received < t.coins_required)
                {
                    LOG_WARN("[SESSION] completion ignored (%u/%u coins, completed=%d)",
                             t.coins_received, t.coins_required, (int)t.completed);
                    return;
                }
                t.completed = true;
                state_      = SessionState::PaymentComplete;
                LOG_SYSTEM("[SESSION] payment complete: %u paid", t.price);
                break;
        }
        snap = snapshot_locked();
    }
    publish(snap);
}

void SessionController::reset(const char *why)
{
    bool                  had = false;
    SessionSnapshot       snap;
    std::function<void()> boundary;
    {
        std::lock_guard<std::mutex> lk(mu_);
        had = ticket_.has_value();
        ticket_.reset();
        state_   = SessionState::Idle;
        id_      = 0;
        snap     = snapshot_locked();
        boundary = on_boundary_;
    }
    if (boundary)
        boundary();
    if (!had)
        return;
    LOG_SYSTEM("[SESSION] session %s", why);
    publish(snap);
}

void SessionController::cancel()
{
    reset("cancelled");
}

void SessionController::finalize()
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (ticket_ && !ticket_->completed)
            LOG_WARN("[SESSION] finalizing an unpaid session (%u/%u coins)",
                     ticket_->coins_received, ticket_->coins_required);
    }
    reset("finalized");
}

proto::SessionView SessionController::view() const
{
    std::lock_guard<std::mutex> lk(mu_);
    proto::SessionView v;
    if (!ticket_)
        return v;
    v.active         = true;
    v.coins_required = ticket_->coins_required;
    v.coins_received = ticket_->coins_received;
    v.rate_confirmed = ticket_->rate_confirmed;
    v.completed      = ticket_->completed;
    v.session_id     = id_;
    return v;
}

SessionSnapshot SessionController::snapshot() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return snapshot_locked();
}

SessionState SessionController::state() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return state_;
}

bool SessionController::active() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return ticket_.has_value();
}

}  // namespace app
