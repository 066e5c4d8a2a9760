#pragma once
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>

#include "conn/connection_manager.hpp"
#include "proto/coin_protocol.hpp"
#include "util/errors.hpp"

namespace app
{

enum class SessionState
{
    Idle,
    TicketScanned,
    RateRequested,
    AwaitingCoins,
    PaymentComplete
};

const char *session_state_name(SessionState s);

struct TicketSession
{
    std::uint32_t price          = 0;
    std::uint32_t coins_required = 0;
    std::uint32_t coins_received = 0;
    bool          rate_confirmed = false;
    bool          completed      = false;
};

// What the UI layer would render.
struct SessionSnapshot
{
    SessionState  state = SessionState::Idle;
    std::uint64_t id    = 0;  // 0 when idle
    TicketSession ticket{};
    std::uint32_t amount_inserted = 0;
    std::uint32_t coins_missing   = 0;
    std::uint32_t amount_missing  = 0;
};

// Owns the single payment session. Local actions (start, cancel, finalize) come from the operator
// thread, protocol events from the decode pump; both go through mu_.
class SessionController
{
  public:
    using Listener = std::function<void(const SessionSnapshot &)>;

    explicit SessionController(conn::ConnectionManager &conn);

    // SessionActive, InvalidPrice, NoActiveConnection or the send failure.
    // A failed send leaves the session in TicketScanned.
    parkterm::Err start_session(std::uint32_t price);
    parkterm::Err resend_rate();
    void          cancel();
    void          finalize();

    // No-op without a session, or when session_id names a session that has since been reset.
    void on_protocol_event(const proto::Event &ev, std::optional<std::uint64_t> session_id = {});

    proto::SessionView view() const;
    SessionSnapshot    snapshot() const;
    SessionState       state() const;
    bool               active() const;

    void set_listener(Listener l);
    // Called outside the lock whenever a session starts or ends (decoder buffer reset).
    void set_boundary_hook(std::function<void()> hook);

  private:
    parkterm::Err   send_rate(std::uint64_t id);
    void            reset(const char *why);
    SessionSnapshot snapshot_locked() const;
    void            publish(const SessionSnapshot &s);

    conn::ConnectionManager     &conn_;
    mutable std::mutex           mu_;
    std::optional<TicketSession> ticket_;
    SessionState                 state_{SessionState::Idle};
    std::uint64_t                id_{0};
    std::uint64_t                next_id_{1};
    Listener                     listener_;
    std::function<void()>        on_boundary_;
};

}  // namespace app
