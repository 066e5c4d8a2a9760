#include <gtest/gtest.h>
#include <memory>
#include <vector>

#include "app/session_controller.hpp"
#include "conn/chunk_channel.hpp"
#include "conn/connection_manager.hpp"
#include "transport/loopback_transport.hpp"

using app::SessionController;
using app::SessionSnapshot;
using app::SessionState;
using parkterm::Err;
using proto::Event;
using proto::EventKind;

namespace
{

struct SessionFixture : public ::testing::Test
{
    conn::ChunkChannel                             channel;
    std::shared_ptr<transport::LoopbackTransport>  link;
    std::unique_ptr<conn::ConnectionManager>       conn;
    std::unique_ptr<SessionController>             session;

    void SetUp() override
    {
        conn = std::make_unique<conn::ConnectionManager>(
            channel, [this](const transport::DeviceDescriptor &d) {
                link = std::make_shared<transport::LoopbackTransport>(d.kind);
                return link;
            });
        session = std::make_unique<SessionController>(*conn);
    }

    void connect()
    {
        transport::DeviceDescriptor d{"HM-10", "11:22:33:44:55:66", transport::Kind::Ble, "h"};
        ASSERT_EQ(conn->connect(d), Err::Ok);
    }

    void event(EventKind k) { session->on_protocol_event(Event{k}); }
};

}  // namespace

TEST_F(SessionFixture, StartSendsCoinCountAndRequestsRate)
{
    connect();
    ASSERT_EQ(session->start_session(42), Err::Ok);

    EXPECT_EQ(session->state(), SessionState::RateRequested);
    auto snap = session->snapshot();
    EXPECT_EQ(snap.ticket.price, 42u);
    EXPECT_EQ(snap.ticket.coins_required, 9u);
    EXPECT_EQ(snap.ticket.coins_received, 0u);
    EXPECT_NE(snap.id, 0u);

    ASSERT_EQ(link->sent().size(), 1u);
    EXPECT_EQ(link->sent()[0], "9");
    ASSERT_EQ(link->sent_raw().size(), 1u);
    EXPECT_EQ(link->sent_raw()[0], (transport::Chunk{'9', '\r', '\n'}));
}

TEST_F(SessionFixture, RefusesWithoutConnection)
{
    EXPECT_EQ(session->start_session(10), Err::NoActiveConnection);
    EXPECT_FALSE(session->active());
    EXPECT_EQ(session->state(), SessionState::Idle);
}

TEST_F(SessionFixture, RefusesZeroPrice)
{
    connect();
    EXPECT_EQ(session->start_session(0), Err::InvalidPrice);
    EXPECT_FALSE(session->active());
}

TEST_F(SessionFixture, SecondStartLeavesExistingSessionUntouched)
{
    connect();
    ASSERT_EQ(session->start_session(10), Err::Ok);
    event(EventKind::CoinReceived);
    const auto before = session->snapshot();

    EXPECT_EQ(session->start_session(45), Err::SessionActive);
    EXPECT_TRUE(parkterm::is_state_violation(Err::SessionActive));

    const auto after = session->snapshot();
    EXPECT_EQ(after.id, before.id);
    EXPECT_EQ(after.ticket.price, 10u);
    EXPECT_EQ(after.ticket.coins_received, 1u);
    EXPECT_EQ(link->sent().size(), 1u);
}

TEST_F(SessionFixture, FullPaymentFlow)
{
    connect();
    ASSERT_EQ(session->start_session(10), Err::Ok);

    event(EventKind::RateConfirmed);
    EXPECT_EQ(session->state(), SessionState::AwaitingCoins);

    event(EventKind::CoinReceived);
    auto snap = session->snapshot();
    EXPECT_EQ(snap.amount_inserted, 5u);
    EXPECT_EQ(snap.coins_missing, 1u);
    EXPECT_EQ(snap.amount_missing, 5u);

    event(EventKind::CoinReceived);
    event(EventKind::PaymentComplete);
    snap = session->snapshot();
    EXPECT_EQ(snap.state, SessionState::PaymentComplete);
    EXPECT_TRUE(snap.ticket.completed);
    EXPECT_EQ(snap.amount_inserted, 10u);
    EXPECT_EQ(snap.coins_missing, 0u);

    session->finalize();
    EXPECT_EQ(session->state(), SessionState::Idle);
    EXPECT_FALSE(session->active());
}

TEST_F(SessionFixture, CoinsWithoutAckMoveToAwaitingCoins)
{
    connect();
    ASSERT_EQ(session->start_session(15), Err::Ok);
    ASSERT_EQ(session->state(), SessionState::RateRequested);

    event(EventKind::CoinReceived);
    EXPECT_EQ(session->state(), SessionState::AwaitingCoins);
    EXPECT_FALSE(session->snapshot().ticket.rate_confirmed);
}

TEST_F(SessionFixture, CompletionRefusedBelowRequired)
{
    connect();
    ASSERT_EQ(session->start_session(15), Err::Ok);
    event(EventKind::CoinReceived);
    event(EventKind::PaymentComplete);

    auto snap = session->snapshot();
    EXPECT_FALSE(snap.ticket.completed);
    EXPECT_EQ(snap.state, SessionState::AwaitingCoins);
    EXPECT_EQ(snap.ticket.coins_received, 1u);
}

TEST_F(SessionFixture, CoinsAfterCompletionIgnored)
{
    connect();
    ASSERT_EQ(session->start_session(5), Err::Ok);
    event(EventKind::CoinReceived);
    event(EventKind::PaymentComplete);
    event(EventKind::CoinReceived);
    EXPECT_EQ(session->snapshot().ticket.coins_received, 1u);
    EXPECT_EQ(session->state(), SessionState::PaymentComplete);
}

TEST_F(SessionFixture, EventsWithoutSessionAreNoOps)
{
    event(EventKind::CoinReceived);
    event(EventKind::PaymentComplete);
    EXPECT_EQ(session->state(), SessionState::Idle);
    EXPECT_FALSE(session->active());
}

TEST_F(SessionFixture, EventsTaggedForAnOldSessionAreDropped)
{
    connect();
    ASSERT_EQ(session->start_session(10), Err::Ok);
    const auto old_id = session->snapshot().id;
    session->cancel();
    ASSERT_EQ(session->start_session(10), Err::Ok);

    session->on_protocol_event(Event{EventKind::CoinReceived}, old_id);
    EXPECT_EQ(session->snapshot().ticket.coins_received, 0u);
    session->on_protocol_event(Event{EventKind::CoinReceived}, session->snapshot().id);
    EXPECT_EQ(session->snapshot().ticket.coins_received, 1u);
}

TEST_F(SessionFixture, FailedSendKeepsTicketScannedAndResendRecovers)
{
    connect();
    link->fail_sends(true);

    const Err e = session->start_session(20);
    EXPECT_EQ(e, Err::SendFailed);
    EXPECT_TRUE(parkterm::is_send_error(e));
    EXPECT_TRUE(session->active());
    EXPECT_EQ(session->state(), SessionState::TicketScanned);

    link->fail_sends(false);
    EXPECT_EQ(session->resend_rate(), Err::Ok);
    EXPECT_EQ(session->state(), SessionState::RateRequested);
    ASSERT_EQ(link->sent().size(), 1u);
    EXPECT_EQ(link->sent()[0], "4");
}

TEST_F(SessionFixture, AckBeforeSendAcknowledgedSkipsRateRequested)
{
    connect();
    link->fail_sends(true);
    ASSERT_EQ(session->start_session(10), Err::SendFailed);

    // the controller answered the first write even though the local write reported failure
    event(EventKind::RateConfirmed);
    EXPECT_EQ(session->state(), SessionState::TicketScanned);

    link->fail_sends(false);
    ASSERT_EQ(session->resend_rate(), Err::Ok);
    EXPECT_EQ(session->state(), SessionState::AwaitingCoins);
}

TEST_F(SessionFixture, ResendRules)
{
    EXPECT_EQ(session->resend_rate(), Err::NoSession);

    connect();
    ASSERT_EQ(session->start_session(10), Err::Ok);
    EXPECT_EQ(session->resend_rate(), Err::Ok);
    EXPECT_EQ(link->sent().size(), 2u);

    event(EventKind::RateConfirmed);
    EXPECT_EQ(session->resend_rate(), Err::WrongState);
    EXPECT_EQ(link->sent().size(), 2u);
}

TEST_F(SessionFixture, CancelClearsCounters)
{
    connect();
    ASSERT_EQ(session->start_session(10), Err::Ok);
    event(EventKind::CoinReceived);
    session->cancel();

    auto snap = session->snapshot();
    EXPECT_EQ(snap.state, SessionState::Idle);
    EXPECT_EQ(snap.id, 0u);
    EXPECT_EQ(snap.ticket.coins_received, 0u);
    EXPECT_EQ(snap.amount_inserted, 0u);
}

TEST_F(SessionFixture, ListenerSeesEveryTransition)
{
    std::vector<SessionState> seen;
    session->set_listener([&](const SessionSnapshot &s) { seen.push_back(s.state); });

    connect();
    ASSERT_EQ(session->start_session(5), Err::Ok);
    event(EventKind::RateConfirmed);
    event(EventKind::CoinReceived);
    event(EventKind::PaymentComplete);
    session->finalize();

    const std::vector<SessionState> want = {
        SessionState::TicketScanned, SessionState::RateRequested, SessionState::AwaitingCoins,
        SessionState::AwaitingCoins, SessionState::PaymentComplete, SessionState::Idle};
    EXPECT_EQ(seen, want);
}

TEST_F(SessionFixture, BoundaryHookRunsOnStartAndReset)
{
    int boundaries = 0;
    session->set_boundary_hook([&] { ++boundaries; });

    connect();
    ASSERT_EQ(session->start_session(5), Err::Ok);
    EXPECT_EQ(boundaries, 1);
    session->cancel();
    EXPECT_EQ(boundaries, 2);
}

TEST_F(SessionFixture, LargestPriceMoneyViewDoesNotWrap)
{
    connect();
    ASSERT_EQ(session->start_session(4294967295u), Err::Ok);
    ASSERT_EQ(link->sent().size(), 1u);
    EXPECT_EQ(link->sent()[0], "858993459");

    auto snap = session->snapshot();
    EXPECT_EQ(snap.ticket.coins_required, 858993459u);
    EXPECT_EQ(snap.coins_missing, 858993459u);
    EXPECT_EQ(snap.amount_missing, 4294967295u);

    event(EventKind::CoinReceived);
    snap = session->snapshot();
    EXPECT_EQ(snap.amount_inserted, 5u);
    EXPECT_EQ(snap.amount_missing, 4294967290u);
}
