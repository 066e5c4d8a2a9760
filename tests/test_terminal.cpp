#include <atomic>
#include <chrono>
#include <functional>
#include <gtest/gtest.h>
#include <memory>
#include <thread>

#include "app/terminal.hpp"
#include "transport/loopback_transport.hpp"

using namespace std::chrono_literals;
using app::SessionState;
using parkterm::Err;

namespace
{

bool wait_for(const std::function<bool()> &pred, std::chrono::milliseconds limit = 2s)
{
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (pred())
            return true;
        std::this_thread::sleep_for(2ms);
    }
    return pred();
}

struct TerminalFixture : public ::testing::Test
{
    std::shared_ptr<transport::LoopbackTransport> link;
    std::unique_ptr<app::Terminal>                term;

    void SetUp() override
    {
        term = std::make_unique<app::Terminal>([this](const transport::DeviceDescriptor &d) {
            link = std::make_shared<transport::LoopbackTransport>(d.kind);
            return link;
        });
    }
    void TearDown() override { term.reset(); }

    void connect(transport::Kind kind = transport::Kind::Ble)
    {
        transport::DeviceDescriptor d{"BT05", "AA:BB:CC:00:11:22", kind, "/loop"};
        ASSERT_EQ(term->connect(d), Err::Ok);
    }

    // Drains everything queued without a pump thread.
    void pump_all()
    {
        while (term->pump_once(0ms))
        {
        }
    }

    std::uint32_t coins() { return term->session().snapshot().ticket.coins_received; }
};

}  // namespace

TEST_F(TerminalFixture, TicketToPaymentOverBle)
{
    connect();
    ASSERT_EQ(term->scan_ticket("TICKET-ID-77|PRECIO:10"), Err::Ok);
    ASSERT_EQ(link->sent().size(), 1u);
    EXPECT_EQ(link->sent()[0], "2");
    EXPECT_EQ(term->session().state(), SessionState::RateRequested);

    link->inject("ST");
    pump_all();
    EXPECT_EQ(term->session().state(), SessionState::AwaitingCoins);

    link->inject("$");
    pump_all();
    EXPECT_EQ(coins(), 1u);

    link->inject("$P");
    pump_all();
    auto snap = term->session().snapshot();
    EXPECT_EQ(snap.state, SessionState::PaymentComplete);
    EXPECT_EQ(snap.amount_inserted, 10u);

    term->session().finalize();
    EXPECT_EQ(term->session().state(), SessionState::Idle);
}

TEST_F(TerminalFixture, SameFlowOverClassic)
{
    connect(transport::Kind::Classic);
    ASSERT_EQ(term->scan_ticket("PRECIO:5"), Err::Ok);
    EXPECT_EQ(link->sent()[0], "1");
    link->inject("ST$P");
    pump_all();
    EXPECT_EQ(term->session().state(), SessionState::PaymentComplete);
}

TEST_F(TerminalFixture, TokensSplitAcrossChunks)
{
    connect();
    ASSERT_EQ(term->scan_ticket("TICKET-ID-1|PRECIO:15"), Err::Ok);

    link->inject("S");
    pump_all();
    EXPECT_EQ(term->decoder_buffer(), "S");
    EXPECT_FALSE(term->session().snapshot().ticket.rate_confirmed);

    link->inject("T$");
    pump_all();
    EXPECT_TRUE(term->session().snapshot().ticket.rate_confirmed);
    EXPECT_EQ(coins(), 1u);
    EXPECT_TRUE(term->decoder_buffer().empty());
}

TEST_F(TerminalFixture, PrematureCompletionDoesNotEndSession)
{
    connect();
    ASSERT_EQ(term->scan_ticket("PRECIO:15"), Err::Ok);
    link->inject("$P");
    pump_all();

    auto snap = term->session().snapshot();
    EXPECT_EQ(snap.state, SessionState::AwaitingCoins);
    EXPECT_FALSE(snap.ticket.completed);
    EXPECT_EQ(snap.coins_missing, 2u);

    // the controller resends P once the tariff is covered
    link->inject("$$P");
    pump_all();
    EXPECT_EQ(term->session().state(), SessionState::PaymentComplete);
}

TEST_F(TerminalFixture, LargestPriceStillNeedsCoins)
{
    connect();
    ASSERT_EQ(term->scan_ticket("TICKET-ID-1|PRECIO:4294967295"), Err::Ok);
    EXPECT_EQ(link->sent()[0], "858993459");

    link->inject("$$$P");
    pump_all();
    auto snap = term->session().snapshot();
    EXPECT_EQ(snap.ticket.coins_received, 3u);
    EXPECT_EQ(snap.ticket.coins_required, 858993459u);
    EXPECT_FALSE(snap.ticket.completed);
    EXPECT_EQ(snap.state, SessionState::AwaitingCoins);
}

TEST_F(TerminalFixture, ScanTicketRefusals)
{
    EXPECT_EQ(term->scan_ticket("TICKET-ID-1|PRECIO:10"), Err::NoActiveConnection);
    EXPECT_FALSE(term->session().active());

    connect();
    EXPECT_EQ(term->scan_ticket("TICKET-ID-1"), Err::InvalidTicket);
    EXPECT_EQ(term->scan_ticket("garbage"), Err::InvalidTicket);

    ASSERT_EQ(term->scan_ticket("TICKET-ID-1|PRECIO:10"), Err::Ok);
    EXPECT_EQ(term->scan_ticket("TICKET-ID-2|PRECIO:20"), Err::SessionActive);
    EXPECT_EQ(term->session().snapshot().ticket.price, 10u);
    EXPECT_EQ(link->sent().size(), 1u);
}

TEST_F(TerminalFixture, LeftoverBytesDoNotLeakIntoNextSession)
{
    connect();
    link->inject("S");
    pump_all();
    EXPECT_EQ(term->decoder_buffer(), "S");

    ASSERT_EQ(term->scan_ticket("PRECIO:10"), Err::Ok);
    EXPECT_TRUE(term->decoder_buffer().empty());

    link->inject("T");
    pump_all();
    EXPECT_FALSE(term->session().snapshot().ticket.rate_confirmed);
}

TEST_F(TerminalFixture, QueuedChunksDroppedOnDisconnect)
{
    connect();
    ASSERT_EQ(term->scan_ticket("PRECIO:45"), Err::Ok);

    link->inject("$$$");
    term->disconnect();
    pump_all();

    EXPECT_EQ(coins(), 0u);
    EXPECT_FALSE(link->inject("$"));
    EXPECT_EQ(term->channel().pending(), 0u);
}

TEST_F(TerminalFixture, NoChunkMutatesSessionAfterDisconnectReturns)
{
    connect();
    ASSERT_EQ(term->scan_ticket("PRECIO:45"), Err::Ok);
    term->start();

    auto              live = link;
    std::atomic<bool> stop{false};
    std::thread       controller([&] {
        while (!stop.load())
            (void)live->inject("$");
    });

    ASSERT_TRUE(wait_for([&] { return coins() > 3; }));
    term->disconnect();
    const std::uint32_t at_disconnect = coins();

    std::this_thread::sleep_for(50ms);
    stop.store(true);
    controller.join();
    std::this_thread::sleep_for(50ms);

    EXPECT_EQ(coins(), at_disconnect);
    EXPECT_FALSE(term->connection().connected());
    term->stop();
}

TEST_F(TerminalFixture, LinkLossIsImplicitDisconnect)
{
    connect();
    term->start();
    ASSERT_EQ(term->scan_ticket("PRECIO:10"), Err::Ok);

    link->drop_link();
    ASSERT_TRUE(wait_for([&] { return !term->connection().connected(); }));
    EXPECT_EQ(term->connection().state(), transport::LinkState::Disconnected);
    EXPECT_EQ(term->session().resend_rate(), Err::NoActiveConnection);
    term->stop();
}

TEST_F(TerminalFixture, ReconnectAfterLinkLoss)
{
    connect();
    term->start();
    link->drop_link();
    ASSERT_TRUE(wait_for([&] { return !term->connection().connected(); }));

    connect();
    ASSERT_EQ(term->scan_ticket("PRECIO:5"), Err::Ok);
    link->inject("ST$P");
    EXPECT_TRUE(wait_for([&] { return term->session().state() == SessionState::PaymentComplete; }));
    term->stop();
}

TEST_F(TerminalFixture, PumpRestartsAfterStop)
{
    connect();
    term->start();
    term->stop();
    term->start();
    ASSERT_EQ(term->scan_ticket("PRECIO:5"), Err::Ok);
    link->inject("ST");
    EXPECT_TRUE(wait_for([&] { return term->session().snapshot().ticket.rate_confirmed; }));
    term->stop();
}
