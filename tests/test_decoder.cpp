#include <gtest/gtest.h>

#include "proto/coin_protocol.hpp"

using namespace proto;

static SessionView session(std::uint32_t required, std::uint32_t received = 0,
                           bool rate_confirmed = false)
{
    SessionView v;
    v.active         = true;
    v.coins_required = required;
    v.coins_received = received;
    v.rate_confirmed = rate_confirmed;
    v.session_id     = 1;
    return v;
}

static std::size_t count(const Step &st, EventKind k)
{
    std::size_t n = 0;
    for (const auto &e : st.events)
        n += e.kind == k ? 1 : 0;
    return n;
}

static bool has_anomaly(const Step &st, Anomaly a)
{
    for (auto x : st.anomalies)
    {
        if (x == a)
            return true;
    }
    return false;
}

TEST(Decoder, CoinsForPriceRoundsUp)
{
    EXPECT_EQ(coins_for_price(42), 9u);
    EXPECT_EQ(coins_for_price(45), 9u);
    EXPECT_EQ(coins_for_price(46), 10u);
    EXPECT_EQ(coins_for_price(5), 1u);
    EXPECT_EQ(coins_for_price(1), 1u);
}

TEST(Decoder, CoinsForPriceNearUint32Limit)
{
    EXPECT_EQ(coins_for_price(4294967295u), 858993459u);
    EXPECT_EQ(coins_for_price(4294967294u), 858993459u);
    EXPECT_EQ(coins_for_price(4294967292u), 858993459u);
    EXPECT_EQ(coins_for_price(4294967291u), 858993459u);
    EXPECT_EQ(coins_for_price(4294967290u), 858993458u);
}

TEST(Decoder, RateCommandIsDecimalCount)
{
    EXPECT_EQ(rate_command(9), "9");
    EXPECT_EQ(rate_command(12), "12");
}

TEST(Decoder, RateAckOnce)
{
    Step st = decode_step("", "ST", session(3));
    EXPECT_EQ(count(st, EventKind::RateConfirmed), 1u);
    EXPECT_TRUE(st.buffer.empty());
}

TEST(Decoder, DoubleRateAckInOneChunkFiresOnce)
{
    Step st = decode_step("", "STST", session(3));
    EXPECT_EQ(count(st, EventKind::RateConfirmed), 1u);
    EXPECT_TRUE(st.buffer.empty());
}

TEST(Decoder, RateAckAfterConfirmationIsStrippedSilently)
{
    Step st = decode_step("", "ST", session(3, 0, true));
    EXPECT_EQ(count(st, EventKind::RateConfirmed), 0u);
    EXPECT_TRUE(st.buffer.empty());
}

TEST(Decoder, CoinsCountedWithoutCompletion)
{
    Step st = decode_step("", "$$$", session(5));
    EXPECT_EQ(count(st, EventKind::CoinReceived), 3u);
    EXPECT_EQ(count(st, EventKind::PaymentComplete), 0u);
    EXPECT_EQ(st.coins, 3u);
    EXPECT_TRUE(st.buffer.empty());
}

TEST(Decoder, CoinsBeforeCompletionInSameChunk)
{
    Step st = decode_step("", "$$P", session(2));
    EXPECT_EQ(count(st, EventKind::CoinReceived), 2u);
    EXPECT_EQ(count(st, EventKind::PaymentComplete), 1u);
    ASSERT_EQ(st.events.size(), 3u);
    EXPECT_EQ(st.events.back().kind, EventKind::PaymentComplete);
    EXPECT_TRUE(st.buffer.empty());
}

TEST(Decoder, PrematureCompletionStrippedAndIgnored)
{
    Step st = decode_step("", "P", session(3, 1));
    EXPECT_TRUE(st.events.empty());
    EXPECT_TRUE(has_anomaly(st, Anomaly::PrematureComplete));
    EXPECT_TRUE(st.buffer.empty());
}

TEST(Decoder, CompletionAfterEnoughCoinsFromEarlierChunks)
{
    Step st = decode_step("", "P", session(2, 2));
    EXPECT_EQ(count(st, EventKind::PaymentComplete), 1u);
}

TEST(Decoder, CompletionWithoutSessionIsAnomaly)
{
    Step st = decode_step("", "P", SessionView{});
    EXPECT_TRUE(st.events.empty());
    EXPECT_TRUE(has_anomaly(st, Anomaly::NoSession));
}

TEST(Decoder, CoinsWithoutSessionAreDropped)
{
    Step st = decode_step("", "$$", SessionView{});
    EXPECT_TRUE(st.events.empty());
    EXPECT_EQ(st.coins, 2u);
    EXPECT_TRUE(has_anomaly(st, Anomaly::NoSession));
    EXPECT_TRUE(st.buffer.empty());
}

TEST(Decoder, CompletedSessionIgnoresFurtherTokens)
{
    SessionView v = session(2, 2, true);
    v.completed   = true;
    Step st       = decode_step("", "$P", v);
    EXPECT_TRUE(st.events.empty());
    EXPECT_TRUE(has_anomaly(st, Anomaly::DuplicateComplete));
}

TEST(Decoder, SplitRateAckAcrossChunks)
{
    ProtocolDecoder d;
    Step            first = d.feed(std::string_view("S"), session(3));
    EXPECT_TRUE(first.events.empty());
    EXPECT_EQ(d.buffer(), "S");

    Step second = d.feed(std::string_view("T"), session(3));
    EXPECT_EQ(count(second, EventKind::RateConfirmed), 1u);
    EXPECT_TRUE(d.buffer().empty());
}

TEST(Decoder, InertBytesPastCeilingResetBuffer)
{
    ProtocolDecoder d;
    std::string     noise(50, 'x');
    Step            st = d.feed(std::string_view(noise), session(3));
    EXPECT_EQ(d.buffer().size(), 50u);
    EXPECT_TRUE(st.anomalies.empty());

    st = d.feed(std::string_view("x"), session(3));
    EXPECT_TRUE(d.buffer().empty());
    EXPECT_TRUE(st.events.empty());
    EXPECT_TRUE(has_anomaly(st, Anomaly::BufferOverflow));
}

TEST(Decoder, TokensAroundNoiseStillDecoded)
{
    ProtocolDecoder d;
    Step            st = d.feed(std::string_view("ab$cS"), session(3));
    EXPECT_EQ(count(st, EventKind::CoinReceived), 1u);
    EXPECT_EQ(d.buffer(), "abcS");

    st = d.feed(std::string_view("T$"), session(3, 1));
    EXPECT_EQ(count(st, EventKind::RateConfirmed), 1u);
    EXPECT_EQ(count(st, EventKind::CoinReceived), 1u);
    EXPECT_EQ(d.buffer(), "abc");
}

TEST(Decoder, FeedFromRawChunk)
{
    ProtocolDecoder        d;
    const transport::Chunk raw{'$', '$', 'P'};
    Step                   st = d.feed(raw, session(2));
    EXPECT_EQ(count(st, EventKind::PaymentComplete), 1u);
}

TEST(Decoder, ResetClearsBuffer)
{
    ProtocolDecoder d;
    (void)d.feed(std::string_view("S"), session(1));
    d.reset();
    Step st = d.feed(std::string_view("T"), session(1));
    EXPECT_TRUE(st.events.empty());
    EXPECT_EQ(d.buffer(), "T");
}
