#include <gtest/gtest.h>

#include "app/ticket.hpp"
#include "proto/coin_protocol.hpp"

using app::parse_ticket;

TEST(Ticket, FormatMatchesQrPayload)
{
    EXPECT_EQ(app::format_ticket(42, 15), "TICKET-ID-42|PRECIO:15");
}

TEST(Ticket, ParsesIdAndPrice)
{
    auto t = parse_ticket("TICKET-ID-1234|PRECIO:45");
    ASSERT_TRUE(t.has_value());
    ASSERT_TRUE(t->id.has_value());
    EXPECT_EQ(*t->id, 1234u);
    EXPECT_EQ(t->price, 45u);
}

TEST(Ticket, IdIsOptional)
{
    auto t = parse_ticket("PRECIO:10");
    ASSERT_TRUE(t.has_value());
    EXPECT_FALSE(t->id.has_value());
    EXPECT_EQ(t->price, 10u);

    t = parse_ticket("TICKET-ID-x|PRECIO:10");
    ASSERT_TRUE(t.has_value());
    EXPECT_FALSE(t->id.has_value());
}

TEST(Ticket, FieldOrderDoesNotMatter)
{
    auto t = parse_ticket("PRECIO:20|TICKET-ID-7");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->price, 20u);
    EXPECT_EQ(*t->id, 7u);
}

TEST(Ticket, RejectsMalformedPrice)
{
    EXPECT_FALSE(parse_ticket("").has_value());
    EXPECT_FALSE(parse_ticket("TICKET-ID-1").has_value());
    EXPECT_FALSE(parse_ticket("TICKET-ID-1|PRECIO:").has_value());
    EXPECT_FALSE(parse_ticket("TICKET-ID-1|PRECIO:0").has_value());
    EXPECT_FALSE(parse_ticket("TICKET-ID-1|PRECIO:-5").has_value());
    EXPECT_FALSE(parse_ticket("TICKET-ID-1|PRECIO:1 5").has_value());
    EXPECT_FALSE(parse_ticket("TICKET-ID-1|PRECIO:99999999999").has_value());
}

TEST(Ticket, PriceNotOnCoinBoundaryRoundsCoinsUp)
{
    auto t = parse_ticket("TICKET-ID-3|PRECIO:12");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(proto::coins_for_price(t->price), 3u);
}

TEST(Ticket, LargestPriceKeepsNonZeroCoinCount)
{
    auto t = parse_ticket("TICKET-ID-1|PRECIO:4294967295");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->price, 4294967295u);
    EXPECT_EQ(proto::coins_for_price(t->price), 858993459u);

    // one past uint32 is not a price
    EXPECT_FALSE(parse_ticket("PRECIO:4294967296").has_value());
}

TEST(Ticket, IssuedTicketsStayInRange)
{
    for (int i = 0; i < 200; ++i)
    {
        auto t = app::issue_ticket();
        ASSERT_TRUE(t.has_value());
        ASSERT_TRUE(t->id.has_value());
        EXPECT_LT(*t->id, 9999u);
        EXPECT_GE(t->price, 5u);
        EXPECT_LE(t->price, 45u);
        EXPECT_EQ(t->price % 5, 0u);

        auto back = parse_ticket(app::format_ticket(*t->id, t->price));
        ASSERT_TRUE(back.has_value());
        EXPECT_EQ(back->price, t->price);
    }
}
