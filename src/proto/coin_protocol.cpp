#include <string>

#include "proto/coin_protocol.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace proto
{

// Remove every non-overlapping occurrence of token, scanning left to right.
// Returns the number of occurrences removed.
static std::size_t strip_all(std::string &buf, std::string_view token)
{
    if (token.empty())
        return 0;

    std::string out;
    out.reserve(buf.size());
    std::size_t n   = 0;
    std::size_t pos = 0;
    while (pos < buf.size())
    {
        if (buf.compare(pos, token.size(), token) == 0)
        {
            ++n;
            pos += token.size();
            continue;
        }
        out.push_back(buf[pos++]);
    }
    if (n)
        buf.swap(out);
    return n;
}

Step decode_step(std::string buffer, std::string_view chunk, const SessionView &session)
{
    Step st{};
    st.buffer = std::move(buffer);
    st.buffer.append(chunk.data(), chunk.size());

    const bool open_session = session.active && !session.completed;

    // 1. rate acknowledgment
    if (strip_all(st.buffer, constants::TOKEN_RATE_ACK) > 0 && !session.rate_confirmed)
        st.events.push_back(Event{EventKind::RateConfirmed});

    // 2. coins
    st.coins               = strip_all(st.buffer, std::string_view(&constants::TOKEN_COIN, 1));
    std::uint32_t received = session.coins_received;
    if (st.coins > 0)
    {
        if (open_session)
        {
            for (std::size_t i = 0; i < st.coins; ++i)
                st.events.push_back(Event{EventKind::CoinReceived});
            received += static_cast<std::uint32_t>(st.coins);
        }
        else
        {
            st.anomalies.push_back(Anomaly::NoSession);
        }
    }

    // 3. completion, evaluated with this step's coins already counted
    if (strip_all(st.buffer, std::string_view(&constants::TOKEN_PAID, 1)) > 0)
    {
        if (!session.active || session.coins_required == 0)
            st.anomalies.push_back(Anomaly::NoSession);
        else if (session.completed)
            st.anomalies.push_back(Anomaly::DuplicateComplete);
        else if (received >= session.coins_required)
            st.events.push_back(Event{EventKind::PaymentComplete});
        else
            st.anomalies.push_back(Anomaly::PrematureComplete);
    }

    if (st.buffer.size() > constants::RX_BUFFER_CEILING)
    {
        st.buffer.clear();
        st.anomalies.push_back(Anomaly::BufferOverflow);
    }
    return st;
}

std::uint32_t coins_for_price(std::uint32_t price)
{
    // no price + 4 here: it wraps near UINT32_MAX
    return price / constants::COIN_DENOMINATION +
           (price % constants::COIN_DENOMINATION != 0 ? 1u : 0u);
}

std::string rate_command(std::uint32_t coins_required)
{
    return std::to_string(coins_required);
}

const char *event_name(EventKind k)
{
    switch (k)
    {
        case EventKind::RateConfirmed:
            return "rate-confirmed";
        case EventKind::CoinReceived:
            return "coin";
        case EventKind::PaymentComplete:
            return "payment-complete";
    }
    return "?";
}

const char *anomaly_name(Anomaly a)
{
    switch (a)
    {
        case Anomaly::PrematureComplete:
            return "premature P";
        case Anomaly::NoSession:
            return "token without session";
        case Anomaly::DuplicateComplete:
            return "duplicate P";
        case Anomaly::BufferOverflow:
            return "buffer overflow";
    }
    return "?";
}

Step ProtocolDecoder::feed(const transport::Chunk &chunk, const SessionView &session)
{
    return feed(std::string_view(reinterpret_cast<const char *>(chunk.data()), chunk.size()),
                session);
}

Step ProtocolDecoder::feed(std::string_view chunk, const SessionView &session)
{
    Step st = decode_step(std::move(buffer_), chunk, session);
    buffer_ = st.buffer;

    LOG_DEBUG("[PROTO] rx '%.*s' -> buffer '%s' events=%zu", (int)chunk.size(), chunk.data(),
              buffer_.c_str(), st.events.size());

    for (auto a : st.anomalies)
    {
        switch (a)
        {
            case Anomaly::PrematureComplete:
                LOG_WARN("[PROTO] controller sent P with %u/%u coins; ignored",
                         session.coins_received + (unsigned)st.coins, session.coins_required);
                break;
            case Anomaly::BufferOverflow:
                LOG_WARN("[PROTO] buffer exceeded %zu chars; cleared",
                         constants::RX_BUFFER_CEILING);
                break;
            case Anomaly::NoSession:
            case Anomaly::DuplicateComplete:
                LOG_DEBUG("[PROTO] dropped %s", anomaly_name(a));
                break;
        }
    }
    return st;
}

}  // namespace proto
