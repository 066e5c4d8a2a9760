#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "transport/itransport.hpp"

/*
Controller -> terminal byte stream (unframed ASCII, arbitrary chunking):

  "ST"  rate acknowledged      first one per session counts, all are stripped
  "$"   one coin inserted      every occurrence counts, all are stripped
  "P"   payment complete       honoured only when received >= required > 0

Per chunk:  buffer += chunk -> ST pass -> $ pass -> P pass -> overflow check (> 50 chars).
Unmatched bytes (e.g. a lone 'S' waiting for its 'T') stay buffered for the next chunk.

Terminal -> controller: coin count in ASCII decimal + "\r\n" (added by the transport).
*/

namespace proto
{

enum class EventKind
{
    RateConfirmed,
    CoinReceived,  // exactly one coin
    PaymentComplete
};

struct Event
{
    EventKind kind;
};

enum class Anomaly
{
    PrematureComplete,  // "P" with received < required
    NoSession,          // "P" or "$" with no session to apply it to
    DuplicateComplete,  // "P" after the session already completed
    BufferOverflow      // unparseable bytes past the ceiling, buffer dropped
};

// What the decoder needs to know about the payment session it is feeding.
struct SessionView
{
    bool          active         = false;
    std::uint32_t coins_required = 0;
    std::uint32_t coins_received = 0;
    bool          rate_confirmed = false;
    bool          completed      = false;
    std::uint64_t session_id     = 0;  // lets the consumer detect a reset between view and apply
};

struct Step
{
    std::string          buffer;
    std::vector<Event>   events;
    std::vector<Anomaly> anomalies;
    std::size_t          coins = 0;  // '$' tokens consumed in this step
};

// Pure transition: (buffer, chunk, session) -> (buffer', events).
Step decode_step(std::string buffer, std::string_view chunk, const SessionView &session);

// Number of coins needed to cover price, rounding up. Defined for the whole uint32 range.
std::uint32_t coins_for_price(std::uint32_t price);

// Coin count command for the controller (without line terminator).
std::string rate_command(std::uint32_t coins_required);

const char *event_name(EventKind k);
const char *anomaly_name(Anomaly a);

// Owns the accumulation buffer between chunks.
class ProtocolDecoder
{
  public:
    Step feed(const transport::Chunk &chunk, const SessionView &session);
    Step feed(std::string_view chunk, const SessionView &session);
    void reset() { buffer_.clear(); }

    const std::string &buffer() const { return buffer_; }

  private:
    std::string buffer_;
};

}  // namespace proto
