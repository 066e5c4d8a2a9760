#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "util/constants.hpp"
#include "util/errors.hpp"

namespace transport
{

using Chunk    = std::vector<std::uint8_t>;
using OnChunk  = std::function<void(const Chunk &)>;
using OnClosed = std::function<void()>;  // link dropped underneath us

enum class Kind
{
    Ble,
    Classic
};

enum class LinkState
{
    Disconnected,
    Connecting,
    Connected,
    Failed
};

inline const char *kind_name(Kind k)
{
    return k == Kind::Ble ? "BLE" : "Classic";
}

inline const char *link_state_name(LinkState s)
{
    switch (s)
    {
        case LinkState::Disconnected:
            return "disconnected";
        case LinkState::Connecting:
            return "connecting";
        case LinkState::Connected:
            return "connected";
        case LinkState::Failed:
            return "failed";
    }
    return "?";
}

// Wire framing shared by every backend so the controller firmware sees the same bytes.
inline Chunk frame_command(std::string_view command)
{
    Chunk out;
    out.reserve(command.size() + constants::LINE_TERMINATOR.size());
    out.insert(out.end(), command.begin(), command.end());
    out.insert(out.end(), constants::LINE_TERMINATOR.begin(), constants::LINE_TERMINATOR.end());
    return out;
}

// One physical link. Instances are single-use: after disconnect() (or a dropped link) a new
// instance is needed to reconnect, and the inbound stream cannot be restarted.
struct ITransport
{
    // Blocks until the link is usable or fails. on_rx receives raw inbound chunks, on_closed
    // fires once if the link drops without disconnect() being called.
    virtual parkterm::Err connect(OnChunk on_rx, OnClosed on_closed) = 0;
    // Idempotent. Cancels the inbound subscription before closing the link, never fails.
    virtual void disconnect() = 0;
    // Appends the line terminator; returns once the transport acknowledged the write.
    virtual parkterm::Err send(std::string_view command) = 0;

    virtual LinkState   state() const = 0;
    virtual Kind        kind() const  = 0;
    virtual std::string name() const { return ""; }
    virtual ~ITransport() = default;
};

}  // namespace transport
