#include "transport/loopback_transport.hpp"

#include "util/log.hpp"

namespace transport
{
using parkterm::Err;

// LoopbackTransport: a fake link to test the pipeline (decoder -> session) without BlueZ.
Err LoopbackTransport::connect(OnChunk on_rx, OnClosed on_closed)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (state_ == LinkState::Connected)
        return Err::Ok;
    if (connect_result_ != Err::Ok)
    {
        state_ = LinkState::Failed;
        return connect_result_;
    }
    on_rx_     = std::move(on_rx);
    on_closed_ = std::move(on_closed);
    state_     = LinkState::Connected;
    LOG_DEBUG("[LOOP] link up (%s)", kind_name(kind_));
    return Err::Ok;
}

void LoopbackTransport::disconnect()
{
    std::lock_guard<std::mutex> lk(mu_);
    // subscription first, then the "link"
    on_rx_     = nullptr;
    on_closed_ = nullptr;
    if (state_ == LinkState::Connected)
        LOG_DEBUG("[LOOP] link down");
    state_ = LinkState::Disconnected;
}

Err LoopbackTransport::send(std::string_view command)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (state_ != LinkState::Connected)
        return Err::NotConnected;
    if (fail_sends_)
        return Err::SendFailed;
    sent_.push_back(frame_command(command));
    return Err::Ok;
}

LinkState LoopbackTransport::state() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return state_;
}

bool LoopbackTransport::inject(std::string_view bytes)
{
    OnChunk cb;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (state_ != LinkState::Connected || !on_rx_)
            return false;
        cb = on_rx_;
    }
    cb(Chunk(bytes.begin(), bytes.end()));
    return true;
}

void LoopbackTransport::drop_link()
{
    OnClosed cb;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (state_ != LinkState::Connected)
            return;
        state_     = LinkState::Disconnected;
        on_rx_     = nullptr;
        cb         = std::move(on_closed_);
        on_closed_ = nullptr;
    }
    if (cb)
        cb();
}

std::vector<std::string> LoopbackTransport::sent() const
{
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<std::string> out;
    out.reserve(sent_.size());
    for (const auto &c : sent_)
    {
        std::string s(c.begin(), c.end());
        if (s.size() >= constants::LINE_TERMINATOR.size())
            s.resize(s.size() - constants::LINE_TERMINATOR.size());
        out.push_back(std::move(s));
    }
    return out;
}

std::vector<Chunk> LoopbackTransport::sent_raw() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return sent_;
}

}  // namespace transport
