#pragma once
#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "transport/itransport.hpp"

namespace transport
{

// In-process link with a scripted controller on the far side.
// Tests and the bench daemon push controller bytes with inject() and read what the terminal sent
// with sent(). Failures can be armed to exercise the error paths.
class LoopbackTransport final : public ITransport
{
  public:
    explicit LoopbackTransport(Kind kind = Kind::Ble) : kind_(kind) {}
    ~LoopbackTransport() override { disconnect(); }

    parkterm::Err connect(OnChunk on_rx, OnClosed on_closed) override;
    void          disconnect() override;
    parkterm::Err send(std::string_view command) override;
    LinkState     state() const override;
    Kind          kind() const override { return kind_; }
    std::string   name() const override { return "loopback"; }

    // controller side
    bool                     inject(std::string_view bytes);
    void                     drop_link();
    std::vector<std::string> sent() const;
    std::vector<Chunk>       sent_raw() const;

    // failure injection
    void fail_connect_with(parkterm::Err e)
    {
        std::lock_guard<std::mutex> lk(mu_);
        connect_result_ = e;
    }
    void fail_sends(bool on)
    {
        std::lock_guard<std::mutex> lk(mu_);
        fail_sends_ = on;
    }

  private:
    Kind               kind_;
    mutable std::mutex mu_;
    OnChunk            on_rx_{};
    OnClosed           on_closed_{};
    LinkState          state_{LinkState::Disconnected};
    std::vector<Chunk> sent_{};
    parkterm::Err      connect_result_{parkterm::Err::Ok};
    bool               fail_sends_{false};
};

}  // namespace transport
