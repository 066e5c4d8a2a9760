#pragma once
#include <atomic>
#include <chrono>
#include <mutex>
#include <string_view>
#include <thread>

#include "app/session_controller.hpp"
#include "conn/chunk_channel.hpp"
#include "conn/connection_manager.hpp"
#include "proto/coin_protocol.hpp"
#include "transport/device.hpp"

namespace app
{

// The payment terminal: one link, one decoder, one session, one pump thread feeding the decoder.
//
//   transport thread ──push──▶ ChunkChannel ──pop──▶ pump: decode ▶ SessionController
//
// Teardown invalidates the channel epoch and then takes decode_mu_, so once disconnect()
// returns nothing decoded from the old link can reach the session.
class Terminal
{
  public:
    explicit Terminal(conn::TransportFactory factory);
    ~Terminal();

    Terminal(const Terminal &)            = delete;
    Terminal &operator=(const Terminal &) = delete;

    // Pump thread. Tests may leave it stopped and drive pump_once() themselves.
    void start();
    void stop();
    bool running() const { return running_.load(); }

    // Handles at most one inbound item, waiting up to `wait` for it. True if one was handled.
    bool pump_once(std::chrono::milliseconds wait);

    parkterm::Err connect(const transport::DeviceDescriptor &d);
    void          disconnect();
    // NoActiveConnection, SessionActive or InvalidTicket, else start_session's result.
    parkterm::Err scan_ticket(std::string_view payload);

    conn::ConnectionManager &connection() { return conn_; }
    SessionController       &session() { return session_; }
    conn::ChunkChannel      &channel() { return channel_; }
    std::string              decoder_buffer();

  private:
    void pump_loop();

    conn::ChunkChannel      channel_;
    proto::ProtocolDecoder  decoder_;
    std::mutex              decode_mu_;  // one decode pass at a time, held by teardown too
    conn::ConnectionManager conn_;
    SessionController       session_;
    std::thread             pump_;
    std::atomic_bool        running_{false};
};

}  // namespace app
