// include/transport/spp_transport.hpp
#pragma once
#include <cstdint>
#include <memory>
#include <string>

#include "transport/itransport.hpp"
#include "util/constants.hpp"

namespace transport
{

struct SppConfig
{
    std::string   adapter = "hci0";
    std::string   dev_path;
    std::string   address;
    std::uint32_t connect_timeout_ms = constants::DEFAULT_CONNECT_TIMEOUT_MS;
    std::uint32_t drain_timeout_ms   = 2000;  // wait for the socket send queue after a write
};

// RFCOMM serial link to an HC-05/HC-06 style module. BlueZ hands us the socket through an
// org.bluez.Profile1 object we export for the SPP UUID; after that it is plain fd I/O.
class SppTransport final : public ITransport
{
  public:
    explicit SppTransport(SppConfig cfg);
    ~SppTransport() override;

    parkterm::Err connect(OnChunk on_rx, OnClosed on_closed) override;
    void          disconnect() override;
    parkterm::Err send(std::string_view command) override;
    LinkState     state() const override;
    Kind          kind() const override { return Kind::Classic; }
    std::string   name() const override { return "bluez-spp"; }

    const SppConfig &config() const { return cfg_; }

    // ---- entry points for the Profile1 method handlers ----
    bool on_new_connection(const std::string &device, int fd);
    void on_request_disconnection(const std::string &device);
    void on_release();
    void on_connect_reply(bool ok, const std::string &error);

  private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    SppConfig             cfg_;

    bool register_profile();
    void reader_loop();
    void fire_closed();
    void release_bus();
};

}  // namespace transport
