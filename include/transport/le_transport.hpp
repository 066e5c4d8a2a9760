// include/transport/le_transport.hpp
#pragma once
#include <cstdint>
#include <memory>
#include <string>

#include "transport/itransport.hpp"
#include "util/constants.hpp"

namespace transport
{

struct LeConfig
{
    std::string   adapter = "hci0";
    std::string   dev_path;  // "/org/bluez/hci0/dev_AA_BB_..."
    std::string   address;   // "AA:BB:CC:DD:EE:FF"
    std::string   svc_fragment       = std::string(constants::UART_SVC_FRAGMENT);
    std::string   chr_fragment       = std::string(constants::UART_CHR_FRAGMENT);
    std::uint32_t connect_timeout_ms = constants::DEFAULT_CONNECT_TIMEOUT_MS;
};

// GATT link to an HM-10 style UART module through BlueZ (Device1 + GattCharacteristic1).
// Inbound bytes arrive as Value notifications on the UART characteristic, outbound commands are
// written to the same characteristic with a write request.
class LeTransport final : public ITransport
{
  public:
    explicit LeTransport(LeConfig cfg);
    ~LeTransport() override;

    parkterm::Err connect(OnChunk on_rx, OnClosed on_closed) override;
    void          disconnect() override;
    parkterm::Err send(std::string_view command) override;
    LinkState     state() const override;
    Kind          kind() const override { return Kind::Ble; }
    std::string   name() const override { return "bluez-le"; }

    const LeConfig &config() const { return cfg_; }

    // ---- entry points for the sd-bus signal handlers ----
    const std::string &chr_path() const;
    void               deliver_rx_bytes(const std::uint8_t *data, std::size_t len);
    void               note_connected(bool v);
    void               note_services_resolved(bool v);

  private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    LeConfig              cfg_;

    parkterm::Err connect_device(std::uint64_t deadline_ms);
    parkterm::Err wait_services_resolved(std::uint64_t deadline_ms);
    bool          find_uart_characteristic();
    parkterm::Err start_notify(std::uint64_t deadline_ms);
    bool          write_value(const std::uint8_t *data, std::size_t len);
    void          fire_closed();
    void          release_bus();
};

}  // namespace transport
