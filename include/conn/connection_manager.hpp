#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>

#include "conn/chunk_channel.hpp"
#include "transport/device.hpp"
#include "transport/itransport.hpp"
#include "util/errors.hpp"

namespace conn
{

// Builds the transport backend for a device (LE or SPP by kind, or a loopback in tests).
using TransportFactory =
    std::function<std::shared_ptr<transport::ITransport>(const transport::DeviceDescriptor &)>;

// Owns the single active link. Inbound bytes are pushed into the channel stamped with the
// link's epoch; teardown invalidates the epoch before the transport is closed.
class ConnectionManager
{
  public:
    ConnectionManager(ChunkChannel &channel, TransportFactory factory);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager &)            = delete;
    ConnectionManager &operator=(const ConnectionManager &) = delete;

    // Drops any current link, then connects to d. On failure nothing stays active.
    parkterm::Err connect(const transport::DeviceDescriptor &d);
    // Idempotent.
    void disconnect();
    // NoActiveConnection without a link, otherwise the transport's result.
    parkterm::Err send(std::string_view command);

    // Called by the consumer when it pops the end-of-stream marker for epoch.
    void on_link_lost(std::uint64_t epoch);

    bool                                     connected() const;
    transport::LinkState                     state() const;
    std::optional<transport::DeviceDescriptor> active_device() const;

    // Runs during teardown after the epoch is invalidated and before the transport closes.
    // Must not call back into the manager.
    void set_teardown_hook(std::function<void()> hook);

  private:
    void teardown_locked(const char *why);

    std::mutex                                 op_mu_;  // serializes connect/disconnect
    mutable std::mutex                         mu_;     // guards the fields below
    ChunkChannel                              &channel_;
    TransportFactory                           factory_;
    std::shared_ptr<transport::ITransport>     active_;
    std::optional<transport::DeviceDescriptor> device_;
    transport::LinkState                       state_{transport::LinkState::Disconnected};
    std::function<void()>                      on_teardown_;
};

}  // namespace conn
