#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

#include "transport/itransport.hpp"

namespace conn
{

struct Inbound
{
    std::uint64_t    epoch{0};
    transport::Chunk bytes;
    bool             link_closed{false};  // end-of-stream marker, bytes is empty
};

// Hand-off between the transport's I/O thread (producer) and the decode pump (consumer).
// Every connection gets a fresh epoch; items stamped with an older epoch are refused on push
// and discarded on pop, so nothing from a torn-down link reaches the decoder.
class ChunkChannel
{
  public:
    // Starts a new epoch, dropping anything still queued.
    std::uint64_t open();
    // Invalidates the current epoch, dropping anything still queued.
    void close();
    // Wakes a blocked pop(); pop() keeps returning nothing until resume().
    void shutdown();
    void resume();

    bool push(std::uint64_t epoch, transport::Chunk bytes);
    bool push_closed(std::uint64_t epoch);

    // Waits up to `wait` for the next current-epoch item.
    std::optional<Inbound> pop(std::chrono::milliseconds wait);

    bool          is_current(std::uint64_t epoch) const;
    std::uint64_t epoch() const;
    std::size_t   pending() const;

  private:
    mutable std::mutex      mu_;
    std::condition_variable cv_;
    std::deque<Inbound>     q_;
    std::uint64_t           epoch_{0};
    bool                    open_{false};
    bool                    shutdown_{false};
};

}  // namespace conn
