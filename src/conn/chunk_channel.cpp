#include "conn/chunk_channel.hpp"

namespace conn
{

std::uint64_t ChunkChannel::open()
{
    std::lock_guard<std::mutex> lk(mu_);
    q_.clear();
    open_ = true;
    return ++epoch_;
}

void ChunkChannel::close()
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        q_.clear();
        open_ = false;
        ++epoch_;
    }
    cv_.notify_all();
}

void ChunkChannel::shutdown()
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        shutdown_ = true;
    }
    cv_.notify_all();
}

void ChunkChannel::resume()
{
    std::lock_guard<std::mutex> lk(mu_);
    shutdown_ = false;
}

bool ChunkChannel::push(std::uint64_t epoch, transport::Chunk bytes)
{
    if (bytes.empty())
        return false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!open_ || epoch != epoch_)
            return false;
        q_.push_back(Inbound{epoch, std::move(bytes), false});
    }
    cv_.notify_one();
    return true;
}

bool ChunkChannel::push_closed(std::uint64_t epoch)
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!open_ || epoch != epoch_)
            return false;
        q_.push_back(Inbound{epoch, {}, true});
    }
    cv_.notify_one();
    return true;
}

std::optional<Inbound> ChunkChannel::pop(std::chrono::milliseconds wait)
{
    std::unique_lock<std::mutex> lk(mu_);
    const auto deadline = std::chrono::steady_clock::now() + wait;
    while (true)
    {
        while (!q_.empty())
        {
            Inbound in = std::move(q_.front());
            q_.pop_front();
            if (in.epoch == epoch_)
                return in;
        }
        if (shutdown_)
            return std::nullopt;
        if (cv_.wait_until(lk, deadline) == std::cv_status::timeout && q_.empty())
            return std::nullopt;
    }
}

bool ChunkChannel::is_current(std::uint64_t epoch) const
{
    std::lock_guard<std::mutex> lk(mu_);
    return open_ && epoch == epoch_;
}

std::uint64_t ChunkChannel::epoch() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return epoch_;
}

std::size_t ChunkChannel::pending() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return q_.size();
}

}  // namespace conn
