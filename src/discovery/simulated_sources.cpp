#include "discovery/simulated_sources.hpp"

#include "util/log.hpp"

namespace discovery
{
using parkterm::Err;

Err SimulatedLeScanner::start(std::chrono::milliseconds timeout, OnAdvert on_advert,
                              OnDone on_done)
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (scanning_)
            return Err::Ok;
        if (start_result_ != Err::Ok)
            return start_result_;
    }
    // a finished timer thread from the previous run
    if (timer_.joinable())
        timer_.join();

    {
        std::lock_guard<std::mutex> lk(mu_);
        scanning_ = true;
        stop_req_ = false;
    }
    for (const auto &a : adverts_)
    {
        if (on_advert)
            on_advert(a);
    }

    timer_ = std::thread([this, timeout, on_done = std::move(on_done)] {
        std::unique_lock<std::mutex> lk(mu_);
        const bool stopped = cv_.wait_for(lk, timeout, [this] { return stop_req_; });
        scanning_          = false;
        lk.unlock();
        if (!stopped && on_done)
            on_done();
    });
    LOG_DEBUG("[SCAN] simulated LE scan, %zu advert(s)", adverts_.size());
    return Err::Ok;
}

void SimulatedLeScanner::stop()
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        stop_req_ = true;
    }
    cv_.notify_all();
    if (timer_.joinable() && timer_.get_id() != std::this_thread::get_id())
        timer_.join();
}

bool SimulatedLeScanner::scanning() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return scanning_;
}

}  // namespace discovery
