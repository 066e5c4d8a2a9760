#pragma once
#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>

#include "discovery/sources.hpp"

namespace discovery
{

// Scripted LE scanner for the loopback bench and tests: reports its adverts right after
// start() and signals completion when the timeout elapses.
class SimulatedLeScanner final : public ILeScanner
{
  public:
    explicit SimulatedLeScanner(std::vector<Advert> adverts = {}) : adverts_(std::move(adverts)) {}
    ~SimulatedLeScanner() override { stop(); }

    parkterm::Err start(std::chrono::milliseconds timeout,
                        OnAdvert                  on_advert,
                        OnDone                    on_done) override;
    void          stop() override;
    bool          scanning() const override;

    void fail_start_with(parkterm::Err e)
    {
        std::lock_guard<std::mutex> lk(mu_);
        start_result_ = e;
    }

  private:
    std::vector<Advert>     adverts_;
    mutable std::mutex      mu_;
    std::condition_variable cv_;
    std::thread             timer_;
    bool                    scanning_{false};
    bool                    stop_req_{false};
    parkterm::Err           start_result_{parkterm::Err::Ok};
};

// Fixed bonded list; nullopt when armed to fail.
class SimulatedBondedSource final : public IBondedSource
{
  public:
    explicit SimulatedBondedSource(std::vector<Advert> bonded = {}) : bonded_(std::move(bonded)) {}

    std::optional<std::vector<Advert>> list_bonded() override
    {
        if (unavailable_)
            return std::nullopt;
        return bonded_;
    }
    void set_unavailable(bool on) { unavailable_ = on; }

  private:
    std::vector<Advert> bonded_;
    bool                unavailable_{false};
};

}  // namespace discovery
