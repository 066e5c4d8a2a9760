#pragma once
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "util/errors.hpp"

namespace discovery
{

// One device sighting from an enumeration source.
struct Advert
{
    std::string address;
    std::string name;    // may be empty
    std::string handle;  // BlueZ object path
};

using OnAdvert = std::function<void(const Advert &)>;
using OnDone   = std::function<void()>;

// Active LE radio scan. on_advert may fire from the scanner's own thread; on_done fires once
// when the timeout elapses (not after stop()).
struct ILeScanner
{
    virtual parkterm::Err start(std::chrono::milliseconds timeout,
                                OnAdvert                  on_advert,
                                OnDone                    on_done) = 0;
    // Safe when no scan is running.
    virtual void stop()           = 0;
    virtual bool scanning() const = 0;
    virtual ~ILeScanner()         = default;
};

// One-shot listing of devices already bonded at OS level (Classic).
struct IBondedSource
{
    virtual std::optional<std::vector<Advert>> list_bonded() = 0;
    virtual ~IBondedSource()                                 = default;
};

}  // namespace discovery
