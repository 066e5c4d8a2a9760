#pragma once
#include <memory>
#include <string>

#include "discovery/sources.hpp"

namespace discovery
{

// LE discovery on a BlueZ adapter: SetDiscoveryFilter(le) + StartDiscovery, sightings from
// InterfacesAdded and RSSI/Name PropertiesChanged.
class BluezLeScanner final : public ILeScanner
{
  public:
    explicit BluezLeScanner(std::string adapter = "hci0");
    ~BluezLeScanner() override;

    parkterm::Err start(std::chrono::milliseconds timeout,
                        OnAdvert                  on_advert,
                        OnDone                    on_done) override;
    void          stop() override;
    bool          scanning() const override;

    const std::string &adapter() const { return adapter_; }

    // ---- entry points for the sd-bus signal handlers ----
    void note_device(const std::string &path, const std::string &address, const std::string &name);
    void note_seen(const std::string &path, const std::string *name);

  private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    std::string           adapter_;

    void teardown();
};

// Paired/Bonded Device1 objects from one GetManagedObjects call.
class BluezBondedSource final : public IBondedSource
{
  public:
    explicit BluezBondedSource(std::string adapter = "hci0") : adapter_(std::move(adapter)) {}

    std::optional<std::vector<Advert>> list_bonded() override;

  private:
    std::string adapter_;
};

}  // namespace discovery
