#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <mutex>
#include <thread>
#include <vector>

#include "discovery/device_catalog.hpp"
#include "discovery/device_discovery.hpp"
#include "discovery/simulated_sources.hpp"

using namespace std::chrono_literals;
using discovery::Advert;
using discovery::DeviceDiscovery;
using discovery::SimulatedBondedSource;
using discovery::SimulatedLeScanner;
using parkterm::Err;
using transport::Kind;

namespace
{

// Scanner that hands its callbacks to the test so sightings can arrive while scanning.
class ManualScanner final : public discovery::ILeScanner
{
  public:
    Err start(std::chrono::milliseconds, discovery::OnAdvert on_advert,
              discovery::OnDone on_done) override
    {
        ++starts;
        advert   = std::move(on_advert);
        done     = std::move(on_done);
        running_ = true;
        return Err::Ok;
    }
    void stop() override
    {
        ++stops;
        running_ = false;
    }
    bool scanning() const override { return running_; }

    void see(const Advert &a)
    {
        if (running_ && advert)
            advert(a);
    }
    void finish()
    {
        running_ = false;
        if (done)
            done();
    }

    int                 starts = 0;
    int                 stops  = 0;
    discovery::OnAdvert advert;
    discovery::OnDone   done;

  private:
    bool running_ = false;
};

}  // namespace

TEST(Catalog, DeduplicatesByAddressIgnoringCase)
{
    discovery::DeviceCatalog c;
    EXPECT_TRUE(c.add({"HM-10", "AA:BB:CC:DD:EE:FF", Kind::Ble, "p1"}));
    EXPECT_FALSE(c.add({"Other", "aa:bb:cc:dd:ee:ff", Kind::Classic, "p2"}));
    EXPECT_TRUE(c.add({"HM-10", "11:22:33:44:55:66", Kind::Ble, "p3"}));

    ASSERT_EQ(c.size(), 2u);
    auto d = c.find("aa:bb:cc:dd:ee:ff");
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->name, "HM-10");
    EXPECT_EQ(d->kind, Kind::Ble);
}

TEST(Discovery, MergesBothSourcesFirstSeenWins)
{
    SimulatedLeScanner le({{"AA:AA:AA:AA:AA:01", "BT05", "/le/1"},
                           {"AA:AA:AA:AA:AA:02", "HC-05-dup", "/le/2"}});
    SimulatedBondedSource bonded({{"aa:aa:aa:aa:aa:02", "HC-05", "/cl/2"},
                                  {"AA:AA:AA:AA:AA:03", "HC-06", "/cl/3"}});
    DeviceDiscovery       disc(le, bonded, 5s);

    ASSERT_EQ(disc.scan(), Err::Ok);
    auto devs = disc.devices();
    ASSERT_EQ(devs.size(), 3u);
    EXPECT_EQ(devs[0].address, "AA:AA:AA:AA:AA:01");
    EXPECT_EQ(devs[0].kind, Kind::Ble);
    EXPECT_EQ(devs[1].name, "HC-05-dup");  // LE reported it first
    EXPECT_EQ(devs[1].kind, Kind::Ble);
    EXPECT_EQ(devs[2].kind, Kind::Classic);
    EXPECT_EQ(devs[2].handle, "/cl/3");
    disc.stop_scan();
}

TEST(Discovery, SkipsEntriesWithoutName)
{
    SimulatedLeScanner    le({{"AA:AA:AA:AA:AA:01", "", "/le/1"}});
    SimulatedBondedSource bonded({{"AA:AA:AA:AA:AA:02", "", "/cl/2"}});
    DeviceDiscovery       disc(le, bonded, 5s);

    ASSERT_EQ(disc.scan(), Err::Ok);
    EXPECT_TRUE(disc.devices().empty());
    disc.stop_scan();
}

TEST(Discovery, ScanClearsCatalogAndPublishes)
{
    ManualScanner         le;
    SimulatedBondedSource bonded;
    DeviceDiscovery       disc(le, bonded, 5s);

    std::vector<std::size_t> sizes;
    disc.set_listener(
        [&](const std::vector<transport::DeviceDescriptor> &d) { sizes.push_back(d.size()); });

    ASSERT_EQ(disc.scan(), Err::Ok);
    le.see({"AA:AA:AA:AA:AA:01", "BT05", "/le/1"});
    le.see({"AA:AA:AA:AA:AA:01", "BT05", "/le/1"});  // repeated advert, no update
    le.see({"AA:AA:AA:AA:AA:02", "HM-10", "/le/2"});
    le.finish();
    EXPECT_FALSE(disc.scanning());

    ASSERT_EQ(disc.scan(), Err::Ok);
    EXPECT_TRUE(disc.devices().empty());

    const std::vector<std::size_t> want = {0, 1, 2, 0};
    EXPECT_EQ(sizes, want);
    disc.stop_scan();
}

TEST(Discovery, ScanWhileScanningIsNoOp)
{
    ManualScanner         le;
    SimulatedBondedSource bonded;
    DeviceDiscovery       disc(le, bonded, 5s);

    ASSERT_EQ(disc.scan(), Err::Ok);
    le.see({"AA:AA:AA:AA:AA:01", "BT05", "/le/1"});
    ASSERT_EQ(disc.scan(), Err::Ok);

    EXPECT_EQ(le.starts, 1);
    EXPECT_EQ(disc.devices().size(), 1u);
    disc.stop_scan();
}

TEST(Discovery, StopScanIsSafeWhenIdle)
{
    ManualScanner         le;
    SimulatedBondedSource bonded;
    DeviceDiscovery       disc(le, bonded, 5s);

    disc.stop_scan();
    disc.stop_scan();
    EXPECT_FALSE(disc.scanning());

    ASSERT_EQ(disc.scan(), Err::Ok);
    EXPECT_TRUE(disc.scanning());
    disc.stop_scan();
    EXPECT_FALSE(disc.scanning());
    EXPECT_FALSE(le.scanning());
}

TEST(Discovery, OneSourceFailingIsNotFatal)
{
    SimulatedLeScanner le;
    le.fail_start_with(Err::BusUnavailable);
    SimulatedBondedSource bonded({{"AA:AA:AA:AA:AA:03", "HC-06", "/cl/3"}});
    DeviceDiscovery       disc(le, bonded, 5s);

    EXPECT_EQ(disc.scan(), Err::Ok);
    EXPECT_FALSE(disc.scanning());
    EXPECT_EQ(disc.devices().size(), 1u);
}

TEST(Discovery, BothSourcesFailing)
{
    SimulatedLeScanner le;
    le.fail_start_with(Err::ScanFailed);
    SimulatedBondedSource bonded;
    bonded.set_unavailable(true);
    DeviceDiscovery disc(le, bonded, 5s);

    EXPECT_EQ(disc.scan(), Err::ScanFailed);
    EXPECT_FALSE(disc.scanning());
}

TEST(Discovery, TimeoutEndsScan)
{
    SimulatedLeScanner    le({{"AA:AA:AA:AA:AA:01", "BT05", "/le/1"}});
    SimulatedBondedSource bonded;
    DeviceDiscovery       disc(le, bonded, 30ms);

    ASSERT_EQ(disc.scan(), Err::Ok);
    for (int i = 0; i < 100 && disc.scanning(); ++i)
        std::this_thread::sleep_for(10ms);
    EXPECT_FALSE(disc.scanning());
    EXPECT_EQ(disc.devices().size(), 1u);

    // a new scan after the timeout starts over
    ASSERT_EQ(disc.scan(), Err::Ok);
    EXPECT_EQ(disc.devices().size(), 1u);
    disc.stop_scan();
}
