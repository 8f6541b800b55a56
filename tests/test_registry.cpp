// tests/test_registry.cpp
#include <algorithm>
#include <gtest/gtest.h>
#include <string>

#include "bt/registry.hpp"
#include "util/constants.hpp"

namespace
{

const std::string DEV(constants::DEVICE_IFACE);

bus::ManagedObject device(const std::string &path,
                          const std::string &addr,
                          const std::string &name,
                          bool               connected,
                          bool               paired,
                          std::int16_t       rssi)
{
    bus::PropertyBag p;
    p["Address"] = bus::Property{'s', std::string(addr)};
    if (!name.empty())
        p["Name"] = bus::Property{'s', std::string(name)};
    p["Connected"] = bus::Property{'b', connected};
    p["Paired"]    = bus::Property{'b', paired};
    p["RSSI"]      = bus::Property{'n', rssi};
    return bus::ManagedObject{path, {{DEV, p}}};
}

std::vector<std::string> names(const bt::Snapshot &s)
{
    std::vector<std::string> out;
    for (const auto &d : s)
        out.push_back(d.name);
    return out;
}

}  // namespace

TEST(Registry, SortsConnectedPairedThenSignal)
{
    bus::ManagedObjects objs = {
        device("/d1", "00:00:00:00:00:01", "weak", false, false, -90),
        device("/d2", "00:00:00:00:00:02", "paired", false, true, -80),
        device("/d3", "00:00:00:00:00:03", "strong", false, false, -30),
        device("/d4", "00:00:00:00:00:04", "connected", true, true, -95),
    };
    auto snap = bt::build_snapshot(objs, bt::DuplicatePolicy::KeepAll);
    EXPECT_EQ(names(snap), (std::vector<std::string>{"connected", "paired", "strong", "weak"}));
}

TEST(Registry, TiesKeepEnumerationOrder)
{
    bus::ManagedObjects objs = {
        device("/a", "00:00:00:00:00:0A", "a", false, true, -60),
        device("/b", "00:00:00:00:00:0B", "b", false, true, -60),
        device("/c", "00:00:00:00:00:0C", "c", false, true, -60),
    };
    auto snap = bt::build_snapshot(objs, bt::DuplicatePolicy::KeepAll);
    EXPECT_EQ(names(snap), (std::vector<std::string>{"a", "b", "c"}));

    std::reverse(objs.begin(), objs.end());
    snap = bt::build_snapshot(objs, bt::DuplicatePolicy::KeepAll);
    EXPECT_EQ(names(snap), (std::vector<std::string>{"c", "b", "a"}));
}

TEST(Registry, DropsUnnamedAndNonDeviceObjects)
{
    bus::PropertyBag adapter;
    adapter["Address"] = bus::Property{'s', std::string("00:1A:7D:DA:71:13")};

    bus::ManagedObjects objs = {
        bus::ManagedObject{"/org/bluez/hci0", {{std::string(constants::ADAPTER_IFACE), adapter}}},
        device("/unnamed", "00:00:00:00:00:01", "", false, false, -40),
        device("/named", "00:00:00:00:00:02", "Speaker", false, false, -70),
        // name equal to the address counts as unnamed
        device("/addr", "00:00:00:00:00:03", "00:00:00:00:00:03", false, false, -20),
    };
    auto snap = bt::build_snapshot(objs, bt::DuplicatePolicy::KeepAll);
    ASSERT_EQ(snap.size(), 1u);
    EXPECT_EQ(snap[0].path, "/named");
}

TEST(Registry, BadBagIsSkippedRestProceeds)
{
    auto broken = device("/broken", "00:00:00:00:00:01", "Broken", true, true, -10);
    broken.interfaces[DEV]["Connected"] = bus::Property{'s', std::string("yes")};

    bus::ManagedObjects objs = {
        device("/ok1", "00:00:00:00:00:02", "One", false, false, -50),
        broken,
        device("/ok2", "00:00:00:00:00:03", "Two", false, false, -60),
    };
    std::size_t skipped = 0;
    auto        snap    = bt::build_snapshot(objs, bt::DuplicatePolicy::KeepAll, &skipped);
    EXPECT_EQ(skipped, 1u);
    EXPECT_EQ(names(snap), (std::vector<std::string>{"One", "Two"}));
}

TEST(Registry, DuplicatePolicy)
{
    // one device seen on two object paths (address case differs)
    bus::ManagedObjects objs = {
        device("/le", "aa:bb:cc:dd:ee:ff", "Buds", false, false, -80),
        device("/bredr", "AA:BB:CC:DD:EE:FF", "Buds", false, true, -70),
        device("/other", "11:22:33:44:55:66", "Mouse", false, false, -60),
    };

    auto all = bt::build_snapshot(objs, bt::DuplicatePolicy::KeepAll);
    EXPECT_EQ(all.size(), 3u);

    auto first = bt::build_snapshot(objs, bt::DuplicatePolicy::FirstByPriority);
    ASSERT_EQ(first.size(), 2u);
    EXPECT_EQ(first[0].path, "/bredr");  // paired beats unpaired
    EXPECT_EQ(first[1].path, "/other");
}

TEST(Registry, LookupByPathAndAddress)
{
    bt::DeviceRegistry reg;
    EXPECT_FALSE(reg.find_by_path("/x").has_value());

    reg.replace(bt::build_snapshot(
        {device("/org/bluez/hci0/dev_1", "00:00:00:00:00:01", "Pad", false, true, -40)},
        bt::DuplicatePolicy::KeepAll));
    ASSERT_EQ(reg.size(), 1u);

    auto by_path = reg.find_by_path("/org/bluez/hci0/dev_1");
    ASSERT_TRUE(by_path.has_value());
    EXPECT_EQ(by_path->name, "Pad");

    auto by_addr = reg.find_by_address("00:00:00:00:00:01");
    ASSERT_TRUE(by_addr.has_value());
    EXPECT_EQ(by_addr->path, "/org/bluez/hci0/dev_1");

    reg.replace({});
    EXPECT_EQ(reg.size(), 0u);
    EXPECT_FALSE(reg.find_by_address("00:00:00:00:00:01").has_value());
}
