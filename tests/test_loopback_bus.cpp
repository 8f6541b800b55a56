// tests/test_loopback_bus.cpp
#include <chrono>
#include <gtest/gtest.h>
#include <string>
#include <thread>

#include "bus/loopback_bus.hpp"
#include "util/constants.hpp"

using namespace std::chrono_literals;

namespace
{

const std::string DEV(constants::DEVICE_IFACE);
const std::string BLUEZ(constants::BLUEZ_SERVICE);

bus::MatchRule device_rule()
{
    bus::MatchRule r;
    r.interface = std::string(constants::PROPERTIES_IFACE);
    r.member    = std::string(constants::PROPERTIES_CHANGED);
    r.arg0      = DEV;
    return r;
}

bus::MethodCall device_call(const std::string &path, const std::string &member)
{
    return bus::MethodCall{BLUEZ, path, DEV, member, {}};
}

}  // namespace

TEST(MatchRule, RendersBusSyntax)
{
    EXPECT_EQ(device_rule().to_string(),
              "type='signal',interface='org.freedesktop.DBus.Properties',"
              "member='PropertiesChanged',arg0='org.bluez.Device1'");

    bus::MatchRule any;
    any.interface = "org.freedesktop.DBus.Properties";
    EXPECT_EQ(any.to_string(), "type='signal',interface='org.freedesktop.DBus.Properties'");
}

TEST(MatchRule, Matches)
{
    auto r = device_rule();
    EXPECT_TRUE(r.matches("org.freedesktop.DBus.Properties", "PropertiesChanged", DEV));
    EXPECT_FALSE(r.matches("org.freedesktop.DBus.Properties", "PropertiesChanged",
                           "org.bluez.Adapter1"));
    EXPECT_FALSE(r.matches("org.freedesktop.DBus.ObjectManager", "InterfacesAdded", DEV));
}

TEST(LoopbackBus, ConnectEmitsOnlyToMatchingSubscribers)
{
    bus::LoopbackBus lb;
    lb.put_object("/dev1", {{DEV, {{"Connected", bus::Property{'b', false}}}}});

    // no match installed: nothing queued
    ASSERT_TRUE(lb.call_method(device_call("/dev1", "Connect")).ok());
    bus::PropertiesChanged sig;
    EXPECT_EQ(lb.wait_properties_changed(10ms, sig), bus::WaitStatus::Timeout);

    ASSERT_TRUE(lb.add_match(device_rule()).ok());
    ASSERT_TRUE(lb.call_method(device_call("/dev1", "Disconnect")).ok());
    ASSERT_EQ(lb.wait_properties_changed(100ms, sig), bus::WaitStatus::Signal);
    EXPECT_EQ(sig.path, "/dev1");
    EXPECT_EQ(sig.interface, DEV);
    EXPECT_FALSE(std::get<bool>(sig.changed.at("Connected").value));

    // no state change, no signal
    ASSERT_TRUE(lb.call_method(device_call("/dev1", "Disconnect")).ok());
    EXPECT_EQ(lb.wait_properties_changed(10ms, sig), bus::WaitStatus::Timeout);
}

TEST(LoopbackBus, SignalQueueDropsOldest)
{
    bus::LoopbackBus lb;
    ASSERT_TRUE(lb.add_match(device_rule()).ok());
    for (int i = 0; i < 15; ++i)
    {
        bus::PropertiesChanged s;
        s.path      = "/dev" + std::to_string(i);
        s.interface = DEV;
        lb.emit(s);
    }

    bus::PropertiesChanged sig;
    ASSERT_EQ(lb.wait_properties_changed(10ms, sig), bus::WaitStatus::Signal);
    EXPECT_EQ(sig.path, "/dev5");
    int n = 1;
    while (lb.wait_properties_changed(1ms, sig) == bus::WaitStatus::Signal)
        ++n;
    EXPECT_EQ(n, static_cast<int>(constants::SIGNAL_QUEUE_SIZE));
    EXPECT_EQ(sig.path, "/dev14");
}

TEST(LoopbackBus, ScriptedFailureIsOneShot)
{
    bus::LoopbackBus lb;
    lb.put_object("/dev1", {{DEV, {}}});
    lb.fail_next("Pair", bus::CallResult::error_reply("org.bluez.Error.AuthenticationFailed",
                                                      "Authentication Failed"));

    auto first = lb.call_method(device_call("/dev1", "Pair"));
    EXPECT_EQ(first.status, bus::CallStatus::ErrorReply);
    EXPECT_EQ(first.describe(), "Authentication Failed");

    EXPECT_TRUE(lb.call_method(device_call("/dev1", "Pair")).ok());
    EXPECT_EQ(lb.call_count("Pair"), 2u);

    bus::ManagedObjects objs;
    ASSERT_TRUE(lb.get_managed_objects(BLUEZ, objs).ok());
    ASSERT_EQ(objs.size(), 1u);
    EXPECT_TRUE(std::get<bool>(objs[0].interfaces.at(DEV).at("Paired").value));
}

TEST(LoopbackBus, UnreachableAndClosedAreTransportErrors)
{
    bus::LoopbackBus lb;
    lb.set_reachable(false);
    bus::ManagedObjects objs;
    EXPECT_EQ(lb.get_managed_objects(BLUEZ, objs).status, bus::CallStatus::TransportError);
    bus::PropertiesChanged sig;
    EXPECT_EQ(lb.wait_properties_changed(10ms, sig), bus::WaitStatus::Error);

    lb.set_reachable(true);
    EXPECT_TRUE(lb.get_managed_objects(BLUEZ, objs).ok());
    lb.close();
    lb.close();
    EXPECT_EQ(lb.call_method(device_call("/x", "Connect")).status,
              bus::CallStatus::TransportError);
}

TEST(LoopbackBus, CloseWakesWaiter)
{
    bus::LoopbackBus lb;
    ASSERT_TRUE(lb.add_match(device_rule()).ok());
    bus::WaitStatus st = bus::WaitStatus::Signal;
    std::thread     th([&] {
        bus::PropertiesChanged sig;
        st = lb.wait_properties_changed(5s, sig);
    });
    std::this_thread::sleep_for(20ms);
    auto t0 = std::chrono::steady_clock::now();
    lb.close();
    th.join();
    EXPECT_EQ(st, bus::WaitStatus::Error);
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 1s);
}

TEST(LoopbackBus, RemoveDevice)
{
    bus::LoopbackBus lb;
    lb.put_object("/dev1", {{DEV, {{"Connected", bus::Property{'b', true}}}}});
    ASSERT_TRUE(lb.add_match(device_rule()).ok());

    bus::MethodCall rm{BLUEZ, "/org/bluez/hci0", std::string(constants::ADAPTER_IFACE),
                       "RemoveDevice", {}};
    EXPECT_EQ(lb.call_method(rm).status, bus::CallStatus::ErrorReply);  // missing argument

    rm.path_args = {"/dev1"};
    ASSERT_TRUE(lb.call_method(rm).ok());
    bus::PropertiesChanged sig;
    ASSERT_EQ(lb.wait_properties_changed(100ms, sig), bus::WaitStatus::Signal);
    EXPECT_FALSE(std::get<bool>(sig.changed.at("Connected").value));

    auto again = lb.call_method(rm);
    EXPECT_EQ(again.status, bus::CallStatus::ErrorReply);
    EXPECT_EQ(again.error_name, "org.bluez.Error.DoesNotExist");
}
