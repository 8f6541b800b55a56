/* ======================================================================
 * btmgrd - Bluetooth manager daemon
 *
 *   control thread : ipc::start_server → on_line → command queue
 *   main thread    : every 100ms
 *                      ├─ apply queued commands (tracker / manager)
 *                      └─ mgr.process_callbacks()  (all callbacks run here)
 *
 *   ENV: BTMGR_LOG_LEVEL, BTMGR_BUS (bluez|loopback), BTMGR_CTL_SOCK,
 *        BTMGR_DEDUP (all|first)
 * ====================================================================== */

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "app/daemon_config.hpp"
#include "app/operation_tracker.hpp"
#include "bus/loopback_bus.hpp"
#include "bus/sdbus_client.hpp"
#include "ctl/ipc.hpp"
#include "manager/bluetooth_manager.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"
#include "util/mac.hpp"

namespace
{

std::mutex              g_cmd_mu;
std::deque<std::string> g_cmds;

// control thread: hand the line over to the main thread
void on_line(const std::string &line)
{
    std::lock_guard<std::mutex> lk(g_cmd_mu);
    g_cmds.push_back(line);
}

std::deque<std::string> take_commands()
{
    std::deque<std::string>     out;
    std::lock_guard<std::mutex> lk(g_cmd_mu);
    out.swap(g_cmds);
    return out;
}

struct Buses
{
    std::shared_ptr<bus::IBus> main;
    std::shared_ptr<bus::IBus> monitor;
};

bus::InterfaceMap demo_device(const std::string &addr,
                              const std::string &name,
                              std::uint32_t      cls,
                              bool               paired,
                              std::int16_t       rssi)
{
    bus::PropertyBag props;
    props["Address"]   = bus::Property{'s', std::string(addr)};
    props["Name"]      = bus::Property{'s', std::string(name)};
    props["Paired"]    = bus::Property{'b', paired};
    props["Connected"] = bus::Property{'b', false};
    props["Class"]     = bus::Property{'u', cls};
    props["RSSI"]      = bus::Property{'n', rssi};
    return {{std::string(constants::DEVICE_IFACE), props}};
}

// dev mode: an adapter with a handful of devices
void seed_loopback(bus::LoopbackBus &lb)
{
    bus::PropertyBag adapter;
    adapter["Address"] = bus::Property{'s', std::string("00:1A:7D:DA:71:13")};
    adapter["Powered"] = bus::Property{'b', true};
    lb.put_object("/org/bluez/hci0", {{std::string(constants::ADAPTER_IFACE), adapter}});

    lb.put_object("/org/bluez/hci0/dev_A0_5A_5C_11_22_33",
                  demo_device("A0:5A:5C:11:22:33", "DualSense Wireless Controller", 0x002508,
                              true, -48));
    lb.put_object("/org/bluez/hci0/dev_F4_7B_09_44_55_66",
                  demo_device("F4:7B:09:44:55:66", "Keychron K2", 0x002540, false, -61));
    lb.put_object("/org/bluez/hci0/dev_6C_5A_B0_77_88_99",
                  demo_device("6C:5A:B0:77:88:99", "Sony WH-1000XM4", 0x240404, false, -70));
    // unnamed: must not be listed
    lb.put_object("/org/bluez/hci0/dev_12_34_56_78_9A_BC",
                  demo_device("12:34:56:78:9A:BC", "", 0, false, -90));
}

Buses make_buses(app::BusKind kind)
{
    if (kind == app::BusKind::Loopback)
    {
        auto lb = std::make_shared<bus::LoopbackBus>();
        seed_loopback(*lb);
        return {lb, lb};
    }
    // separate connection for signals so waits never hold up commands
    return {bus::SdBusClient::open_system(), bus::SdBusClient::open_system()};
}

std::string flags_of(const bt::Device &d)
{
    std::string f;
    f += d.connected ? 'C' : '-';
    f += d.paired ? 'P' : '-';
    f += d.trusted ? 'T' : '-';
    return f;
}

// user-visible events go to the console at SYSTEM level
manager::Listeners console_listeners()
{
    manager::Listeners l;
    l.devices_updated = [](const bt::Snapshot &s) {
        LOG_SYSTEM("[DEVICES] %zu listed", s.size());
    };
    l.device_paired = [](const bt::Device &d) {
        LOG_SYSTEM("[PAIRED] %s (%s)", d.name.c_str(), d.address.c_str());
    };
    l.pair_failed = [](const std::string &msg) { LOG_SYSTEM("[PAIR FAILED] %s", msg.c_str()); };
    l.device_connected = [](const bt::Device &d) {
        LOG_SYSTEM("[CONNECTED] %s (%s)", d.name.c_str(), d.address.c_str());
    };
    l.device_disconnected = [](const bt::Device &d) {
        LOG_SYSTEM("[DISCONNECTED] %s (%s)", d.name.c_str(), d.address.c_str());
    };
    l.operation_failed = [](const bt::Device &d, manager::OperationKind k, const std::string &m) {
        LOG_SYSTEM("[OP FAILED] %s %s: %s", manager::operation_kind_name(k), d.name.c_str(),
                   m.c_str());
    };
    return l;
}

std::optional<bt::Device> find_device(const manager::BluetoothManager &mgr, const std::string &mac)
{
    for (const auto &d : mgr.devices())
    {
        if (mac::equal(d.address, mac))
            return d;
    }
    return std::nullopt;
}

bool parse_on_off(const std::string &arg, bool &on)
{
    if (arg == "on")
        on = true;
    else if (arg == "off")
        on = false;
    else
        return false;
    return true;
}

// returns true on QUIT
bool apply_command(const std::string         &line,
                   manager::BluetoothManager &mgr,
                   app::OperationTracker     &tracker)
{
    auto        sp   = line.find(' ');
    std::string verb = line.substr(0, sp);
    std::string arg  = sp == std::string::npos ? std::string{} : line.substr(sp + 1);

    if (verb == "QUIT")
    {
        LOG_INFO("Received QUIT command, exiting...");
        return true;
    }
    if (verb == "ACTIVE" || verb == "SCAN")
    {
        bool on = false;
        if (!parse_on_off(arg, on))
        {
            LOG_WARN("CMD: %s expects on|off, got '%s'", verb.c_str(), arg.c_str());
            return false;
        }
        // ACTIVE mirrors a settings screen being shown or hidden
        if (verb == "ACTIVE")
            mgr.set_active(on);
        if (on)
            mgr.start_scan();
        else
            mgr.stop_scan();
        LOG_INFO("CMD: %s %s", verb.c_str(), arg.c_str());
        return false;
    }
    if (verb == "LIST")
    {
        auto devices = mgr.devices();
        if (devices.empty())
        {
            LOG_SYSTEM("[LIST] no devices");
            return false;
        }
        for (const auto &d : devices)
        {
            std::string status = tracker.status_text(d);
            LOG_SYSTEM("[LIST] %s %s %-10s rssi=%d %s %s", d.address.c_str(), flags_of(d).c_str(),
                       bt::device_type_name(d.type), (int)d.rssi, d.name.c_str(), status.c_str());
        }
        return false;
    }
    if (verb == "STATUS")
    {
        const auto &t = tracker.target();
        LOG_SYSTEM("[STATUS] available=%d scanning=%d adapter=%s op=%s target=%s",
                   (int)mgr.is_available(), (int)mgr.is_scanning(),
                   mgr.adapter_path().empty() ? "(none)" : mgr.adapter_path().c_str(),
                   app::operation_state_name(tracker.state()),
                   t ? t->address.c_str() : "(none)");
        return false;
    }
    if (verb == "CONFIRM")
    {
        if (!tracker.confirm_forget())
            LOG_WARN("CMD: CONFIRM ignored (nothing to confirm)");
        return false;
    }
    if (verb == "CANCEL")
    {
        if (!tracker.cancel_forget())
            LOG_WARN("CMD: CANCEL ignored (nothing to cancel)");
        return false;
    }

    using Request = bool (app::OperationTracker::*)(const bt::Device &);
    Request req   = nullptr;
    if (verb == "SELECT")
        req = &app::OperationTracker::activate;
    else if (verb == "PAIR")
        req = &app::OperationTracker::request_pair;
    else if (verb == "CONNECT")
        req = &app::OperationTracker::request_connect;
    else if (verb == "DISCONNECT")
        req = &app::OperationTracker::request_disconnect;
    else if (verb == "FORGET")
        req = &app::OperationTracker::request_forget;
    if (!req)
    {
        LOG_WARN("CMD: unknown command '%s'", line.c_str());
        return false;
    }

    if (!mac::is_valid(arg))
    {
        LOG_WARN("CMD: %s invalid MAC address: %s", verb.c_str(), arg.c_str());
        return false;
    }
    auto dev = find_device(mgr, arg);
    if (!dev)
    {
        LOG_WARN("CMD: %s unknown device %s", verb.c_str(), arg.c_str());
        return false;
    }
    if (!(tracker.*req)(*dev))
    {
        LOG_WARN("CMD: %s %s rejected (state=%s)", verb.c_str(), dev->address.c_str(),
                 app::operation_state_name(tracker.state()));
        return false;
    }
    if (tracker.state() == app::OperationState::ShowForgetConfirm)
        LOG_SYSTEM("[FORGET] %s: send CONFIRM or CANCEL", dev->name.c_str());
    else
        LOG_INFO("CMD: %s %s", verb.c_str(), dev->address.c_str());
    return false;
}

}  // namespace

int main()
{
    if (const char *log_level = std::getenv("BTMGR_LOG_LEVEL"))
        btmgr::set_log_level_by_name(log_level);

    const app::DaemonConfig dcfg = app::daemon_config_from_env();
    LOG_SYSTEM("Config: bus=%s dedup=%s", app::bus_kind_name(dcfg.bus),
               app::duplicate_policy_name(dcfg.duplicates));

    manager::ManagerConfig cfg;
    cfg.duplicates = dcfg.duplicates;

    Buses                     buses = make_buses(dcfg.bus);
    manager::BluetoothManager mgr(buses.main, buses.monitor, console_listeners(), cfg);
    app::OperationTracker     tracker(mgr);
    mgr.add_listeners(tracker.listeners());

    std::string       sock = ipc::expand_user(constants::ctl_sock_path());
    std::atomic<bool> server_failed{false};
    std::thread       server([&] {
        if (!ipc::start_server(sock, &on_line))
        {
            LOG_ERROR("start_server failed");
            server_failed.store(true);
        }
    });

    bool quit = false;
    while (!quit && !server_failed.load())
    {
        for (const auto &line : take_commands())
        {
            if (apply_command(line, mgr, tracker))
            {
                quit = true;
                break;
            }
        }
        mgr.process_callbacks();
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    mgr.stop();
    server.join();
    return server_failed.load() ? 1 : 0;
}
